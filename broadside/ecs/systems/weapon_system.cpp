#include "weapon_system.hpp"
#include "projectile_system.hpp"

#include "broadside/math/vec2.hpp"

#include <algorithm>

namespace broadside::ecs {

namespace {

constexpr float kMountMarginFraction = 0.18f;
constexpr float kReloadBase = 2.2f;
constexpr float kReloadJitter = 1.4f;
constexpr float kTorpedoBowOffset = 0.55f;  // fraction of hull length

constexpr Side kSides[] = {Side::Port, Side::Starboard};

} // namespace

void WeaponSystem::update(entt::registry& registry, float dt) {
    dt = std::max(0.0f, dt);

    auto view = registry.view<const Transform2D, const Velocity2D, const Helm, WeaponBattery, const Sinking>();
    for (auto [entity, transform, velocity, helm, battery, sinking] : view.each()) {
        tick_cooldowns(battery, dt);

        if (sinking.active || !helm.intent.fire) continue;

        for (Side side : kSides) {
            if (auto index = try_fire_side(battery, side)) {
                fired_.push_back(make_shot(battery, battery.mounts[*index], transform, velocity, entity));
            }
        }
    }

    update_torpedo_bays(registry, dt);
}

std::vector<Projectile> WeaponSystem::drain_fired() {
    std::vector<Projectile> out;
    out.swap(fired_);
    return out;
}

WeaponBattery WeaponSystem::make_battery(const Hull& hull, int pairs, std::mt19937& rng) {
    WeaponBattery battery;
    pairs = std::max(0, pairs);

    const float margin = hull.length * kMountMarginFraction;
    const float usable = hull.length - margin * 2.0f;
    const float y = hull.width * 0.5f;

    std::uniform_real_distribution<float> reload_jitter(0.0f, kReloadJitter);
    std::uniform_real_distribution<float> port_skew(0.9f, 1.1f);

    for (int i = 0; i < pairs; ++i) {
        const float t = (static_cast<float>(i) + 0.5f) / static_cast<float>(pairs);
        const float x = -hull.length * 0.5f + margin + usable * t;
        const float reload = kReloadBase + reload_jitter(rng);

        battery.mounts.push_back(WeaponMount{Vector2{x, +y}, Side::Starboard, reload, 0.0f});
        battery.starboard.mounts.push_back(battery.mounts.size() - 1);

        battery.mounts.push_back(WeaponMount{Vector2{x, -y}, Side::Port, reload * port_skew(rng), 0.0f});
        battery.port.mounts.push_back(battery.mounts.size() - 1);
    }

    return battery;
}

void WeaponSystem::tick_cooldowns(WeaponBattery& battery, float dt) {
    for (auto& mount : battery.mounts) {
        mount.cooldown = std::max(0.0f, mount.cooldown - dt);
    }
    battery.port.inter_shot_timer = std::max(0.0f, battery.port.inter_shot_timer - dt);
    battery.starboard.inter_shot_timer = std::max(0.0f, battery.starboard.inter_shot_timer - dt);
}

std::optional<std::size_t> WeaponSystem::try_fire_side(WeaponBattery& battery, Side side) {
    BroadsideGroup& group = battery.group(side);
    if (group.mounts.empty() || group.inter_shot_timer > 0.0f) return std::nullopt;

    const std::size_t count = group.mounts.size();
    for (std::size_t i = 0; i < count; ++i) {
        const std::size_t index = group.mounts[(group.cursor + i) % count];
        WeaponMount& mount = battery.mounts[index];
        if (mount.cooldown > 0.0f) continue;

        mount.cooldown = mount.reload_time;
        group.cursor = (group.cursor + i + 1) % count;
        group.inter_shot_timer = battery.inter_shot_delay;
        return index;
    }

    return std::nullopt;
}

Vector2 WeaponSystem::outward_normal(float heading, Side side) {
    const Vector2 right = math::from_angle(heading + math::kHalfPi);
    return side == Side::Starboard ? right : math::negate(right);
}

TorpedoBay WeaponSystem::make_torpedo_bay(int tubes) {
    TorpedoBay bay;
    bay.tubes.resize(static_cast<std::size_t>(std::max(0, tubes)));
    return bay;
}

Projectile WeaponSystem::make_shot(const WeaponBattery& battery, const WeaponMount& mount,
                                   const Transform2D& transform, const Velocity2D& velocity,
                                   entt::entity owner) {
    std::uniform_real_distribution<float> jitter(-0.5f, 0.5f);

    const Vector2 dir = math::rotate(outward_normal(transform.rotation, mount.side), jitter(rng_) * battery.spread);
    const Vector2 muzzle = math::add(transform.position, math::rotate(mount.offset, transform.rotation));
    const Vector2 muzzle_velocity = math::add_scaled(velocity.linear, dir, battery.muzzle_speed);

    return ProjectileSystem::make_cannonball(muzzle, muzzle_velocity, owner);
}

void WeaponSystem::update_torpedo_bays(entt::registry& registry, float dt) {
    auto view = registry.view<const Transform2D, const Velocity2D, const Helm, const Hull, TorpedoBay, const Sinking>();
    for (auto [entity, transform, velocity, helm, hull, bay, sinking] : view.each()) {
        for (auto& tube : bay.tubes) {
            tube.cooldown = std::max(0.0f, tube.cooldown - dt);

            if (tube.arming <= 0.0f) continue;
            tube.arming -= dt;
            if (tube.arming > 0.0f) continue;

            tube.arming = 0.0f;
            if (sinking.active) continue;

            const Vector2 fwd = math::from_angle(transform.rotation);
            const Vector2 pos = math::add_scaled(transform.position, fwd, hull.length * kTorpedoBowOffset);
            const Vector2 vel = math::add_scaled(velocity.linear, fwd, bay.launch_speed);
            fired_.push_back(ProjectileSystem::make_torpedo(pos, vel, entity));
            tube.cooldown = bay.reload_time;
        }

        if (helm.intent.launch_torpedo && !sinking.active) {
            auto ready = std::find_if(bay.tubes.begin(), bay.tubes.end(),
                                      [](const TorpedoTube& t) { return t.idle(); });
            if (ready != bay.tubes.end()) {
                ready->arming = bay.arming_time;
            }
        }
    }
}

} // namespace broadside::ecs
