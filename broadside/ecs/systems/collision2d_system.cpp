#include "collision2d_system.hpp"

#include "projectile_system.hpp"
#include "broadside/math/vec2.hpp"
#include "broadside/sim/combat.hpp"
#include "broadside/sim/hull_geometry.hpp"

#include <raylib.h>

#include <algorithm>
#include <cmath>

namespace broadside::ecs {

namespace {

constexpr float kCoincidentDistance = 1e-4f;
constexpr float kCoincidentNudge = 1.0f;  // px, split between the two hulls

std::uint32_t id_of(entt::entity entity) {
    return static_cast<std::uint32_t>(entt::to_integral(entity));
}

bool afloat(const entt::registry& registry, entt::entity entity) {
    if (!registry.valid(entity) || registry.all_of<DeadTag>(entity)) return false;
    const auto* sinking = registry.try_get<Sinking>(entity);
    return !sinking || !sinking->fully_sunk();
}

} // namespace

std::uint64_t Collision2DSystem::pair_key(entt::entity a, entt::entity b) {
    std::uint64_t lo = id_of(a);
    std::uint64_t hi = id_of(b);
    if (lo > hi) std::swap(lo, hi);
    return (hi << 32) | lo;
}

std::pair<float, float> Collision2DSystem::ram_damage(const CollisionTuning& tuning, bool first_bow,
                                                      bool second_bow, float relative_speed) {
    relative_speed = std::max(0.0f, relative_speed);
    if (first_bow != second_bow) {
        const float struck = std::max(tuning.min_ram_damage, tuning.ram_share * relative_speed);
        const float rammer = struck / 3.0f;
        return first_bow ? std::make_pair(rammer, struck) : std::make_pair(struck, rammer);
    }
    const float each = tuning.glancing_share * relative_speed;
    return {each, each};
}

float Collision2DSystem::ram_cooldown_remaining(entt::entity a, entt::entity b) const {
    auto it = ram_cooldowns_.find(pair_key(a, b));
    return it == ram_cooldowns_.end() ? 0.0f : std::max(0.0f, it->second);
}

void Collision2DSystem::decay_cooldowns(float dt) {
    for (auto it = ram_cooldowns_.begin(); it != ram_cooldowns_.end();) {
        it->second -= dt;
        if (it->second <= 0.0f) {
            it = ram_cooldowns_.erase(it);
        } else {
            ++it;
        }
    }
}

void Collision2DSystem::collect_hulls(const entt::registry& registry) {
    hulls_.clear();
    auto view = registry.view<VesselTag, const Transform2D, const Velocity2D,
                              const Hull, const Sinking>(entt::exclude<DeadTag>);
    for (auto [entity, transform, velocity, hull, sinking] : view.each()) {
        if (!sinking.fully_sunk()) hulls_.push_back(entity);
    }
    std::sort(hulls_.begin(), hulls_.end(),
              [](entt::entity a, entt::entity b) { return id_of(a) < id_of(b); });
}

void Collision2DSystem::update(entt::registry& registry, float dt) {
    dt = std::max(0.0f, dt);
    hits_.clear();
    rams_.clear();

    decay_cooldowns(dt);
    collect_hulls(registry);

    for (int pass = 0; pass < tuning_.iterations; ++pass) {
        for (std::size_t i = 0; i < hulls_.size(); ++i) {
            for (std::size_t j = i + 1; j < hulls_.size(); ++j) {
                resolve_pair(registry, hulls_[i], hulls_[j]);
            }
        }
    }

    resolve_projectiles(registry);
}

bool Collision2DSystem::resolve_pair(entt::registry& registry, entt::entity first, entt::entity second) {
    if (first == second || !afloat(registry, first) || !afloat(registry, second)) return false;

    // Lower id is always body A
    entt::entity ea = first;
    entt::entity eb = second;
    if (id_of(eb) < id_of(ea)) std::swap(ea, eb);

    auto* ta = registry.try_get<Transform2D>(ea);
    auto* tb = registry.try_get<Transform2D>(eb);
    auto* va = registry.try_get<Velocity2D>(ea);
    auto* vb = registry.try_get<Velocity2D>(eb);
    const auto* ha = registry.try_get<Hull>(ea);
    const auto* hb = registry.try_get<Hull>(eb);
    if (!ta || !tb || !va || !vb || !ha || !hb) return false;

    const float radius_sum = ha->collision_radius() + hb->collision_radius();
    Vector2 delta = math::sub(tb->position, ta->position);
    float dist = math::length(delta);
    if (dist >= radius_sum) return false;

    if (dist < kCoincidentDistance) {
        ta->position.x -= 0.5f * kCoincidentNudge;
        tb->position.x += 0.5f * kCoincidentNudge;
        delta = math::sub(tb->position, ta->position);
        dist = math::length(delta);
    }
    const Vector2 normal = dist > kCoincidentDistance ? math::scale(delta, 1.0f / dist) : Vector2{1.0f, 0.0f};

    const float mass_a = ha->mass();
    const float mass_b = hb->mass();
    const float total = mass_a + mass_b;

    // Positional correction, heavier hull moves less
    const float penetration = std::max(0.0f, radius_sum - dist);
    ta->position = math::add_scaled(ta->position, normal, -penetration * (mass_b / total) * 0.5f);
    tb->position = math::add_scaled(tb->position, normal, penetration * (mass_a / total) * 0.5f);

    const Vector2 relative = math::sub(vb->linear, va->linear);
    const float closing = math::dot(relative, normal);
    if (closing >= 0.0f) return true;

    const float relative_speed = math::length(relative);
    const float inv_a = 1.0f / mass_a;
    const float inv_b = 1.0f / mass_b;

    const float jn = -(1.0f + tuning_.restitution) * closing / (inv_a + inv_b);
    va->linear = math::add_scaled(va->linear, normal, -jn * inv_a);
    vb->linear = math::add_scaled(vb->linear, normal, jn * inv_b);

    const Vector2 tangent_vel = math::add_scaled(relative, normal, -closing);
    const float slip = math::length(tangent_vel);
    if (slip > kCoincidentDistance) {
        const Vector2 tangent = math::scale(tangent_vel, 1.0f / slip);
        const float jt = std::min(slip / (inv_a + inv_b), tuning_.friction * jn);
        va->linear = math::add_scaled(va->linear, tangent, jt * inv_a);
        vb->linear = math::add_scaled(vb->linear, tangent, -jt * inv_b);

        // Opposite spin on the two hulls
        const float signed_slip = math::cross(normal, tangent_vel);
        va->angular -= tuning_.angular_kick * signed_slip;
        vb->angular += tuning_.angular_kick * signed_slip;
    }

    const std::uint64_t key = pair_key(ea, eb);
    if (ram_cooldowns_.count(key) != 0) return true;

    const bool bow_a = math::dot(math::from_angle(ta->rotation), normal) > tuning_.bow_threshold;
    const bool bow_b = math::dot(math::from_angle(tb->rotation), math::negate(normal)) > tuning_.bow_threshold;
    const auto [damage_a, damage_b] = ram_damage(tuning_, bow_a, bow_b, relative_speed);

    sim::apply_damage(registry, ea, damage_a);
    sim::apply_damage(registry, eb, damage_b);
    ram_cooldowns_[key] = tuning_.ram_cooldown;
    rams_.push_back(RamEvent{ea, eb, damage_a, damage_b, relative_speed});

    if (tuning_.debug) {
        TraceLog(LOG_DEBUG, "[collision] ram %u<->%u speed=%.1f damage=%.1f/%.1f",
                 id_of(ea), id_of(eb), relative_speed, damage_a, damage_b);
    }
    return true;
}

void Collision2DSystem::resolve_projectiles(entt::registry& registry) {
    collect_hulls(registry);

    std::vector<entt::entity> spent;

    auto projectiles = registry.view<Projectile>(entt::exclude<DeadTag>);
    for (auto [entity, shot] : projectiles.each()) {
        if (!math::is_finite(shot.position)) {
            spent.push_back(entity);
            continue;
        }
        if (!ProjectileSystem::is_alive(shot)) continue;

        for (entt::entity hull_entity : hulls_) {
            if (hull_entity == shot.owner || !afloat(registry, hull_entity)) continue;

            const auto& transform = registry.get<Transform2D>(hull_entity);
            const auto& hull = registry.get<Hull>(hull_entity);

            const float reach = 0.5f * std::hypot(hull.length, hull.width) + shot.radius;
            if (math::length_sq(math::sub(transform.position, shot.position)) > reach * reach) continue;

            const auto polygon = sim::world_hull_polygon(hull, transform);
            if (!sim::polygon_hits_circle(polygon, shot.position, shot.radius)) continue;

            auto& sinking = registry.get<Sinking>(hull_entity);
            const bool was_sinking = sinking.active;
            const float damage = ProjectileSystem::current_damage(shot);
            const auto outcome = sim::apply_damage(registry, hull_entity, damage);
            if (was_sinking) {
                sinking.timer = std::min(sinking.duration, sinking.timer + 1.0f);
            }

            hits_.push_back(ProjectileHit{shot.owner, hull_entity, damage, outcome.lethal,
                                          shot.profile.kind, shot.position});
            spent.push_back(entity);
            break;
        }
    }

    for (entt::entity entity : spent) {
        registry.emplace_or_replace<DeadTag>(entity);
    }
}

} // namespace broadside::ecs
