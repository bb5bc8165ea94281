#include "projectile_system.hpp"

#include "broadside/math/vec2.hpp"

#include <algorithm>
#include <cmath>

namespace broadside::ecs {

void ProjectileSystem::update(entt::registry& registry, float dt) {
    dt = std::max(0.0f, dt);

    auto view = registry.view<Projectile>(entt::exclude<DeadTag>);
    for (auto [entity, projectile] : view.each()) {
        advance(projectile, dt);
    }
}

std::size_t ProjectileSystem::mark_spent(entt::registry& registry, const WorldBounds& bounds) const {
    std::vector<entt::entity> spent;

    auto view = registry.view<const Projectile>(entt::exclude<DeadTag>);
    for (auto [entity, projectile] : view.each()) {
        const Vector2 p = projectile.position;
        const bool outside = p.x < bounds.min_x - cull_margin_ || p.x > bounds.max_x + cull_margin_ ||
                             p.y < bounds.min_y - cull_margin_ || p.y > bounds.max_y + cull_margin_;
        if (outside || !is_alive(projectile)) {
            spent.push_back(entity);
        }
    }

    for (auto entity : spent) {
        registry.emplace_or_replace<DeadTag>(entity);
    }
    return spent.size();
}

DamageProfile ProjectileSystem::standard_profile() {
    DamageProfile profile;
    profile.kind = DamageProfile::Kind::Standard;
    profile.base_damage = 12.0f;
    profile.near_range = 600.0f;
    profile.far_range = 1200.0f;
    profile.max_range = 1200.0f;
    profile.ceiling_damage = profile.base_damage;
    return profile;
}

DamageProfile ProjectileSystem::heavy_profile() {
    DamageProfile profile;
    profile.kind = DamageProfile::Kind::Heavy;
    profile.base_damage = 100.0f;
    profile.near_range = 1000.0f;
    profile.far_range = 2500.0f;
    profile.max_range = 2500.0f;
    profile.ceiling_damage = 500.0f;
    return profile;
}

Projectile ProjectileSystem::make_cannonball(Vector2 position, Vector2 velocity, entt::entity owner) {
    Projectile shot;
    shot.position = position;
    shot.origin = position;
    shot.velocity = velocity;
    shot.owner = owner;
    shot.max_lifetime = 4.0f;
    shot.radius = 3.0f;
    shot.profile = standard_profile();
    return shot;
}

Projectile ProjectileSystem::make_torpedo(Vector2 position, Vector2 velocity, entt::entity owner) {
    Projectile torpedo;
    torpedo.position = position;
    torpedo.origin = position;
    torpedo.velocity = velocity;
    torpedo.owner = owner;
    torpedo.max_lifetime = 25.0f;
    torpedo.radius = 6.0f;
    torpedo.profile = heavy_profile();
    return torpedo;
}

void ProjectileSystem::advance(Projectile& projectile, float dt) {
    dt = std::max(0.0f, dt);
    projectile.position = math::add_scaled(projectile.position, projectile.velocity, dt);
    projectile.age += dt;
}

float ProjectileSystem::distance_travelled(const Projectile& projectile) {
    return math::distance(projectile.position, projectile.origin);
}

float ProjectileSystem::damage_at(const DamageProfile& profile, float distance) {
    if (!std::isfinite(distance) || distance >= profile.max_range) return 0.0f;
    distance = std::max(0.0f, distance);

    const float span = std::max(1e-3f, profile.far_range - profile.near_range);

    switch (profile.kind) {
        case DamageProfile::Kind::Standard: {
            if (distance <= profile.near_range) return profile.base_damage;
            if (distance >= profile.far_range) return profile.base_damage / 3.0f;
            const float t = (distance - profile.near_range) / span;
            return profile.base_damage * (1.0f - (2.0f / 3.0f) * t);
        }
        case DamageProfile::Kind::Heavy: {
            if (distance <= profile.near_range) return profile.base_damage;
            if (distance >= profile.far_range) return profile.ceiling_damage;
            const float t = (distance - profile.near_range) / span;
            return std::floor(profile.base_damage + (profile.ceiling_damage - profile.base_damage) * t);
        }
    }
    return 0.0f;
}

float ProjectileSystem::current_damage(const Projectile& projectile) {
    if (!is_alive(projectile)) return 0.0f;
    return damage_at(projectile.profile, distance_travelled(projectile));
}

bool ProjectileSystem::is_alive(const Projectile& projectile) {
    if (!math::is_finite(projectile.position)) return false;
    return projectile.age < projectile.max_lifetime &&
           distance_travelled(projectile) < projectile.profile.max_range;
}

} // namespace broadside::ecs
