#pragma once

// =============================================================================
// Projectile System - ballistic flight, lifetime and range falloff
// =============================================================================
//
// Projectiles fly in straight lines (no drag) and die when they either exceed
// their lifetime or travel past their maximum range. Damage depends on the
// distance from the muzzle:
//
//   Standard: full to near_range, linear decay to 1/3 at far_range
//   Heavy:    flat to near_range, linear ramp to ceiling at far_range
//
// Usage:
//   ProjectileSystem projectiles;
//   projectiles.update(registry, dt);         // advance
//   ...                                       // hit testing
//   projectiles.mark_spent(registry, bounds); // tag dead ones for cleanup
//

#include "../system.hpp"
#include "../components/naval.hpp"

namespace broadside::ecs {

class ProjectileSystem : public System {
public:
    void set_cull_margin(float margin) { cull_margin_ = margin; }

    void update(entt::registry& registry, float dt) override;

    /// Tag projectiles that are no longer alive or drifted far outside the world.
    /// Returns how many were tagged.
    std::size_t mark_spent(entt::registry& registry, const WorldBounds& bounds) const;

    static DamageProfile standard_profile();
    static DamageProfile heavy_profile();

    static Projectile make_cannonball(Vector2 position, Vector2 velocity, entt::entity owner);
    static Projectile make_torpedo(Vector2 position, Vector2 velocity, entt::entity owner);

    static void advance(Projectile& projectile, float dt);

    static float distance_travelled(const Projectile& projectile);
    static float damage_at(const DamageProfile& profile, float distance);
    static float current_damage(const Projectile& projectile);
    static bool is_alive(const Projectile& projectile);

private:
    float cull_margin_{500.0f};
};

} // namespace broadside::ecs
