#pragma once

// =============================================================================
// Kinematics System - vessel momentum, rudder and drag integration
// =============================================================================
//
// Applies the helm intent of every vessel: thrust along the heading, speed cap,
// rudder smoothing, speed-dependent turning, drag, explicit Euler integration.
// Sinking vessels keep coasting with their orders ignored.
// Keeps hulls inside the world rectangle. Does NOT fire weapons or resolve
// collisions - see WeaponSystem and Collision2DSystem.
//
// Usage:
//   KinematicsSystem kinematics;
//   kinematics.set_world_bounds(bounds);
//   kinematics.update(registry, dt);
//

#include "../system.hpp"
#include "../components/naval.hpp"

namespace broadside::ecs {

class KinematicsSystem : public System {
public:
    void set_world_bounds(const WorldBounds& bounds) { bounds_ = bounds; }
    void set_boundary_bounce(float bounce) { boundary_bounce_ = bounce; }

    void update(entt::registry& registry, float dt) override;

    /// 1.0 at full health, 0.5 at zero health.
    static float damage_factor(const Health& health);

    /// One explicit Euler step of a single hull.
    static void integrate_body(Transform2D& transform, Velocity2D& velocity, Helm& helm,
                               const Movement2D& movement, float damage_factor,
                               bool sinking, float dt);

    /// Clamp the hull centre inside the bounds, reflecting and damping the
    /// velocity component that pushed it out.
    static void confine_to_bounds(Transform2D& transform, Velocity2D& velocity,
                                  const Hull& hull, const WorldBounds& bounds, float bounce);

private:
    void recover_non_finite(entt::entity entity, Transform2D& transform, Velocity2D& velocity,
                            Vector2 previous_position) const;

    WorldBounds bounds_{};
    float boundary_bounce_{0.4f};
};

} // namespace broadside::ecs
