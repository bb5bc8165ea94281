#include "kinematics_system.hpp"

#include "broadside/math/vec2.hpp"

#include <raylib.h>

#include <algorithm>
#include <cmath>

namespace broadside::ecs {

void KinematicsSystem::update(entt::registry& registry, float dt) {
    dt = std::max(0.0f, dt);

    auto view = registry.view<VesselTag, Transform2D, Velocity2D, Helm,
                              const Movement2D, const Hull, const Health, Sinking>();
    for (auto [entity, transform, velocity, helm, movement, hull, health, sinking] : view.each()) {
        if (sinking.active) {
            sinking.timer = std::min(sinking.duration, sinking.timer + dt);
        }

        const Vector2 previous = transform.position;
        integrate_body(transform, velocity, helm, movement, damage_factor(health), sinking.active, dt);
        confine_to_bounds(transform, velocity, hull, bounds_, boundary_bounce_);

        if (!math::is_finite(transform.position) || !math::is_finite(velocity.linear) ||
            !std::isfinite(transform.rotation) || !std::isfinite(velocity.angular)) {
            recover_non_finite(entity, transform, velocity, previous);
        }
    }
}

float KinematicsSystem::damage_factor(const Health& health) {
    return 0.5f + 0.5f * health.fraction();
}

void KinematicsSystem::integrate_body(Transform2D& transform, Velocity2D& velocity, Helm& helm,
                                      const Movement2D& movement, float damage_factor,
                                      bool sinking, float dt) {
    dt = std::max(0.0f, dt);
    const ControlIntent intent = sinking ? ControlIntent{} : helm.intent;

    const Vector2 fwd = math::from_angle(transform.rotation);
    if (intent.thrust_forward) {
        velocity.linear = math::add_scaled(velocity.linear, fwd, movement.thrust * damage_factor * dt);
    }
    if (intent.thrust_reverse) {
        velocity.linear = math::add_scaled(velocity.linear, fwd, -movement.reverse_thrust * damage_factor * dt);
    }

    float speed = math::length(velocity.linear);
    if (speed > movement.max_speed) {
        velocity.linear = math::scale(velocity.linear, movement.max_speed / std::max(1e-6f, speed));
        speed = movement.max_speed;
    }

    // Rudder chases the commanded side at a fixed rate
    const float commanded = (intent.turn_left ? -1.0f : 0.0f) + (intent.turn_right ? 1.0f : 0.0f);
    const float step = movement.rudder_rate * dt;
    if (helm.rudder < commanded) {
        helm.rudder = std::min(commanded, helm.rudder + step);
    } else if (helm.rudder > commanded) {
        helm.rudder = std::max(commanded, helm.rudder - step);
    }

    // More way on, more turning authority
    const float speed_ratio = movement.max_speed > 0.0f ? std::min(1.0f, speed / movement.max_speed) : 0.0f;
    const float speed_factor = 0.4f + 1.2f * speed_ratio;
    velocity.angular += helm.rudder * movement.turn_accel * damage_factor * speed_factor * dt;

    velocity.linear = math::scale(velocity.linear, 1.0f / (1.0f + movement.linear_drag * dt));
    velocity.angular *= 1.0f / (1.0f + movement.angular_drag * dt);

    transform.position = math::add_scaled(transform.position, velocity.linear, dt);
    transform.rotation = math::normalize_angle(transform.rotation + velocity.angular * dt);
}

void KinematicsSystem::confine_to_bounds(Transform2D& transform, Velocity2D& velocity,
                                         const Hull& hull, const WorldBounds& bounds, float bounce) {
    const float margin_x = std::min(hull.length * 0.5f, bounds.width() * 0.5f);
    const float margin_y = std::min(hull.width * 0.5f, bounds.height() * 0.5f);

    const float min_x = bounds.min_x + margin_x;
    const float max_x = bounds.max_x - margin_x;
    const float min_y = bounds.min_y + margin_y;
    const float max_y = bounds.max_y - margin_y;

    if (transform.position.x < min_x) {
        transform.position.x = min_x;
        if (velocity.linear.x < 0.0f) velocity.linear.x *= -bounce;
    } else if (transform.position.x > max_x) {
        transform.position.x = max_x;
        if (velocity.linear.x > 0.0f) velocity.linear.x *= -bounce;
    }

    if (transform.position.y < min_y) {
        transform.position.y = min_y;
        if (velocity.linear.y < 0.0f) velocity.linear.y *= -bounce;
    } else if (transform.position.y > max_y) {
        transform.position.y = max_y;
        if (velocity.linear.y > 0.0f) velocity.linear.y *= -bounce;
    }
}

void KinematicsSystem::recover_non_finite(entt::entity entity, Transform2D& transform,
                                          Velocity2D& velocity, Vector2 previous_position) const {
    TraceLog(LOG_WARNING, "[kinematics] non-finite state on vessel %u, resetting",
             static_cast<unsigned>(entt::to_integral(entity)));

    if (math::is_finite(previous_position)) {
        transform.position = previous_position;
    } else {
        transform.position = Vector2{(bounds_.min_x + bounds_.max_x) * 0.5f,
                                     (bounds_.min_y + bounds_.max_y) * 0.5f};
    }
    if (!std::isfinite(transform.rotation)) transform.rotation = 0.0f;
    velocity.linear = Vector2{0.0f, 0.0f};
    velocity.angular = 0.0f;
}

} // namespace broadside::ecs
