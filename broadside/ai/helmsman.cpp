#include "broadside/ai/helmsman.hpp"

#include "broadside/math/vec2.hpp"

#include <algorithm>
#include <cmath>

namespace broadside::ai {

namespace {

constexpr float kMinPushLength = 1e-4f;
constexpr float kCoincidentDistance = 1e-3f;
constexpr float kMaxSeparationWeight = 4.0f;
constexpr float kEdgeSlowdown = 0.4f;
constexpr float kCrowdedFraction = 0.6f;

float separation_distance(const AiTuning& tuning, float length) {
    return std::max(tuning.min_separation, tuning.separation_mult * length);
}

float side_offset(Side side) {
    return side == Side::Starboard ? math::kHalfPi : -math::kHalfPi;
}

float edge_push(float gap, float margin) {
    if (margin <= 0.0f || gap >= margin) return 0.0f;
    return 1.0f - std::max(gap, 0.0f) / margin;
}

} // namespace

// ============================================================================
// Aggression
// ============================================================================

void Helmsman::notify_damage(AiAgent& agent, float amount) {
    if (!(amount > 0.0f) || !std::isfinite(amount)) return;
    agent.aggressive = true;
    agent.last_damage_time = agent.clock;
    agent.travel_destination.reset();
}

void Helmsman::set_travel_destination(AiAgent& agent, Vector2 destination) {
    if (!math::is_finite(destination)) return;
    agent.travel_destination = destination;
}

bool Helmsman::update_aggression(AiAgent& agent) {
    if (agent.force_aggressive) {
        agent.aggressive = true;
        return false;
    }
    if (agent.aggressive && agent.clock - agent.last_damage_time > agent.tuning.passive_timeout) {
        agent.aggressive = false;
        agent.wander_target.reset();
        agent.wander_timer = 0.0f;
        return true;
    }
    return false;
}

// ============================================================================
// Steering helpers
// ============================================================================

float Helmsman::broadside_heading(const AiAgent& agent, float bearing, float distance) {
    const AiTuning& t = agent.tuning;

    // Positive bias turns the bow toward the target.
    float bias = 0.0f;
    if (t.desired_distance > 0.0f) {
        const float error = (distance - t.desired_distance) / t.desired_distance;
        bias = std::clamp(error, -1.0f, 1.0f) * t.range_bias_max;
    }

    const float offset = side_offset(agent.preferred_side);
    const float toward = offset > 0.0f ? bias : -bias;
    return math::normalize_angle(bearing - offset + toward);
}

AvoidanceResult Helmsman::compute_avoidance(const AiAgent& agent, const VesselSnapshot& self,
                                            const std::vector<VesselSnapshot>& neighbors,
                                            const WorldBounds& bounds) {
    const AiTuning& t = agent.tuning;
    const float separation = separation_distance(t, self.length);

    AvoidanceResult result;

    for (const auto& other : neighbors) {
        if (other.id == self.id) continue;

        const Vector2 offset = math::sub(self.position, other.position);
        const float d = math::length(offset);
        result.nearest_neighbor = std::min(result.nearest_neighbor, d);

        if (d < separation) {
            const float weight = d > kCoincidentDistance
                ? std::min(kMaxSeparationWeight, separation / d - 1.0f)
                : kMaxSeparationWeight;
            const Vector2 away = d > kCoincidentDistance
                ? math::scale(offset, 1.0f / d)
                : math::from_angle(self.heading + math::kHalfPi);
            result.push = math::add_scaled(result.push, away, weight);
        }

        // Closest approach within the lookahead window.
        const Vector2 rel_pos = math::sub(other.position, self.position);
        const Vector2 rel_vel = math::sub(other.velocity, self.velocity);
        const float closing_sq = math::length_sq(rel_vel);
        if (closing_sq < 1e-6f) continue;

        const float t_star = -math::dot(rel_pos, rel_vel) / closing_sq;
        if (t_star <= 0.0f || t_star > t.collision_lookahead) continue;

        const Vector2 closest = math::add_scaled(rel_pos, rel_vel, t_star);
        const float miss = math::length(closest);
        if (miss >= separation) continue;

        const Vector2 away = miss > kCoincidentDistance
            ? math::scale(closest, -1.0f / miss)
            : math::normalize(Vector2{-rel_vel.y, rel_vel.x});
        result.push = math::add_scaled(result.push, away, 1.0f - miss / separation);
    }

    const float strength = t.edge_avoid_strength;
    const float left = edge_push(self.position.x - bounds.min_x, t.edge_margin);
    const float right = edge_push(bounds.max_x - self.position.x, t.edge_margin);
    const float top = edge_push(self.position.y - bounds.min_y, t.edge_margin);
    const float bottom = edge_push(bounds.max_y - self.position.y, t.edge_margin);

    result.push.x += (left - right) * strength;
    result.push.y += (top - bottom) * strength;
    result.edge_proximity = std::clamp(std::max({left, right, top, bottom}), 0.0f, 1.0f);

    return result;
}

// ============================================================================
// Wander
// ============================================================================

WorldBounds Helmsman::wander_area(const AiTuning& tuning, const WorldBounds& bounds) {
    float pad = std::max(tuning.wander_pad, 0.0f);
    const float extent = std::min(bounds.width(), bounds.height());
    if (2.0f * pad >= extent) {
        pad = 0.25f * std::max(extent, 0.0f);
    }
    return WorldBounds{bounds.min_x + pad, bounds.max_x - pad, bounds.min_y + pad, bounds.max_y - pad};
}

Vector2 Helmsman::pick_wander_point(const AiTuning& tuning, const WorldBounds& bounds) {
    const WorldBounds area = wander_area(tuning, bounds);

    // Half-open [lo', hi) with lo' just above lo keeps the point strictly inside.
    auto pick = [this](float lo, float hi) {
        if (!(hi > lo)) return lo;
        std::uniform_real_distribution<float> dist(std::nextafter(lo, hi), hi);
        return dist(rng_);
    };

    return Vector2{pick(area.min_x, area.max_x), pick(area.min_y, area.max_y)};
}

void Helmsman::update_wander(AiAgent& agent, const VesselSnapshot& self, float dt, const WorldBounds& bounds) {
    const AiTuning& t = agent.tuning;
    agent.wander_timer -= dt;

    const bool reached = agent.wander_target.has_value()
        && math::distance(self.position, *agent.wander_target) < t.wander_reach_radius;

    if (!agent.wander_target || reached || agent.wander_timer <= 0.0f) {
        agent.wander_target = pick_wander_point(t, bounds);
        const float lo = std::min(t.wander_time_min, t.wander_time_max);
        const float hi = std::max(t.wander_time_min, t.wander_time_max);
        std::uniform_real_distribution<float> timer(lo, hi);
        agent.wander_timer = hi > lo ? timer(rng_) : lo;
    }
}

// ============================================================================
// Decision
// ============================================================================

ControlIntent Helmsman::decide(AiAgent& agent, const VesselSnapshot& self, float dt,
                               const std::optional<VesselSnapshot>& target,
                               const std::vector<VesselSnapshot>& neighbors,
                               const WorldBounds& bounds) {
    const AiTuning& t = agent.tuning;
    ControlIntent intent;

    if (std::isfinite(dt) && dt > 0.0f) {
        agent.clock += dt;
    }
    update_aggression(agent);

    if (agent.travel_destination
        && math::distance(self.position, *agent.travel_destination) < t.travel_arrive_radius) {
        agent.travel_destination.reset();
    }

    float desired_heading = self.heading;
    float speed_fraction = t.wander_speed;
    float avoid_weight = t.passive_avoid_weight;

    float target_bearing = 0.0f;
    float target_distance = std::numeric_limits<float>::infinity();
    if (target) {
        const Vector2 to_target = math::sub(target->position, self.position);
        target_bearing = math::angle_of(to_target);
        target_distance = math::length(to_target);
    }

    if (agent.travel_destination) {
        desired_heading = math::angle_of(math::sub(*agent.travel_destination, self.position));
        speed_fraction = t.cruise_speed;
    } else if (agent.aggressive && target) {
        avoid_weight = t.aggressive_avoid_weight;
        if (target_distance <= t.fire_range) {
            desired_heading = broadside_heading(agent, target_bearing, target_distance);
            if (target_distance < 0.8f * t.desired_distance) {
                speed_fraction = t.engage_near_speed;
            } else if (target_distance > 1.2f * t.desired_distance) {
                speed_fraction = t.engage_far_speed;
            } else {
                speed_fraction = t.engage_hold_speed;
            }
        } else {
            desired_heading = target_bearing;
            speed_fraction = t.closing_speed;
        }
    } else {
        update_wander(agent, self, dt, bounds);
        desired_heading = math::angle_of(math::sub(*agent.wander_target, self.position));
        speed_fraction = t.wander_speed;
    }

    const AvoidanceResult avoidance = compute_avoidance(agent, self, neighbors, bounds);
    const float push = math::length(avoidance.push);
    if (push > kMinPushLength) {
        const float w = avoid_weight * std::min(1.0f, push);
        const float avoid_heading = math::angle_of(avoidance.push);
        desired_heading += math::angle_between(desired_heading, avoid_heading) * w;
    }

    const float heading_error = math::angle_between(self.heading, desired_heading);
    if (heading_error > t.heading_deadband) {
        intent.turn_right = true;
    } else if (heading_error < -t.heading_deadband) {
        intent.turn_left = true;
    }

    speed_fraction *= 1.0f - kEdgeSlowdown * avoidance.edge_proximity;
    const float separation = separation_distance(t, self.length);
    if (avoidance.nearest_neighbor < kCrowdedFraction * separation) {
        speed_fraction = std::min(speed_fraction, t.crowded_speed);
    }

    const float desired_speed = speed_fraction * self.max_speed;
    const float forward_speed = math::dot(self.velocity, math::from_angle(self.heading));
    const float tolerance = t.speed_tolerance * self.max_speed;
    if (forward_speed < desired_speed - tolerance) {
        intent.thrust_forward = true;
    } else if (forward_speed > desired_speed + tolerance) {
        intent.thrust_reverse = true;
    }

    if (agent.aggressive && target
        && target_distance <= t.fire_range
        && target_distance > t.min_fire_range) {
        const float beam = self.heading + side_offset(agent.preferred_side);
        if (std::fabs(math::angle_between(beam, target_bearing)) <= t.align_tolerance) {
            intent.fire = true;
        }
    }

    return intent;
}

} // namespace broadside::ai
