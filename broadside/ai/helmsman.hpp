#pragma once

// =============================================================================
// Helmsman - steering and aggression state machine for autonomous vessels
// =============================================================================
//
// Blends every navigation goal into a single heading and speed request:
//
//   goal heading   broadside on the target, direct pursuit, wander point,
//                  or travel destination
//   avoidance      separation from close hulls, predicted close approaches,
//                  world edges
//
// The avoidance bearing is mixed into the goal heading with a weight that
// depends on the mood (combat keeps most of its goal, patrol yields more).
// The result is turned into helm flags with a dead-band and a speed band.
//
// States:
//   Passive    -> Aggressive   on any nonzero damage (also cancels travel)
//   Aggressive -> Passive      passive_timeout seconds after the last damage
//

#include "broadside/core/types.hpp"

#include <raylib.h>
#include <entt/entt.hpp>

#include <cstdint>
#include <limits>
#include <optional>
#include <random>
#include <vector>

namespace broadside::ai {

/// Tuning knobs; blend weights and speed fractions are the main surface.
struct AiTuning {
    float fire_range{520.0f};
    float desired_distance{320.0f};
    float min_fire_range{60.0f};
    float align_tolerance{0.2f};         // radians off the broadside bearing
    float range_bias_max{0.35f};         // radians toward/away to hold distance

    float passive_timeout{15.0f};        // seconds without damage

    float separation_mult{1.6f};         // separation ~ 1.6x hull length
    float min_separation{160.0f};
    float collision_lookahead{2.5f};     // seconds
    float edge_margin{1200.0f};
    float edge_avoid_strength{1.0f};
    float aggressive_avoid_weight{0.35f};
    float passive_avoid_weight{0.65f};

    float wander_pad{2000.0f};
    float wander_reach_radius{150.0f};
    float wander_time_min{6.0f};
    float wander_time_max{12.0f};

    float travel_arrive_radius{200.0f};

    float heading_deadband{0.1f};
    float speed_tolerance{0.08f};        // fraction of max speed

    float closing_speed{0.95f};          // fractions of max speed
    float engage_near_speed{0.3f};
    float engage_hold_speed{0.5f};
    float engage_far_speed{0.75f};
    float wander_speed{0.45f};
    float cruise_speed{0.85f};
    float crowded_speed{0.2f};
};

/// Controller state carried by autonomous vessels (ECS component).
struct AiAgent {
    entt::entity target{entt::null};
    Side preferred_side{Side::Starboard};

    bool aggressive{false};
    bool force_aggressive{false};   // elites never calm down

    float clock{0.0f};              // seconds this agent has been deciding
    float last_damage_time{-std::numeric_limits<float>::infinity()};

    std::optional<Vector2> wander_target{};
    float wander_timer{0.0f};

    std::optional<Vector2> travel_destination{};

    AiTuning tuning{};
};

/// What the helmsman knows about a hull, its own or another.
struct VesselSnapshot {
    entt::entity id{entt::null};
    Vector2 position{0.0f, 0.0f};
    Vector2 velocity{0.0f, 0.0f};
    float heading{0.0f};
    float length{0.0f};
    float max_speed{0.0f};
};

/// Avoidance summary for one decision.
struct AvoidanceResult {
    Vector2 push{0.0f, 0.0f};
    float nearest_neighbor{std::numeric_limits<float>::infinity()};
    float edge_proximity{0.0f};  // 0 far from every edge, 1 on the edge
};

class Helmsman {
public:
    Helmsman() = default;
    explicit Helmsman(std::uint32_t seed) : rng_(seed) {}

    /// One decision. `target` is empty when there is nothing alive to fight.
    ControlIntent decide(AiAgent& agent, const VesselSnapshot& self, float dt,
                         const std::optional<VesselSnapshot>& target,
                         const std::vector<VesselSnapshot>& neighbors,
                         const WorldBounds& bounds);

    /// Record damage; turns the agent aggressive and cancels travel.
    static void notify_damage(AiAgent& agent, float amount);

    static void set_travel_destination(AiAgent& agent, Vector2 destination);

    /// Apply the passive timeout. Returns true if the agent calmed down.
    static bool update_aggression(AiAgent& agent);

    static AvoidanceResult compute_avoidance(const AiAgent& agent, const VesselSnapshot& self,
                                             const std::vector<VesselSnapshot>& neighbors,
                                             const WorldBounds& bounds);

    /// Heading that puts the target on the preferred beam, nudged to hold distance.
    static float broadside_heading(const AiAgent& agent, float bearing, float distance);

    /// Wander box: bounds shrunk by the pad (pad reduced when the world is small).
    static WorldBounds wander_area(const AiTuning& tuning, const WorldBounds& bounds);

private:
    void update_wander(AiAgent& agent, const VesselSnapshot& self, float dt, const WorldBounds& bounds);
    Vector2 pick_wander_point(const AiTuning& tuning, const WorldBounds& bounds);

    std::mt19937 rng_{std::random_device{}()};
};

} // namespace broadside::ai
