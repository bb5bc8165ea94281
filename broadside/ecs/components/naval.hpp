#pragma once

// =============================================================================
// Naval ECS Components - vessels, batteries and projectiles
// =============================================================================
//
// Contract: Composition over Inheritance
// - Components are plain structs (data plus trivial derived getters)
// - A vessel is an entity with VesselTag and the kinematic/combat components
// - Capabilities are optional components: PlayerTag, ai::AiAgent, TorpedoBay
//
// Example:
//   auto ship = registry.create();
//   registry.emplace<ecs::VesselTag>(ship);
//   registry.emplace<ecs::Transform2D>(ship, Vector2{0.f, 0.f}, 0.f);
//   registry.emplace<ecs::Hull>(ship, 95.f, 36.f);
//

#include "broadside/core/types.hpp"

#include <raylib.h>
#include <entt/entt.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace broadside::ecs {

// =============================================================================
// Kinematics
// =============================================================================

/// World position and heading
struct Transform2D {
    Vector2 position{0.0f, 0.0f};
    float rotation{0.0f};  // radians, 0 = +x
};

/// Linear and angular velocity
struct Velocity2D {
    Vector2 linear{0.0f, 0.0f};
    float angular{0.0f};   // radians per second
};

/// Propulsion and handling parameters
struct Movement2D {
    float max_speed{180.0f};       // px/s
    float thrust{50.0f};           // px/s^2
    float reverse_thrust{20.0f};   // px/s^2
    float turn_accel{1.0f};        // rad/s^2 at speed factor 1
    float rudder_rate{1.5f};       // rudder travel per second
    float linear_drag{0.4f};
    float angular_drag{2.0f};
};

/// Current orders and the smoothed rudder that follows them
struct Helm {
    ControlIntent intent{};
    float rudder{0.0f};  // -1 (port) .. +1 (starboard)
};

// =============================================================================
// Hull
// =============================================================================

inline constexpr float kMassPerArea = 0.01f;
inline constexpr float kMinMass = 1e-3f;

/// Hull dimensions; collision circle and mass derive from them
struct Hull {
    float length{120.0f};
    float width{44.0f};

    float collision_radius() const { return (length + width) * 0.25f; }
    float mass() const { return std::max(kMinMass, length * width * kMassPerArea); }
};

// =============================================================================
// Health & Sinking
// =============================================================================

struct Health {
    float current{100.0f};
    float max{100.0f};

    float fraction() const { return max > 0.0f ? std::clamp(current / max, 0.0f, 1.0f) : 0.0f; }
};

/// Sinking vessels coast without orders until the timer reaches duration
struct Sinking {
    bool active{false};
    float timer{0.0f};
    float duration{10.0f};  // seconds

    bool fully_sunk() const { return active && timer >= duration; }
};

// =============================================================================
// Weapons
// =============================================================================

struct WeaponMount {
    Vector2 offset{0.0f, 0.0f};  // local hull coords: x forward, y starboard
    Side side{Side::Starboard};
    float reload_time{2.2f};     // seconds
    float cooldown{0.0f};        // seconds remaining
};

/// One side's firing order
struct BroadsideGroup {
    std::vector<std::size_t> mounts;  // indices into WeaponBattery::mounts
    std::size_t cursor{0};
    float inter_shot_timer{0.0f};
};

struct WeaponBattery {
    std::vector<WeaponMount> mounts;
    BroadsideGroup port{};
    BroadsideGroup starboard{};
    float inter_shot_delay{0.08f};  // seconds between shots on one side
    float muzzle_speed{380.0f};
    float spread{0.04f};            // radians, full width

    BroadsideGroup& group(Side side) { return side == Side::Port ? port : starboard; }
    const BroadsideGroup& group(Side side) const { return side == Side::Port ? port : starboard; }
};

struct TorpedoTube {
    float cooldown{0.0f};
    float arming{0.0f};

    bool idle() const { return cooldown <= 0.0f && arming <= 0.0f; }
};

struct TorpedoBay {
    std::vector<TorpedoTube> tubes;
    float reload_time{15.0f};
    float arming_time{1.0f};
    float launch_speed{120.0f};
};

// =============================================================================
// Projectiles
// =============================================================================

struct DamageProfile {
    enum class Kind : std::uint8_t {
        Standard,  // cannonball: full, then decays to a third
        Heavy      // torpedo: flat, then ramps up to a ceiling
    };

    Kind kind{Kind::Standard};
    float base_damage{12.0f};
    float near_range{600.0f};
    float far_range{1200.0f};
    float max_range{1200.0f};
    float ceiling_damage{500.0f};  // Heavy only
};

struct Projectile {
    Vector2 position{0.0f, 0.0f};
    Vector2 velocity{0.0f, 0.0f};
    Vector2 origin{0.0f, 0.0f};
    entt::entity owner{entt::null};
    float age{0.0f};
    float max_lifetime{4.0f};
    float radius{3.0f};
    DamageProfile profile{};
};

// =============================================================================
// Tags & Markers
// =============================================================================

/// Every ship, player or autonomous
struct VesselTag {};

/// The player-controlled vessel
struct PlayerTag {};

/// Pending removal at end of tick
struct DeadTag {};

/// Preset the vessel was built from (for logs and reports)
struct VesselClass {
    const char* name{"vessel"};
};

} // namespace broadside::ecs
