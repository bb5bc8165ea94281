#pragma once

// =============================================================================
// Simulation - one skirmish: registry, systems and the fixed per-tick order
// =============================================================================
//
// Tick order:
//   1. player intent -> Helm, AI decisions for autonomous vessels
//   2. kinematics (with world confinement)
//   3. weapons; fired shots are drained and spawned after the pass
//   4. projectile flight
//   5. hull contacts and ramming (two passes), then projectile hits
//   6. spent projectiles and fully sunk vessels are destroyed
//
// Usage:
//   Simulation sim{make_simulation_config(core::Config::instance().get())};
//   auto player = sim.spawn_player({0, 0}, 0.0f);
//   sim.spawn_autonomous(raider_preset(), {900, 0}, kPi);
//   TickReport report = sim.step(1.0f / 60.0f, intent);
//

#include "broadside/ai/helmsman.hpp"
#include "broadside/core/types.hpp"
#include "broadside/ecs/systems/ai_system.hpp"
#include "broadside/ecs/systems/collision2d_system.hpp"
#include "broadside/ecs/systems/kinematics_system.hpp"
#include "broadside/ecs/systems/projectile_system.hpp"
#include "broadside/ecs/systems/weapon_system.hpp"
#include "broadside/sim/vessel_factory.hpp"

#include <entt/entt.hpp>

#include <cstdint>
#include <random>
#include <vector>

namespace broadside::core {
struct BroadsideConfig;
}

namespace broadside::sim {

struct SimulationConfig {
    WorldBounds bounds{};
    float max_dt{0.033f};
    float boundary_bounce{0.4f};
    float projectile_cull_margin{500.0f};
    ecs::CollisionTuning collision{};
    ai::AiTuning ai{};
    std::uint32_t seed{1337};
};

SimulationConfig make_simulation_config(const core::BroadsideConfig& config);

struct TickReport {
    Tick tick{0};
    float dt{0.0f};
    std::vector<ecs::ProjectileHit> hits;
    std::vector<ecs::RamEvent> rams;
    std::size_t shots_fired{0};
    std::vector<entt::entity> removed_vessels;
};

class Simulation {
public:
    Simulation();
    explicit Simulation(const SimulationConfig& config);

    entt::registry& registry() { return registry_; }
    const entt::registry& registry() const { return registry_; }

    const SimulationConfig& config() const { return config_; }
    Tick tick() const { return tick_; }

    entt::entity spawn_player(Vector2 position, float heading);
    entt::entity spawn_autonomous(const VesselPreset& preset, Vector2 position, float heading);
    entt::entity spawn_elite(Vector2 position, float heading);

    /// Advance one tick. dt is clamped to [0, max_dt].
    TickReport step(float dt, const ControlIntent& player_intent);

    /// Null once the player vessel has sunk.
    entt::entity player() const { return player_; }

    std::size_t vessel_count() const;
    std::size_t autonomous_count() const;
    std::size_t projectile_count() const;

    /// Send an autonomous vessel to a point; damage or arrival cancels it.
    bool set_travel_destination(entt::entity vessel, Vector2 destination);

private:
    void spawn_fired(TickReport& report);
    void collect_sunk(TickReport& report);
    void destroy_dead();

    SimulationConfig config_{};
    entt::registry registry_;
    entt::entity player_{entt::null};
    Tick tick_{0};

    std::mt19937 rng_;

    ecs::AISystem ai_;
    ecs::KinematicsSystem kinematics_;
    ecs::WeaponSystem weapons_;
    ecs::ProjectileSystem projectiles_;
    ecs::Collision2DSystem collision_;
};

} // namespace broadside::sim
