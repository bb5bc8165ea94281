#include "simulation.hpp"

#include "broadside/core/config.hpp"
#include "broadside/core/logger.hpp"
#include "broadside/math/vec2.hpp"

#include <raylib.h>

#include <algorithm>
#include <cmath>
#include <iterator>

namespace broadside::sim {

namespace {

// Independent streams so adding a vessel does not shift the AI's dice.
constexpr std::uint32_t kFactoryStream = 0u;
constexpr std::uint32_t kAiStream = 1u;
constexpr std::uint32_t kWeaponStream = 2u;

std::uint32_t stream_seed(std::uint32_t seed, std::uint32_t stream) {
    std::seed_seq seq{seed, stream};
    std::uint32_t out = 0;
    seq.generate(&out, &out + 1);
    return out;
}

} // namespace

SimulationConfig make_simulation_config(const core::BroadsideConfig& config) {
    SimulationConfig out;
    out.bounds = config.world.bounds;
    out.max_dt = config.world.max_dt;
    out.boundary_bounce = config.world.boundary_bounce;
    out.projectile_cull_margin = config.world.projectile_cull_margin;

    out.collision.restitution = config.collision.restitution;
    out.collision.friction = config.collision.friction;
    out.collision.ram_cooldown = config.collision.ram_cooldown;
    out.collision.debug = config.logging.collision_debug;

    out.ai.passive_timeout = config.ai.passive_timeout;
    out.ai.fire_range = config.ai.fire_range;
    out.ai.desired_distance = config.ai.desired_distance;
    out.ai.edge_margin = config.ai.edge_margin;
    out.ai.wander_pad = config.ai.wander_pad;

    out.seed = config.sim.seed;
    return out;
}

Simulation::Simulation() : Simulation(SimulationConfig{}) {}

Simulation::Simulation(const SimulationConfig& config)
    : config_(config)
    , rng_(stream_seed(config.seed, kFactoryStream))
    , ai_(stream_seed(config.seed, kAiStream))
    , weapons_(stream_seed(config.seed, kWeaponStream))
    , collision_(config.collision) {
    ai_.set_world_bounds(config_.bounds);
    kinematics_.set_world_bounds(config_.bounds);
    kinematics_.set_boundary_bounce(config_.boundary_bounce);
    projectiles_.set_cull_margin(config_.projectile_cull_margin);
}

entt::entity Simulation::spawn_player(Vector2 position, float heading) {
    player_ = sim::spawn_player(registry_, position, heading, rng_);
    return player_;
}

entt::entity Simulation::spawn_autonomous(const VesselPreset& preset, Vector2 position, float heading) {
    return sim::spawn_autonomous(registry_, preset, position, heading, player_, rng_, config_.ai);
}

entt::entity Simulation::spawn_elite(Vector2 position, float heading) {
    return sim::spawn_elite(registry_, position, heading, player_, rng_, config_.ai);
}

bool Simulation::set_travel_destination(entt::entity vessel, Vector2 destination) {
    if (!registry_.valid(vessel)) return false;
    auto* agent = registry_.try_get<ai::AiAgent>(vessel);
    if (!agent || !math::is_finite(destination)) return false;
    ai::Helmsman::set_travel_destination(*agent, destination);
    return true;
}

std::size_t Simulation::vessel_count() const {
    return registry_.view<const ecs::VesselTag>().size();
}

std::size_t Simulation::autonomous_count() const {
    auto view = registry_.view<const ecs::VesselTag, const ai::AiAgent>();
    return static_cast<std::size_t>(std::distance(view.begin(), view.end()));
}

std::size_t Simulation::projectile_count() const {
    return registry_.view<const ecs::Projectile>().size();
}

TickReport Simulation::step(float dt, const ControlIntent& player_intent) {
    if (!std::isfinite(dt)) dt = 0.0f;
    dt = std::clamp(dt, 0.0f, config_.max_dt);

    ++tick_;
    core::Logger::instance().set_tick(tick_);

    TickReport report;
    report.tick = tick_;
    report.dt = dt;

    if (player_ != entt::null && registry_.valid(player_)) {
        if (auto* helm = registry_.try_get<ecs::Helm>(player_)) {
            helm->intent = player_intent;
        }
    }

    ai_.update(registry_, dt);
    kinematics_.update(registry_, dt);

    weapons_.update(registry_, dt);
    spawn_fired(report);

    projectiles_.update(registry_, dt);

    collision_.update(registry_, dt);
    report.hits = collision_.hits();
    report.rams = collision_.ram_events();

    for (const auto& hit : report.hits) {
        if (hit.lethal) {
            TraceLog(LOG_INFO, "[sim] vessel %u sunk by %u",
                     static_cast<unsigned>(entt::to_integral(hit.hull)),
                     static_cast<unsigned>(entt::to_integral(hit.owner)));
        }
    }

    projectiles_.mark_spent(registry_, config_.bounds);
    collect_sunk(report);
    destroy_dead();

    return report;
}

void Simulation::spawn_fired(TickReport& report) {
    auto fired = weapons_.drain_fired();
    report.shots_fired = fired.size();
    for (auto& shot : fired) {
        auto entity = registry_.create();
        registry_.emplace<ecs::Projectile>(entity, shot);
    }
}

void Simulation::collect_sunk(TickReport& report) {
    auto view = registry_.view<const ecs::VesselTag, const ecs::Sinking>(entt::exclude<ecs::DeadTag>);
    for (auto [entity, sinking] : view.each()) {
        if (sinking.fully_sunk()) report.removed_vessels.push_back(entity);
    }

    for (auto entity : report.removed_vessels) {
        registry_.emplace<ecs::DeadTag>(entity);
        if (entity == player_) {
            TraceLog(LOG_INFO, "[sim] player vessel lost");
            player_ = entt::null;
        }
    }
}

void Simulation::destroy_dead() {
    auto view = registry_.view<const ecs::DeadTag>();
    std::vector<entt::entity> dead(view.begin(), view.end());
    registry_.destroy(dead.begin(), dead.end());
}

} // namespace broadside::sim
