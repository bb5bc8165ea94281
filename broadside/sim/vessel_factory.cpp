#include "vessel_factory.hpp"

#include "broadside/ecs/systems/weapon_system.hpp"
#include "broadside/math/vec2.hpp"

#include <raylib.h>

namespace broadside::sim {

namespace {

ecs::Movement2D make_movement(float max_speed, float thrust, float reverse,
                              float turn, float rudder) {
    ecs::Movement2D m;
    m.max_speed = max_speed;
    m.thrust = thrust;
    m.reverse_thrust = reverse;
    m.turn_accel = turn;
    m.rudder_rate = rudder;
    m.linear_drag = 0.4f;
    m.angular_drag = 2.0f;
    return m;
}

} // namespace

VesselPreset player_preset() {
    return VesselPreset{"player", 140.0f, 48.0f, 4, 100.0f, make_movement(200.0f, 60.0f, 30.0f, 1.5f, 2.0f)};
}

VesselPreset raider_preset() {
    return VesselPreset{"raider", 95.0f, 36.0f, 3, 80.0f, make_movement(170.0f, 48.0f, 18.0f, 1.0f, 1.5f)};
}

VesselPreset capital_preset() {
    return VesselPreset{"capital", 200.0f, 55.0f, 14, 300.0f, make_movement(120.0f, 34.0f, 14.0f, 0.7f, 1.0f)};
}

ai::AiTuning elite_tuning(ai::AiTuning base) {
    base.fire_range = 600.0f;
    base.desired_distance = 320.0f;
    base.edge_avoid_strength = 1.5f;
    return base;
}

entt::entity spawn_vessel(entt::registry& registry, const VesselPreset& preset,
                          Vector2 position, float heading, std::mt19937& rng) {
    auto entity = registry.create();

    registry.emplace<ecs::VesselTag>(entity);
    registry.emplace<ecs::VesselClass>(entity, preset.name);

    // Motion
    registry.emplace<ecs::Transform2D>(entity, position, math::normalize_angle(heading));
    registry.emplace<ecs::Velocity2D>(entity);
    registry.emplace<ecs::Movement2D>(entity, preset.movement);
    registry.emplace<ecs::Helm>(entity);

    // Hull & damage
    const auto& hull = registry.emplace<ecs::Hull>(entity, preset.length, preset.width);
    registry.emplace<ecs::Health>(entity, preset.health, preset.health);
    registry.emplace<ecs::Sinking>(entity);

    // Guns
    registry.emplace<ecs::WeaponBattery>(entity, ecs::WeaponSystem::make_battery(hull, preset.gun_pairs, rng));

    TraceLog(LOG_DEBUG, "[factory] %s %u at (%.0f, %.0f)", preset.name,
             static_cast<unsigned>(entt::to_integral(entity)), position.x, position.y);
    return entity;
}

entt::entity spawn_player(entt::registry& registry, Vector2 position, float heading,
                          std::mt19937& rng) {
    auto entity = spawn_vessel(registry, player_preset(), position, heading, rng);
    registry.emplace<ecs::PlayerTag>(entity);
    registry.emplace<ecs::TorpedoBay>(entity, ecs::WeaponSystem::make_torpedo_bay(1));
    return entity;
}

entt::entity spawn_autonomous(entt::registry& registry, const VesselPreset& preset,
                              Vector2 position, float heading, entt::entity target,
                              std::mt19937& rng, const ai::AiTuning& tuning) {
    auto entity = spawn_vessel(registry, preset, position, heading, rng);

    std::bernoulli_distribution coin(0.5);
    auto& agent = registry.emplace<ai::AiAgent>(entity);
    agent.target = target;
    agent.preferred_side = coin(rng) ? Side::Starboard : Side::Port;
    agent.tuning = tuning;
    return entity;
}

entt::entity spawn_elite(entt::registry& registry, Vector2 position, float heading,
                         entt::entity target, std::mt19937& rng, const ai::AiTuning& tuning) {
    auto entity = spawn_autonomous(registry, capital_preset(), position, heading, target, rng,
                                   elite_tuning(tuning));
    auto& agent = registry.get<ai::AiAgent>(entity);
    agent.force_aggressive = true;
    agent.aggressive = true;
    return entity;
}

} // namespace broadside::sim
