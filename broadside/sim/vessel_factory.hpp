#pragma once

// =============================================================================
// Vessel Factory - stat presets and entity composition
// =============================================================================
//
// Usage:
//   std::mt19937 rng{seed};
//   auto player = spawn_player(registry, {0, 0}, 0.0f, rng);
//   auto raider = spawn_autonomous(registry, raider_preset(), {900, 0}, kPi, player, rng);
//   auto boss   = spawn_elite(registry, {-1500, 800}, 0.0f, player, rng);
//

#include "broadside/ai/helmsman.hpp"
#include "broadside/ecs/components/naval.hpp"

#include <random>

namespace broadside::sim {

struct VesselPreset {
    const char* name{"vessel"};
    float length{120.0f};
    float width{44.0f};
    int gun_pairs{4};
    float health{100.0f};
    ecs::Movement2D movement{};
};

VesselPreset player_preset();
VesselPreset raider_preset();
VesselPreset capital_preset();

/// Hull, motion, health and battery. No controller attached.
entt::entity spawn_vessel(entt::registry& registry, const VesselPreset& preset,
                          Vector2 position, float heading, std::mt19937& rng);

/// Player preset with PlayerTag and a single torpedo tube.
entt::entity spawn_player(entt::registry& registry, Vector2 position, float heading,
                          std::mt19937& rng);

/// Vessel with an AiAgent hunting `target`; broadside side picked at random.
entt::entity spawn_autonomous(entt::registry& registry, const VesselPreset& preset,
                              Vector2 position, float heading, entt::entity target,
                              std::mt19937& rng, const ai::AiTuning& tuning = {});

/// Capital ship that never stops fighting.
entt::entity spawn_elite(entt::registry& registry, Vector2 position, float heading,
                         entt::entity target, std::mt19937& rng, const ai::AiTuning& tuning = {});

/// Elite overrides on top of a base tuning.
ai::AiTuning elite_tuning(ai::AiTuning base);

} // namespace broadside::sim
