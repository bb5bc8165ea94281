#pragma once

/**
 * @file test_utils.hpp
 * @brief Common test utilities and helpers.
 */

#include "broadside/ecs/components/naval.hpp"
#include "broadside/sim/vessel_factory.hpp"

#include <entt/entt.hpp>

#include <cmath>
#include <cstdint>
#include <random>

namespace test_helpers {

// =============================================================================
// Assertion helpers
// =============================================================================

/** @brief Check that two floats are approximately equal. */
inline bool approx_equal(float a, float b, float epsilon = 0.0001f) {
    return std::abs(a - b) < epsilon;
}

/** @brief Check that two 2D positions are approximately equal. */
inline bool approx_equal_vec(Vector2 a, Vector2 b, float epsilon = 0.0001f) {
    return approx_equal(a.x, b.x, epsilon) && approx_equal(a.y, b.y, epsilon);
}

// =============================================================================
// Fixed seeds for deterministic tests
// =============================================================================

namespace seeds {
    constexpr std::uint32_t DEFAULT_TEST_SEED = 12345u;
    constexpr std::uint32_t ALT_TEST_SEED = 42u;
} // namespace seeds

// =============================================================================
// Vessel helpers
// =============================================================================

/** @brief A preset with fixed, round numbers for hand-checked expectations. */
inline broadside::sim::VesselPreset test_preset(float length = 120.0f, float width = 44.0f, int pairs = 2) {
    broadside::sim::VesselPreset preset;
    preset.name = "test";
    preset.length = length;
    preset.width = width;
    preset.gun_pairs = pairs;
    preset.health = 100.0f;
    return preset;
}

/** @brief Spawn a plain vessel (no controller) with a seeded battery. */
inline entt::entity make_vessel(entt::registry& registry, Vector2 position, float heading = 0.0f,
                                float length = 120.0f, float width = 44.0f) {
    std::mt19937 rng{seeds::DEFAULT_TEST_SEED};
    return broadside::sim::spawn_vessel(registry, test_preset(length, width), position, heading, rng);
}

/** @brief Set a vessel's linear velocity. */
inline void set_velocity(entt::registry& registry, entt::entity vessel, Vector2 velocity) {
    registry.get<broadside::ecs::Velocity2D>(vessel).linear = velocity;
}

} // namespace test_helpers
