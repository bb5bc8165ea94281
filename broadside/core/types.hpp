#pragma once

#include <cstdint>

namespace broadside {

// ============================================================================
// Core Types
// ============================================================================

using Tick = std::uint64_t;

/// Axis-aligned world rectangle (pixels).
struct WorldBounds {
    float min_x{-4000.0f};
    float max_x{4000.0f};
    float min_y{-4000.0f};
    float max_y{4000.0f};

    float width() const { return max_x - min_x; }
    float height() const { return max_y - min_y; }
};

// ============================================================================
// Control
// ============================================================================

/// One tick worth of helm orders, from input or from an AI helmsman.
struct ControlIntent {
    bool thrust_forward{false};
    bool thrust_reverse{false};
    bool turn_left{false};
    bool turn_right{false};
    bool fire{false};
    bool launch_torpedo{false};
};

enum class Side : std::uint8_t {
    Port = 0,
    Starboard = 1,
};

} // namespace broadside
