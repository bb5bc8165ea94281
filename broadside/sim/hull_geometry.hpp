#pragma once

// =============================================================================
// Hull geometry - exact hull outline for projectile hit testing
// =============================================================================

#include "broadside/ecs/components/naval.hpp"

#include <array>

namespace broadside::sim {

inline constexpr std::size_t kHullVertexCount = 7;

using HullPolygon = std::array<Vector2, kHullVertexCount>;

/// Outline in local coordinates (x forward, y starboard), bow first.
HullPolygon local_hull_polygon(const ecs::Hull& hull);

/// Outline rotated and translated into world space.
HullPolygon world_hull_polygon(const ecs::Hull& hull, const ecs::Transform2D& transform);

/// Even-odd rule; points exactly on an edge may fall either way.
bool point_in_polygon(Vector2 point, const HullPolygon& polygon);

float distance_to_segment(Vector2 point, Vector2 a, Vector2 b);

/// True if a circle touches or lies inside the polygon.
bool polygon_hits_circle(const HullPolygon& polygon, Vector2 center, float radius);

} // namespace broadside::sim
