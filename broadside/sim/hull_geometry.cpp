#include "hull_geometry.hpp"

#include "broadside/math/vec2.hpp"

#include <algorithm>

namespace broadside::sim {

HullPolygon local_hull_polygon(const ecs::Hull& hull) {
    const float hl = hull.length * 0.5f;
    const float ql = hull.length * 0.25f;
    const float hw = hull.width * 0.5f;
    const float tw = hull.width / 3.0f;

    return HullPolygon{{
        {+hl, 0.0f},   // bow
        {+ql, +hw},
        {-ql, +hw},
        {-hl, +tw},    // transom
        {-hl, -tw},
        {-ql, -hw},
        {+ql, -hw},
    }};
}

HullPolygon world_hull_polygon(const ecs::Hull& hull, const ecs::Transform2D& transform) {
    HullPolygon poly = local_hull_polygon(hull);
    for (auto& v : poly) {
        v = math::add(transform.position, math::rotate(v, transform.rotation));
    }
    return poly;
}

bool point_in_polygon(Vector2 point, const HullPolygon& polygon) {
    bool inside = false;
    for (std::size_t i = 0, j = polygon.size() - 1; i < polygon.size(); j = i++) {
        const Vector2& pi = polygon[i];
        const Vector2& pj = polygon[j];
        const bool crosses = (pi.y > point.y) != (pj.y > point.y);
        if (crosses) {
            const float x_at = (pj.x - pi.x) * (point.y - pi.y) / (pj.y - pi.y) + pi.x;
            if (point.x < x_at) inside = !inside;
        }
    }
    return inside;
}

float distance_to_segment(Vector2 point, Vector2 a, Vector2 b) {
    const Vector2 ab = math::sub(b, a);
    const float len_sq = math::length_sq(ab);
    if (len_sq <= 1e-12f) {
        return math::distance(point, a);
    }
    float t = math::dot(math::sub(point, a), ab) / len_sq;
    t = std::clamp(t, 0.0f, 1.0f);
    return math::distance(point, math::add_scaled(a, ab, t));
}

bool polygon_hits_circle(const HullPolygon& polygon, Vector2 center, float radius) {
    if (point_in_polygon(center, polygon)) return true;

    for (std::size_t i = 0, j = polygon.size() - 1; i < polygon.size(); j = i++) {
        if (distance_to_segment(center, polygon[j], polygon[i]) <= radius) {
            return true;
        }
    }
    return false;
}

} // namespace broadside::sim
