#pragma once

// =============================================================================
// 2D vector helpers on top of raymath
// =============================================================================
//
// Stateless. Every function takes and returns raylib's Vector2 by value.
// Zero-length inputs never produce NaN: normalize() of a zero vector is zero.
//

#include <raylib.h>
#include <raymath.h>

#include <cmath>

namespace broadside::math {

constexpr float kPi = 3.14159265358979323846f;
constexpr float kTwoPi = 2.0f * kPi;
constexpr float kHalfPi = 0.5f * kPi;

inline Vector2 vec2(float x, float y) { return Vector2{x, y}; }

inline Vector2 add(Vector2 a, Vector2 b) { return Vector2Add(a, b); }
inline Vector2 sub(Vector2 a, Vector2 b) { return Vector2Subtract(a, b); }
inline Vector2 scale(Vector2 v, float s) { return Vector2Scale(v, s); }
inline Vector2 negate(Vector2 v) { return Vector2Negate(v); }
inline float dot(Vector2 a, Vector2 b) { return Vector2DotProduct(a, b); }
inline float length(Vector2 v) { return Vector2Length(v); }
inline float length_sq(Vector2 v) { return Vector2LengthSqr(v); }
inline float distance(Vector2 a, Vector2 b) { return Vector2Distance(a, b); }
inline Vector2 normalize(Vector2 v) { return Vector2Normalize(v); }
inline Vector2 rotate(Vector2 v, float radians) { return Vector2Rotate(v, radians); }

/// a + b * s
inline Vector2 add_scaled(Vector2 a, Vector2 b, float s) {
    return Vector2{a.x + b.x * s, a.y + b.y * s};
}

/// z component of the 3D cross product.
inline float cross(Vector2 a, Vector2 b) { return a.x * b.y - a.y * b.x; }

/// Unit vector pointing along `radians` (0 = +x, pi/2 = +y).
inline Vector2 from_angle(float radians) {
    return Vector2{std::cos(radians), std::sin(radians)};
}

/// Bearing of `v`; atan2(0, 0) is 0.
inline float angle_of(Vector2 v) { return std::atan2(v.y, v.x); }

/// Wrap an angle into (-pi, pi].
inline float normalize_angle(float radians) {
    if (!std::isfinite(radians)) return 0.0f;
    float r = std::remainder(radians, kTwoPi);
    if (r <= -kPi) r += kTwoPi;
    if (r > kPi) r -= kTwoPi;
    return r;
}

/// Signed shortest rotation from `from` to `to`, in (-pi, pi].
inline float angle_between(float from, float to) {
    return normalize_angle(to - from);
}

inline bool is_finite(Vector2 v) { return std::isfinite(v.x) && std::isfinite(v.y); }

} // namespace broadside::math
