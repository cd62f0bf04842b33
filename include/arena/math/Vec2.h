#pragma once
/// @file Vec2.h
/// @brief 2-component floating-point vector for the 2D physics core.

#include <cassert>
#include <cmath>
#include <iostream>

namespace arena {

/// A 2D vector with float components.
struct Vec2 {
    float x; ///< X component
    float y; ///< Y component

    // ── Constructors ──────────────────────────────────────────────────────

    /// Default constructor, initializes to (0, 0).
    Vec2() : x(0.0f), y(0.0f) {}

    /// Construct from individual components.
    Vec2(float x, float y) : x(x), y(y) {}

    // ── Arithmetic operators ──────────────────────────────────────────────

    Vec2 operator+(const Vec2& v) const { return {x + v.x, y + v.y}; }
    Vec2 operator-(const Vec2& v) const { return {x - v.x, y - v.y}; }

    /// Multiply both components by a scalar.
    Vec2 operator*(float s) const { return {x * s, y * s}; }

    /// Divide both components by a scalar.
    Vec2 operator/(float s) const {
        const float inv = 1.0f / s;
        return {x * inv, y * inv};
    }

    /// Unary negation.
    Vec2 operator-() const { return {-x, -y}; }

    // ── Compound assignment ───────────────────────────────────────────────

    Vec2& operator+=(const Vec2& v) { x += v.x; y += v.y; return *this; }
    Vec2& operator-=(const Vec2& v) { x -= v.x; y -= v.y; return *this; }
    Vec2& operator*=(float s)       { x *= s;   y *= s;   return *this; }

    // ── Comparison ────────────────────────────────────────────────────────

    /// Exact equality (used to detect "position changed this tick").
    bool operator==(const Vec2& v) const { return x == v.x && y == v.y; }
    bool operator!=(const Vec2& v) const { return !(*this == v); }

    // ── Geometric operations ──────────────────────────────────────────────

    /// Dot product with another vector.
    float dot(const Vec2& v) const { return x * v.x + y * v.y; }

    /// Z component of the 3D cross product (signed parallelogram area).
    float cross(const Vec2& v) const { return x * v.y - y * v.x; }

    /// Euclidean length (magnitude).
    float length() const { return std::sqrt(lengthSq()); }

    /// Squared length (avoids sqrt).
    float lengthSq() const { return x * x + y * y; }

    /// Return a unit-length copy; asserts that length > 1e-10.
    Vec2 normalized() const {
        const float len = length();
        assert(len > 1e-10f && "Cannot normalize a near-zero vector");
        return *this / len;
    }

    /// Left-hand perpendicular (-y, x); same length as this vector.
    Vec2 perpendicular() const { return {-y, x}; }

    /// Check whether this vector is approximately zero.
    bool isZero(float eps = 1e-6f) const { return lengthSq() < eps * eps; }

    // ── Static factory helpers ────────────────────────────────────────────

    static Vec2 zero()  { return {0.0f, 0.0f}; }
    static Vec2 unitX() { return {1.0f, 0.0f}; }
    static Vec2 unitY() { return {0.0f, 1.0f}; }

    /// Left-multiply by scalar (s * v).
    friend Vec2 operator*(float s, const Vec2& v) { return v * s; }

    /// Print as "(x, y)".
    friend std::ostream& operator<<(std::ostream& os, const Vec2& v) {
        return os << "(" << v.x << ", " << v.y << ")";
    }
};

// ── Free-function convenience wrappers ────────────────────────────────────

inline float dot(const Vec2& a, const Vec2& b) { return a.dot(b); }
inline float length(const Vec2& v)             { return v.length(); }
inline Vec2  normalize(const Vec2& v)          { return v.normalized(); }

} // namespace arena
