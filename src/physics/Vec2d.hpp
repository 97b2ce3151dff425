#pragma once

#include <cmath>

namespace orrery {

/// Double-precision 2D vector for positions, velocities and forces in SI units.
/// Solar-system magnitudes (G*m1*m2 ~ 1e43) overflow single precision.
struct Vec2d {
    double x = 0.0;
    double y = 0.0;

    constexpr Vec2d() = default;
    constexpr Vec2d(double x, double y) : x(x), y(y) {}

    // Arithmetic operators
    Vec2d operator+(const Vec2d& other) const { return {x + other.x, y + other.y}; }
    Vec2d operator-(const Vec2d& other) const { return {x - other.x, y - other.y}; }
    Vec2d operator-() const { return {-x, -y}; }
    Vec2d operator*(double scalar) const { return {x * scalar, y * scalar}; }
    Vec2d operator/(double scalar) const { return {x / scalar, y / scalar}; }
    Vec2d& operator+=(const Vec2d& other) { x += other.x; y += other.y; return *this; }
    Vec2d& operator-=(const Vec2d& other) { x -= other.x; y -= other.y; return *this; }
    Vec2d& operator*=(double scalar) { x *= scalar; y *= scalar; return *this; }

    // Comparison operators
    bool operator==(const Vec2d& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Vec2d& other) const { return !(*this == other); }

    // Utility functions
    double length() const { return std::hypot(x, y); }
    double lengthSquared() const { return x * x + y * y; }
    bool isFinite() const { return std::isfinite(x) && std::isfinite(y); }
    static double dot(const Vec2d& a, const Vec2d& b) { return a.x * b.x + a.y * b.y; }
    /// z component of the 3D cross product of (a, 0) and (b, 0).
    static double cross(const Vec2d& a, const Vec2d& b) { return a.x * b.y - a.y * b.x; }
    static double distance(const Vec2d& a, const Vec2d& b) { return (b - a).length(); }
};

inline Vec2d operator*(double scalar, const Vec2d& v) { return v * scalar; }

} // namespace orrery
