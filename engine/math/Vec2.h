// Minimal 2D vector in tile units. Double precision keeps runs reproducible.
#pragma once

#include <cmath>

namespace Engine {

struct Vec2 {
    double x{0.0};
    double y{0.0};

    Vec2() = default;
    Vec2(double xIn, double yIn) : x(xIn), y(yIn) {}

    Vec2& operator+=(const Vec2& rhs) {
        x += rhs.x;
        y += rhs.y;
        return *this;
    }

    double lengthSquared() const { return x * x + y * y; }
    double length() const { return std::sqrt(lengthSquared()); }
};

inline Vec2 operator*(const Vec2& v, double scalar) { return Vec2{v.x * scalar, v.y * scalar}; }
inline Vec2 operator+(const Vec2& a, const Vec2& b) { return Vec2{a.x + b.x, a.y + b.y}; }
inline Vec2 operator-(const Vec2& a, const Vec2& b) { return Vec2{a.x - b.x, a.y - b.y}; }
inline bool operator==(const Vec2& a, const Vec2& b) { return a.x == b.x && a.y == b.y; }

inline double distanceSquared(const Vec2& a, const Vec2& b) { return (a - b).lengthSquared(); }

inline Vec2 lerp(const Vec2& a, const Vec2& b, double t) {
    return Vec2{a.x + (b.x - a.x) * t, a.y + (b.y - a.y) * t};
}

// Unit vector from `from` toward `to`; a zero-length delta yields a zero vector.
inline Vec2 directionTo(const Vec2& from, const Vec2& to) {
    const Vec2 d = to - from;
    double len = d.length();
    if (len == 0.0) len = 1.0;
    return Vec2{d.x / len, d.y / len};
}

}  // namespace Engine
