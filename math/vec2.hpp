#ifndef TRAILSKETCH_MATH_VEC2_HPP
#define TRAILSKETCH_MATH_VEC2_HPP

#include <cmath>
#include <cstddef>

namespace trailsketch {

struct Vec2 {
    double x = 0.0;
    double y = 0.0;

    constexpr Vec2() = default;
    constexpr Vec2(double x_, double y_) : x(x_), y(y_) {}

    // Arithmetic operators
    constexpr Vec2 operator+(const Vec2& other) const {
        return {x + other.x, y + other.y};
    }

    constexpr Vec2 operator-(const Vec2& other) const {
        return {x - other.x, y - other.y};
    }

    constexpr Vec2 operator*(double scalar) const {
        return {x * scalar, y * scalar};
    }

    constexpr Vec2 operator/(double scalar) const {
        return {x / scalar, y / scalar};
    }

    constexpr Vec2 operator-() const {
        return {-x, -y};
    }

    // Compound assignment
    constexpr Vec2& operator+=(const Vec2& other) {
        x += other.x; y += other.y;
        return *this;
    }

    constexpr Vec2& operator-=(const Vec2& other) {
        x -= other.x; y -= other.y;
        return *this;
    }

    constexpr Vec2& operator*=(double scalar) {
        x *= scalar; y *= scalar;
        return *this;
    }

    constexpr Vec2& operator/=(double scalar) {
        x /= scalar; y /= scalar;
        return *this;
    }

    // Dot product
    constexpr double dot(const Vec2& other) const {
        return x * other.x + y * other.y;
    }

    // Z component of the 3D cross product
    constexpr double cross(const Vec2& other) const {
        return x * other.y - y * other.x;
    }

    // Magnitude squared (no sqrt)
    constexpr double length_squared() const {
        return x * x + y * y;
    }

    // Magnitude
    double length() const {
        return std::hypot(x, y);
    }

    // Normalized vector
    Vec2 normalized() const {
        double len = length();
        if (len > 0.0) {
            return *this / len;
        }
        return {0.0, 0.0};
    }

    // Distance to another point
    double distance_to(const Vec2& other) const {
        return (*this - other).length();
    }

    // Counter-clockwise rotation by angle (radians) about the origin
    Vec2 rotated(double angle) const {
        double c = std::cos(angle);
        double s = std::sin(angle);
        return {x * c - y * s, x * s + y * c};
    }

    // Comparison (exact)
    constexpr bool operator==(const Vec2& other) const {
        return x == other.x && y == other.y;
    }

    constexpr bool operator!=(const Vec2& other) const {
        return !(*this == other);
    }

    // Array access
    constexpr double& operator[](size_t i) {
        if (i == 0) return x;
        return y;
    }

    constexpr double operator[](size_t i) const {
        if (i == 0) return x;
        return y;
    }
};

// Scalar * Vec2
constexpr Vec2 operator*(double scalar, const Vec2& v) {
    return v * scalar;
}

// Linear interpolation
constexpr Vec2 lerp(const Vec2& a, const Vec2& b, double t) {
    return a * (1.0 - t) + b * t;
}

// Distance from p to the segment [a, b]
inline double distance_to_segment(const Vec2& p, const Vec2& a, const Vec2& b) {
    Vec2 ab = b - a;
    double len_sq = ab.length_squared();
    if (len_sq == 0.0) {
        return p.distance_to(a);
    }
    double t = (p - a).dot(ab) / len_sq;
    if (t < 0.0) t = 0.0;
    if (t > 1.0) t = 1.0;
    return p.distance_to(a + ab * t);
}

// Common constants
namespace vec2 {
    constexpr Vec2 zero() { return {0.0, 0.0}; }
    constexpr Vec2 unit_x() { return {1.0, 0.0}; }
    constexpr Vec2 unit_y() { return {0.0, 1.0}; }
}

}  // namespace trailsketch

#endif // TRAILSKETCH_MATH_VEC2_HPP
