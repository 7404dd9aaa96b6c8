#ifndef PHYSICSLIB_GEOMETRY_H
#define PHYSICSLIB_GEOMETRY_H

#include <cmath>

namespace physicslib {

struct Vec2 {
    float x, y;

    Vec2() : x(0.0f), y(0.0f) {}
    Vec2(float x_val, float y_val) : x(x_val), y(y_val) {}

    Vec2 operator+(const Vec2& other) const {
        return Vec2(x + other.x, y + other.y);
    }

    Vec2 operator-(const Vec2& other) const {
        return Vec2(x - other.x, y - other.y);
    }

    Vec2 operator*(float scalar) const {
        return Vec2(x * scalar, y * scalar);
    }

    bool operator==(const Vec2& other) const {
        return x == other.x && y == other.y;
    }

    float magnitude() const {
        return std::sqrt(x * x + y * y);
    }
};

inline float distance(const Vec2& pos1, const Vec2& pos2) {
    return (pos1 - pos2).magnitude();
}

} // namespace physicslib

#endif // PHYSICSLIB_GEOMETRY_H
