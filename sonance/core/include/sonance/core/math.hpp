#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <glm/gtc/matrix_transform.hpp>

namespace sonance::core {

// Vector types
using Vec2 = glm::vec2;
using Vec3 = glm::vec3;
using Vec4 = glm::vec4;

// Matrix types
using Mat3 = glm::mat3;
using Mat4 = glm::mat4;

// Quaternion
using Quat = glm::quat;

// Axis-aligned bounding box
struct AABB {
    Vec3 min{0.0f};
    Vec3 max{0.0f};

    AABB() = default;
    AABB(const Vec3& min_, const Vec3& max_) : min(min_), max(max_) {}

    static AABB from_center(const Vec3& center, const Vec3& half_extents) {
        return AABB{center - half_extents, center + half_extents};
    }

    Vec3 center() const { return (min + max) * 0.5f; }
    Vec3 size() const { return max - min; }
    Vec3 extents() const { return size() * 0.5f; }

    bool contains(const Vec3& point) const {
        return point.x >= min.x && point.x <= max.x &&
               point.y >= min.y && point.y <= max.y &&
               point.z >= min.z && point.z <= max.z;
    }

    bool intersects(const AABB& other) const {
        return min.x <= other.max.x && max.x >= other.min.x &&
               min.y <= other.max.y && max.y >= other.min.y &&
               min.z <= other.max.z && max.z >= other.min.z;
    }

    // Segment test (slab method). On hit, t_enter is the normalized [0,1]
    // parameter along from->to where the segment enters the box (0 if it
    // starts inside).
    bool intersects_segment(const Vec3& from, const Vec3& to, float* t_enter = nullptr) const;

    void expand(const Vec3& point) {
        min = glm::min(min, point);
        max = glm::max(max, point);
    }

    void expand(const AABB& other) {
        min = glm::min(min, other.min);
        max = glm::max(max, other.max);
    }
};

// Scalar helpers
inline float lerp(float a, float b, float t) { return a + (b - a) * t; }
inline float saturate(float v) { return glm::clamp(v, 0.0f, 1.0f); }

} // namespace sonance::core
