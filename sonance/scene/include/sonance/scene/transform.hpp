#pragma once

#include <sonance/core/math.hpp>
#include <sonance/scene/entity.hpp>

namespace sonance::scene {

using namespace sonance::core;

// Local space transform, authored by gameplay code
struct LocalTransform {
    Vec3 position{0.0f};
    Quat rotation{1.0f, 0.0f, 0.0f, 0.0f};  // Identity quaternion
    Vec3 scale{1.0f};

    LocalTransform() = default;
    LocalTransform(const Vec3& pos) : position(pos) {}
    LocalTransform(const Vec3& pos, const Quat& rot) : position(pos), rotation(rot) {}

    Mat4 matrix() const {
        Mat4 result{1.0f};
        result = glm::translate(result, position);
        result = result * glm::mat4_cast(rotation);
        result = glm::scale(result, scale);
        return result;
    }

    Vec3 forward() const { return rotation * Vec3{0.0f, 0.0f, -1.0f}; }
};

// World space transform, written by whatever owns the hierarchy
struct WorldTransform {
    Mat4 matrix{1.0f};

    WorldTransform() = default;
    explicit WorldTransform(const Mat4& m) : matrix(m) {}

    Vec3 position() const { return Vec3{matrix[3]}; }

    // Rotate and scale a local offset into world space
    Vec3 transform_direction(const Vec3& local) const {
        return Mat3{matrix} * local;
    }
};

// Linear velocity in world units per second. Movement controllers keep it
// current; the sound system only reads it.
struct Velocity {
    Vec3 linear{0.0f};

    Velocity() = default;
    explicit Velocity(const Vec3& v) : linear(v) {}
};

class World;

// World position of an entity: WorldTransform, then LocalTransform, else origin
Vec3 get_world_position(const World& world, Entity entity);

// Entity velocity, zero without a Velocity component
Vec3 get_velocity(const World& world, Entity entity);

// Rotate a local-space offset by the entity's orientation
Vec3 rotate_offset(const World& world, Entity entity, const Vec3& offset);

} // namespace sonance::scene
