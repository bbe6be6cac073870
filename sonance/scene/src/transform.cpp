#include <sonance/scene/transform.hpp>
#include <sonance/scene/world.hpp>

namespace sonance::scene {

Vec3 get_world_position(const World& world, Entity entity) {
    if (const auto* world_transform = world.try_get<WorldTransform>(entity)) {
        return world_transform->position();
    }
    if (const auto* local_transform = world.try_get<LocalTransform>(entity)) {
        return local_transform->position;
    }
    return Vec3(0.0f);
}

Vec3 get_velocity(const World& world, Entity entity) {
    if (const auto* velocity = world.try_get<Velocity>(entity)) {
        return velocity->linear;
    }
    return Vec3(0.0f);
}

Vec3 rotate_offset(const World& world, Entity entity, const Vec3& offset) {
    if (const auto* world_transform = world.try_get<WorldTransform>(entity)) {
        return world_transform->transform_direction(offset);
    }
    if (const auto* local_transform = world.try_get<LocalTransform>(entity)) {
        return local_transform->rotation * offset;
    }
    return offset;
}

} // namespace sonance::scene
