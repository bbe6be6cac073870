#pragma once

#include <sonance/physics/shapes.hpp>
#include <sonance/physics/layers.hpp>
#include <sonance/core/math.hpp>
#include <cstdint>

namespace sonance::physics {

using namespace sonance::core;

// Physics body ID (opaque handle)
struct PhysicsBodyId {
    uint32_t id = UINT32_MAX;
    bool valid() const { return id != UINT32_MAX; }

    bool operator==(const PhysicsBodyId& other) const { return id == other.id; }
    bool operator!=(const PhysicsBodyId& other) const { return id != other.id; }
};

// Body motion types
enum class BodyType : uint8_t {
    Static,     // Never moves (floors, walls)
    Kinematic,  // Moved by code (listener volumes following their entity)
    Dynamic     // Fully simulated
};

// Body creation settings
struct BodySettings {
    BodyType type = BodyType::Static;
    const ShapeSettings* shape = nullptr;  // Required, only read during create_body

    // Initial transform
    Vec3 position{0.0f};
    Quat rotation{1.0f, 0.0f, 0.0f, 0.0f};

    // Collision settings
    uint16_t layer = layers::STATIC;
    bool is_sensor = false;      // Reported by overlaps, ignored by ray casts

    // Opaque value returned by PhysicsWorld::get_user_data
    uint64_t user_data = 0;
};

} // namespace sonance::physics
