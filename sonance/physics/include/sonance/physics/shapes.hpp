#pragma once

#include <sonance/core/math.hpp>
#include <cstdint>

namespace sonance::physics {

using namespace sonance::core;

// Shape types
enum class ShapeType : uint8_t {
    Box,
    Sphere,
    Capsule
};

// Base shape settings
struct ShapeSettings {
    ShapeType type = ShapeType::Box;
};

// Box shape
struct BoxShapeSettings : ShapeSettings {
    Vec3 half_extents{0.5f};

    BoxShapeSettings() { type = ShapeType::Box; }
    BoxShapeSettings(const Vec3& extents) : half_extents(extents) { type = ShapeType::Box; }
};

// Sphere shape
struct SphereShapeSettings : ShapeSettings {
    float radius = 0.5f;

    SphereShapeSettings() { type = ShapeType::Sphere; }
    SphereShapeSettings(float r) : radius(r) { type = ShapeType::Sphere; }
};

// Capsule shape (cylinder with hemispherical caps), Y up
struct CapsuleShapeSettings : ShapeSettings {
    float radius = 0.5f;
    float half_height = 0.5f;  // Half height of the cylindrical part

    CapsuleShapeSettings() { type = ShapeType::Capsule; }
    CapsuleShapeSettings(float r, float h) : radius(r), half_height(h) { type = ShapeType::Capsule; }
};

} // namespace sonance::physics
