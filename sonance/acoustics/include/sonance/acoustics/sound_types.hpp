#pragma once

#include <sonance/scene/entity.hpp>
#include <sonance/physics/layers.hpp>
#include <sonance/core/math.hpp>

namespace sonance::acoustics {

using sonance::core::Vec3;
using sonance::physics::LayerMask;

// Below this speed a source counts as stationary for prediction
constexpr float STATIONARY_SPEED = 0.1f;

// Default wall set: only the sound-blocking level geometry layer
constexpr LayerMask DEFAULT_OBSTRUCTION_MASK = physics::make_mask({physics::layers::WALL});
constexpr float DEFAULT_WALL_PENALTY = 0.8f;

// Which geometry blocks a sound, and how much each wall takes off
struct ObstructionProfile {
    LayerMask mask = DEFAULT_OBSTRUCTION_MASK;
    float wall_penalty = DEFAULT_WALL_PENALTY;  // Multiplier per wall, (0, 1]
};

// One emit call. Built on the stack, propagated, discarded.
struct SoundEmission {
    Vec3 origin{0.0f};
    Vec3 velocity{0.0f};
    float loudness = 0.0f;      // Clamped to [0, 1] by propagation
    float quality = 0.0f;       // Opaque tag, forwarded untouched
    LayerMask obstruction_mask = DEFAULT_OBSTRUCTION_MASK;
    float wall_penalty = DEFAULT_WALL_PENALTY;
    scene::Entity source = scene::NullEntity;
};

// What a listener's reaction receives
struct HeardSound {
    float loudness = 0.0f;      // Perceived, after falloff and walls
    Vec3 source_position{0.0f};
    float quality = 0.0f;
    Vec3 source_velocity{0.0f};
    scene::Entity source = scene::NullEntity;
    scene::Entity listener = scene::NullEntity;

    // Where the source will be after lead_time seconds, assuming it keeps
    // its velocity. Slow sources are treated as standing still.
    Vec3 predicted_source_position(float lead_time) const {
        if (glm::length(source_velocity) < STATIONARY_SPEED) {
            return source_position;
        }
        return source_position + source_velocity * lead_time;
    }
};

} // namespace sonance::acoustics
