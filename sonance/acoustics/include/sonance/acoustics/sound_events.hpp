#pragma once

#include <sonance/acoustics/sound_types.hpp>
#include <cstdint>

namespace sonance::acoustics {

// ============================================================================
// Observer events, dispatched synchronously from SoundSystem::propagate
// ============================================================================

// Once per emission that reached candidate discovery
struct SoundEmittedEvent {
    scene::Entity source = scene::NullEntity;
    Vec3 origin{0.0f};
    float radius = 0.0f;
    float loudness = 0.0f;
    float quality = 0.0f;
    double time = 0.0;
};

// Every listener check, heard or not
struct SoundCheckedEvent {
    scene::Entity listener = scene::NullEntity;
    scene::Entity source = scene::NullEntity;
    Vec3 source_position{0.0f};
    float loudness = 0.0f;          // Perceived
    float quality = 0.0f;
    uint32_t wall_count = 0;
    bool heard = false;
    double time = 0.0;
};

// A listener's reaction fired
struct SoundHeardEvent {
    HeardSound sound;
    double time = 0.0;
};

} // namespace sonance::acoustics
