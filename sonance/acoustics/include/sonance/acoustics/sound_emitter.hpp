#pragma once

#include <sonance/acoustics/sound_types.hpp>
#include <cstdint>

namespace sonance::acoustics {

// Diagnostics only, never read by propagation
struct EmissionRecord {
    float loudness = 0.0f;
    float quality = 0.0f;
    double timestamp = 0.0;     // SoundSystem clock, seconds
};

// Sound source component. Holds the defaults used when an emit call leaves
// loudness or quality out, and how the sound is blocked by walls.
class SoundEmitter {
public:
    SoundEmitter() = default;

    // Throws std::invalid_argument outside [0, 1]
    void set_default_loudness(float loudness);
    float default_loudness() const { return m_default_loudness; }

    void set_default_quality(float quality) { m_default_quality = quality; }
    float default_quality() const { return m_default_quality; }

    void set_obstruction_mask(LayerMask mask) { m_obstruction_mask = mask; }
    LayerMask obstruction_mask() const { return m_obstruction_mask; }

    // Throws std::invalid_argument outside (0, 1]
    void set_wall_penalty(float penalty);
    float wall_penalty() const { return m_wall_penalty; }

    ObstructionProfile obstruction_profile() const {
        return ObstructionProfile{m_obstruction_mask, m_wall_penalty};
    }

    // Emission point relative to the entity, rotated with it
    void set_emit_offset(const Vec3& offset) { m_emit_offset = offset; }
    const Vec3& emit_offset() const { return m_emit_offset; }

    void set_enabled(bool enabled) { m_enabled = enabled; }
    bool enabled() const { return m_enabled; }

    void record_emission(float loudness, float quality, double timestamp);
    const EmissionRecord& last_emission() const { return m_last_emission; }
    uint64_t emission_count() const { return m_emission_count; }

private:
    float m_default_loudness = 1.0f;
    float m_default_quality = 0.0f;
    LayerMask m_obstruction_mask = DEFAULT_OBSTRUCTION_MASK;
    float m_wall_penalty = DEFAULT_WALL_PENALTY;
    Vec3 m_emit_offset{0.0f};
    bool m_enabled = true;

    EmissionRecord m_last_emission;
    uint64_t m_emission_count = 0;
};

} // namespace sonance::acoustics
