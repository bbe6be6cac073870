#pragma once

#include <sonance/acoustics/sound_system.hpp>
#include <sonance/acoustics/sound_emitter.hpp>
#include <sonance/acoustics/sound_listener.hpp>
#include <sonance/acoustics/sound_grid.hpp>
#include <string>

namespace sonance::acoustics {

// Tunables for the whole sound setup, stored as JSON
struct SoundSettings {
    PropagationSettings propagation;

    struct EmitterDefaults {
        float default_loudness = 1.0f;
        float default_quality = 0.0f;
        float wall_penalty = DEFAULT_WALL_PENALTY;
        LayerMask obstruction_mask = DEFAULT_OBSTRUCTION_MASK;
    } emitter;

    struct ListenerDefaults {
        float hearing_threshold = DEFAULT_HEARING_THRESHOLD;
    } listener;

    struct GridSettings {
        float cell_size = SoundGridQueries::DEFAULT_CELL_SIZE;
    } grid;

    // Missing file or malformed JSON returns false and leaves this untouched.
    // Missing keys keep their current values. Out of range values are
    // rejected as a whole.
    bool load(const std::string& path);
    bool load_from_string(const std::string& text);

    bool save(const std::string& path) const;
    std::string to_json_string() const;

    // Logs the first problem and returns false
    bool is_valid() const;

    SoundEmitter make_emitter() const;
    SoundListener make_listener() const;
};

} // namespace sonance::acoustics
