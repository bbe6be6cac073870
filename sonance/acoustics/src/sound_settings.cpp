#include <sonance/acoustics/sound_settings.hpp>
#include <sonance/core/filesystem.hpp>
#include <sonance/core/log.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace sonance::acoustics {

using namespace sonance::core;
using json = nlohmann::json;

bool SoundSettings::load(const std::string& path) {
    std::string content = FileSystem::read_text(path);
    if (content.empty()) {
        log(LogLevel::Warn, "acoustics", "Sound settings not found: " + path);
        return false;
    }
    return load_from_string(content);
}

bool SoundSettings::load_from_string(const std::string& text) {
    SoundSettings loaded = *this;

    try {
        json j = json::parse(text);

        if (j.contains("propagation")) {
            auto& p = j["propagation"];
            loaded.propagation.min_radius = p.value("min_radius", loaded.propagation.min_radius);
            loaded.propagation.max_radius = p.value("max_radius", loaded.propagation.max_radius);
            loaded.propagation.skip_source_listener =
                p.value("skip_source_listener", loaded.propagation.skip_source_listener);

            // Read signed so a negative count is caught instead of wrapping
            const int64_t max_candidates =
                p.value("max_candidates", static_cast<int64_t>(loaded.propagation.max_candidates));
            if (max_candidates <= 0 || max_candidates > static_cast<int64_t>(MAX_CANDIDATES_LIMIT)) {
                log(LogLevel::Error, "acoustics",
                    "Sound settings: propagation.max_candidates out of range: " + std::to_string(max_candidates));
                return false;
            }
            loaded.propagation.max_candidates = static_cast<size_t>(max_candidates);
        }

        if (j.contains("emitter")) {
            auto& e = j["emitter"];
            loaded.emitter.default_loudness = e.value("default_loudness", loaded.emitter.default_loudness);
            loaded.emitter.default_quality = e.value("default_quality", loaded.emitter.default_quality);
            loaded.emitter.wall_penalty = e.value("wall_penalty", loaded.emitter.wall_penalty);

            const int64_t mask = e.value("obstruction_mask", static_cast<int64_t>(loaded.emitter.obstruction_mask));
            if (mask < 0 || mask > 0xFFFF) {
                log(LogLevel::Error, "acoustics",
                    "Sound settings: emitter.obstruction_mask must fit in 16 bits, got " + std::to_string(mask));
                return false;
            }
            loaded.emitter.obstruction_mask = static_cast<LayerMask>(mask);
        }

        if (j.contains("listener")) {
            auto& l = j["listener"];
            loaded.listener.hearing_threshold = l.value("hearing_threshold", loaded.listener.hearing_threshold);
        }

        if (j.contains("grid")) {
            auto& g = j["grid"];
            loaded.grid.cell_size = g.value("cell_size", loaded.grid.cell_size);
        }
    } catch (const json::exception& e) {
        log(LogLevel::Error, "acoustics", std::string("Malformed sound settings: ") + e.what());
        return false;
    }

    if (!loaded.is_valid()) {
        return false;
    }

    *this = loaded;
    return true;
}

bool SoundSettings::save(const std::string& path) const {
    if (!FileSystem::write_text(path, to_json_string())) {
        log(LogLevel::Error, "acoustics", "Failed to write sound settings: " + path);
        return false;
    }
    return true;
}

std::string SoundSettings::to_json_string() const {
    json j;

    j["propagation"] = {
        {"min_radius", propagation.min_radius},
        {"max_radius", propagation.max_radius},
        {"max_candidates", propagation.max_candidates},
        {"skip_source_listener", propagation.skip_source_listener}
    };

    j["emitter"] = {
        {"default_loudness", emitter.default_loudness},
        {"default_quality", emitter.default_quality},
        {"wall_penalty", emitter.wall_penalty},
        {"obstruction_mask", emitter.obstruction_mask}
    };

    j["listener"] = {
        {"hearing_threshold", listener.hearing_threshold}
    };

    j["grid"] = {
        {"cell_size", grid.cell_size}
    };

    return j.dump(2);
}

bool SoundSettings::is_valid() const {
    try {
        propagation.validate();
    } catch (const std::invalid_argument& e) {
        log(LogLevel::Error, "acoustics", e.what());
        return false;
    }

    if (!(emitter.default_loudness >= 0.0f && emitter.default_loudness <= 1.0f)) {
        log(LogLevel::Error, "acoustics", "Sound settings: emitter.default_loudness must be in [0, 1]");
        return false;
    }
    if (!(emitter.wall_penalty > 0.0f && emitter.wall_penalty <= 1.0f)) {
        log(LogLevel::Error, "acoustics", "Sound settings: emitter.wall_penalty must be in (0, 1]");
        return false;
    }
    if (!(listener.hearing_threshold >= 0.0f && listener.hearing_threshold <= 1.0f)) {
        log(LogLevel::Error, "acoustics", "Sound settings: listener.hearing_threshold must be in [0, 1]");
        return false;
    }
    if (!(grid.cell_size > 0.0f)) {
        log(LogLevel::Error, "acoustics", "Sound settings: grid.cell_size must be positive");
        return false;
    }
    return true;
}

SoundEmitter SoundSettings::make_emitter() const {
    SoundEmitter e;
    e.set_default_loudness(emitter.default_loudness);
    e.set_default_quality(emitter.default_quality);
    e.set_wall_penalty(emitter.wall_penalty);
    e.set_obstruction_mask(emitter.obstruction_mask);
    return e;
}

SoundListener SoundSettings::make_listener() const {
    return SoundListener{listener.hearing_threshold};
}

} // namespace sonance::acoustics
