#include <sonance/acoustics/sound_emitter.hpp>
#include <stdexcept>
#include <string>

namespace sonance::acoustics {

void SoundEmitter::set_default_loudness(float loudness) {
    if (!(loudness >= 0.0f && loudness <= 1.0f)) {
        throw std::invalid_argument("SoundEmitter: default loudness must be in [0, 1], got " +
                                    std::to_string(loudness));
    }
    m_default_loudness = loudness;
}

void SoundEmitter::set_wall_penalty(float penalty) {
    if (!(penalty > 0.0f && penalty <= 1.0f)) {
        throw std::invalid_argument("SoundEmitter: wall penalty must be in (0, 1], got " +
                                    std::to_string(penalty));
    }
    m_wall_penalty = penalty;
}

void SoundEmitter::record_emission(float loudness, float quality, double timestamp) {
    m_last_emission.loudness = loudness;
    m_last_emission.quality = quality;
    m_last_emission.timestamp = timestamp;
    ++m_emission_count;
}

} // namespace sonance::acoustics
