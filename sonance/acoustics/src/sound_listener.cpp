#include <sonance/acoustics/sound_listener.hpp>
#include <sonance/core/math.hpp>

namespace sonance::acoustics {

SoundListener::SoundListener(float hearing_threshold) {
    set_hearing_threshold(hearing_threshold);
}

bool SoundListener::check_sound(float loudness, const Vec3& source_position, float quality) {
    HeardSound sound;
    sound.loudness = loudness;
    sound.source_position = source_position;
    sound.quality = quality;
    return check_sound(sound);
}

bool SoundListener::check_sound(const HeardSound& sound) {
    if (!m_enabled) return false;
    if (!(sound.loudness >= m_hearing_threshold)) return false;

    if (m_reaction) {
        m_reaction(sound);
    }
    return true;
}

void SoundListener::set_hearing_threshold(float threshold) {
    m_hearing_threshold = core::saturate(threshold);
}

} // namespace sonance::acoustics
