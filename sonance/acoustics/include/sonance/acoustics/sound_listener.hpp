#pragma once

#include <sonance/acoustics/sound_types.hpp>
#include <functional>

namespace sonance::acoustics {

constexpr float DEFAULT_HEARING_THRESHOLD = 0.2f;

// Sound sink component. Gates incoming sounds on a threshold and hands the
// ones it hears to a reaction. Keeps no memory of past sounds.
class SoundListener {
public:
    using Reaction = std::function<void(const HeardSound&)>;

    SoundListener() = default;
    explicit SoundListener(float hearing_threshold);

    // Returns true when the reaction fired (loudness >= threshold)
    bool check_sound(float loudness, const Vec3& source_position, float quality);
    bool check_sound(const HeardSound& sound);

    // Clamped to [0, 1]
    void set_hearing_threshold(float threshold);
    float hearing_threshold() const { return m_hearing_threshold; }

    void set_enabled(bool enabled) { m_enabled = enabled; }
    bool enabled() const { return m_enabled; }

    void set_reaction(Reaction reaction) { m_reaction = std::move(reaction); }
    bool has_reaction() const { return static_cast<bool>(m_reaction); }

private:
    float m_hearing_threshold = DEFAULT_HEARING_THRESHOLD;
    bool m_enabled = true;
    Reaction m_reaction;
};

} // namespace sonance::acoustics
