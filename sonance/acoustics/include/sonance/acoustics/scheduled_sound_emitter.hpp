#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace sonance::acoustics {

enum class TriggerMode : uint8_t {
    OnStart,    // Triggers on the first SoundSystem update
    Manual      // Only trigger() starts playback
};

constexpr float MIN_REPEAT_INTERVAL = 0.1f;

struct ScheduledSound {
    float loudness = 1.0f;
    float quality = 0.0f;
    float delay = 0.0f;             // Seconds, >= 0
    bool loop = false;
    float repeat_interval = 1.0f;   // Loops only, >= MIN_REPEAT_INTERVAL
};

// Level-design sound sequence. Non-looping sounds play one after another,
// each waiting its own delay after the previous one. A looping sound starts
// when the sequential sounds listed before it have played, waits its own
// delay, then repeats in parallel until stop().
// Each sound is broadcast through the entity's SoundEmitter.
class ScheduledSoundEmitter {
public:
    ScheduledSoundEmitter() = default;
    explicit ScheduledSoundEmitter(TriggerMode mode) : m_trigger_mode(mode) {}

    // Clamps delay and repeat interval
    void add_sound(const ScheduledSound& sound);
    void clear_sounds();
    const std::vector<ScheduledSound>& sounds() const { return m_sounds; }

    void set_trigger_mode(TriggerMode mode) { m_trigger_mode = mode; }
    TriggerMode trigger_mode() const { return m_trigger_mode; }

    void set_single_use(bool single_use) { m_single_use = single_use; }
    bool single_use() const { return m_single_use; }

    // Seconds between triggers, 0 disables
    void set_cooldown(float seconds);
    float cooldown() const { return m_cooldown; }

    // Start playback at time now. Returns false when single-use and spent,
    // on cooldown, already playing or empty.
    bool trigger(double now);
    void stop();

    // Stop and forget single-use and cooldown state
    void reset();

    bool is_playing() const { return m_playing; }
    bool has_triggered() const { return m_has_triggered; }

    // Appends the sounds due at time now, in schedule order
    void advance(double now, std::vector<ScheduledSound>& due);

    // OnStart bookkeeping, driven by the sound system
    bool wants_auto_trigger() const {
        return m_trigger_mode == TriggerMode::OnStart && !m_auto_triggered;
    }
    void mark_auto_triggered() { m_auto_triggered = true; }

private:
    struct LoopState {
        size_t index = 0;
        double next_time = 0.0;
    };

    TriggerMode m_trigger_mode = TriggerMode::OnStart;
    std::vector<ScheduledSound> m_sounds;
    bool m_single_use = false;
    float m_cooldown = 0.0f;

    // Playback state
    bool m_playing = false;
    bool m_has_triggered = false;
    bool m_auto_triggered = false;
    double m_last_trigger_time = 0.0;

    std::vector<size_t> m_sequence;     // Indices of non-looping sounds
    size_t m_sequence_pos = 0;
    double m_sequence_next_time = 0.0;
    std::vector<LoopState> m_loops;
};

} // namespace sonance::acoustics
