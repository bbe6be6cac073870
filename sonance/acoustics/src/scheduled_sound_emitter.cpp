#include <sonance/acoustics/scheduled_sound_emitter.hpp>
#include <sonance/core/log.hpp>
#include <algorithm>
#include <string>

namespace sonance::acoustics {

using namespace sonance::core;

void ScheduledSoundEmitter::add_sound(const ScheduledSound& sound) {
    ScheduledSound s = sound;
    s.delay = std::max(s.delay, 0.0f);
    s.repeat_interval = std::max(s.repeat_interval, MIN_REPEAT_INTERVAL);
    m_sounds.push_back(s);
}

void ScheduledSoundEmitter::clear_sounds() {
    stop();
    m_sounds.clear();
}

void ScheduledSoundEmitter::set_cooldown(float seconds) {
    m_cooldown = std::max(seconds, 0.0f);
}

bool ScheduledSoundEmitter::trigger(double now) {
    if (m_single_use && m_has_triggered) {
        log(LogLevel::Debug, "acoustics", "Scheduled emitter is single-use and already triggered");
        return false;
    }
    if (m_has_triggered && m_cooldown > 0.0f && now - m_last_trigger_time < m_cooldown) {
        log(LogLevel::Debug, "acoustics", "Scheduled emitter on cooldown");
        return false;
    }
    if (m_playing) {
        log(LogLevel::Debug, "acoustics", "Scheduled emitter already playing");
        return false;
    }
    if (m_sounds.empty()) {
        log(LogLevel::Warn, "acoustics", "Scheduled emitter has no sounds to play");
        return false;
    }

    m_has_triggered = true;
    m_last_trigger_time = now;
    m_playing = true;

    // A loop starts once every sequential sound listed before it has played,
    // then waits its own delay
    m_sequence.clear();
    m_loops.clear();
    double sequence_offset = 0.0;
    for (size_t i = 0; i < m_sounds.size(); ++i) {
        if (m_sounds[i].loop) {
            m_loops.push_back(LoopState{i, now + sequence_offset + m_sounds[i].delay});
        } else {
            m_sequence.push_back(i);
            sequence_offset += m_sounds[i].delay;
        }
    }

    m_sequence_pos = 0;
    if (!m_sequence.empty()) {
        m_sequence_next_time = now + m_sounds[m_sequence.front()].delay;
    }

    log(LogLevel::Debug, "acoustics",
        "Scheduled emitter triggered: " + std::to_string(m_sequence.size()) + " sequential, " +
        std::to_string(m_loops.size()) + " looping");
    return true;
}

void ScheduledSoundEmitter::stop() {
    m_playing = false;
    m_sequence.clear();
    m_sequence_pos = 0;
    m_loops.clear();
}

void ScheduledSoundEmitter::reset() {
    stop();
    m_has_triggered = false;
    m_last_trigger_time = 0.0;
}

void ScheduledSoundEmitter::advance(double now, std::vector<ScheduledSound>& due) {
    if (!m_playing) return;

    while (m_sequence_pos < m_sequence.size() && now >= m_sequence_next_time) {
        due.push_back(m_sounds[m_sequence[m_sequence_pos]]);
        ++m_sequence_pos;
        if (m_sequence_pos < m_sequence.size()) {
            m_sequence_next_time += m_sounds[m_sequence[m_sequence_pos]].delay;
        }
    }

    // At most one repeat per loop per update, a long frame does not burst
    for (auto& loop : m_loops) {
        if (now < loop.next_time) continue;
        const ScheduledSound& sound = m_sounds[loop.index];
        due.push_back(sound);
        loop.next_time += sound.repeat_interval;
        if (loop.next_time <= now) {
            loop.next_time = now + sound.repeat_interval;
        }
    }

    if (m_sequence_pos >= m_sequence.size() && m_loops.empty()) {
        m_playing = false;
    }
}

} // namespace sonance::acoustics
