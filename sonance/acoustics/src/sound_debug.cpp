#include <sonance/acoustics/sound_debug.hpp>
#include <sonance/core/log.hpp>
#include <cstdio>
#include <string>

namespace sonance::acoustics {

using namespace sonance::core;

SoundDebugRecorder::SoundDebugRecorder(EventDispatcher& events, bool log_checks)
    : m_log_checks(log_checks)
{
    m_emitted_connection = events.subscribe<SoundEmittedEvent>(
        [this](const SoundEmittedEvent& e) { on_emitted(e); });
    m_checked_connection = events.subscribe<SoundCheckedEvent>(
        [this](const SoundCheckedEvent& e) { on_checked(e); });
}

std::optional<ListenerCheckRecord> SoundDebugRecorder::last_check(scene::Entity listener) const {
    auto it = m_checks.find(listener);
    if (it == m_checks.end()) return std::nullopt;
    return it->second;
}

std::optional<EmissionDebugRecord> SoundDebugRecorder::last_emission(scene::Entity source) const {
    auto it = m_emissions.find(source);
    if (it == m_emissions.end()) return std::nullopt;
    return it->second;
}

void SoundDebugRecorder::clear() {
    m_checks.clear();
    m_emissions.clear();
    m_check_count = 0;
    m_emission_count = 0;
}

void SoundDebugRecorder::on_emitted(const SoundEmittedEvent& event) {
    EmissionDebugRecord& record = m_emissions[event.source];
    record.time = event.time;
    record.origin = event.origin;
    record.radius = event.radius;
    record.loudness = event.loudness;
    ++m_emission_count;
}

void SoundDebugRecorder::on_checked(const SoundCheckedEvent& event) {
    ListenerCheckRecord& record = m_checks[event.listener];
    record.time = event.time;
    record.loudness = event.loudness;
    record.quality = event.quality;
    record.heard = event.heard;
    record.source = event.source;
    ++m_check_count;

    if (m_log_checks) {
        char buffer[128];
        std::snprintf(buffer, sizeof(buffer), "Listener %u %s %.3f (q %.2f, %u walls)",
                      scene::entity_id(event.listener), event.heard ? "heard" : "checked",
                      event.loudness, event.quality, event.wall_count);
        log(LogLevel::Debug, "acoustics", std::string(buffer));
    }
}

} // namespace sonance::acoustics
