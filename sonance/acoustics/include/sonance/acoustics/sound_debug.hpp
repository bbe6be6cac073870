#pragma once

#include <sonance/acoustics/sound_events.hpp>
#include <sonance/core/event_dispatcher.hpp>
#include <cstddef>
#include <optional>
#include <unordered_map>

namespace sonance::acoustics {

struct ListenerCheckRecord {
    double time = 0.0;
    float loudness = 0.0f;
    float quality = 0.0f;
    bool heard = false;
    scene::Entity source = scene::NullEntity;
};

struct EmissionDebugRecord {
    double time = 0.0;
    Vec3 origin{0.0f};
    float radius = 0.0f;
    float loudness = 0.0f;
};

// Keeps the latest check per listener and the latest emission per source
// for debug overlays. Subscribes on construction, detaches on destruction.
class SoundDebugRecorder {
public:
    explicit SoundDebugRecorder(core::EventDispatcher& events, bool log_checks = false);

    SoundDebugRecorder(const SoundDebugRecorder&) = delete;
    SoundDebugRecorder& operator=(const SoundDebugRecorder&) = delete;

    std::optional<ListenerCheckRecord> last_check(scene::Entity listener) const;
    std::optional<EmissionDebugRecord> last_emission(scene::Entity source) const;

    size_t check_count() const { return m_check_count; }
    size_t emission_count() const { return m_emission_count; }

    void set_log_checks(bool enabled) { m_log_checks = enabled; }
    void clear();

private:
    void on_emitted(const SoundEmittedEvent& event);
    void on_checked(const SoundCheckedEvent& event);

    std::unordered_map<scene::Entity, ListenerCheckRecord> m_checks;
    std::unordered_map<scene::Entity, EmissionDebugRecord> m_emissions;
    size_t m_check_count = 0;
    size_t m_emission_count = 0;
    bool m_log_checks = false;

    core::ScopedConnection m_emitted_connection;
    core::ScopedConnection m_checked_connection;
};

} // namespace sonance::acoustics
