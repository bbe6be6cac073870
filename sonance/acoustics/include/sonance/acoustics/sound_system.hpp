#pragma once

#include <sonance/acoustics/sound_types.hpp>
#include <sonance/acoustics/sound_queries.hpp>
#include <sonance/acoustics/sound_math.hpp>
#include <cstddef>
#include <vector>

namespace sonance::core { class EventDispatcher; }
namespace sonance::scene { class World; }

namespace sonance::acoustics {

constexpr size_t DEFAULT_MAX_CANDIDATES = 256;
constexpr size_t MAX_CANDIDATES_LIMIT = 65536;

struct PropagationSettings {
    float min_radius = DEFAULT_MIN_RADIUS;
    float max_radius = DEFAULT_MAX_RADIUS;
    size_t max_candidates = DEFAULT_MAX_CANDIDATES;

    // When set, a listener on the emitting entity is not checked against
    // its own sounds
    bool skip_source_listener = false;

    // Throws std::invalid_argument unless 0 < min_radius < max_radius and
    // 0 < max_candidates <= MAX_CANDIDATES_LIMIT
    void validate() const;
};

// ============================================================================
// SoundSystem - emit, propagate, deliver
// ============================================================================
//
// Propagation is synchronous: every listener in range is checked before
// emit_sound returns. Single-threaded, driven by the host's update loop.
// Query failures drop the emission with a warning. A throwing reaction or
// event subscriber is logged and delivery continues.

class SoundSystem {
public:
    // queries and events must outlive the system; events may be null.
    // Throws std::invalid_argument on invalid settings.
    explicit SoundSystem(ISoundQueries& queries, core::EventDispatcher* events = nullptr,
                         const PropagationSettings& settings = {});

    SoundSystem(const SoundSystem&) = delete;
    SoundSystem& operator=(const SoundSystem&) = delete;

    // Emit with the emitter's default loudness and quality. Returns false if
    // the entity has no enabled SoundEmitter.
    bool emit_sound(scene::World& world, scene::Entity entity);
    bool emit_sound(scene::World& world, scene::Entity entity, float loudness, float quality);

    // Environmental sound with no emitter entity
    void emit_sound_at(scene::World& world, const Vec3& position, float loudness,
                       float quality = 0.0f, const ObstructionProfile& profile = {});

    void propagate(scene::World& world, const SoundEmission& emission);

    // Advance the clock and play due scheduled sounds and footsteps
    void update(scene::World& world, float dt);

    // Seconds since the system was created, advanced by update()
    double time() const { return m_time; }

    float radius_for(float loudness) const;

    // Throws std::invalid_argument on invalid settings
    void set_settings(const PropagationSettings& settings);
    const PropagationSettings& settings() const { return m_settings; }

    ISoundQueries& queries() { return m_queries; }

private:
    struct PendingEmission {
        scene::Entity entity = scene::NullEntity;
        float loudness = 0.0f;
        float quality = 0.0f;
    };

    void update_scheduled_emitters(scene::World& world);
    void update_movement_noise(scene::World& world, float dt);
    void flush_pending(scene::World& world);

    ISoundQueries& m_queries;
    core::EventDispatcher* m_events;
    PropagationSettings m_settings;
    double m_time = 0.0;

    // Reused across emissions
    std::vector<ListenerCandidate> m_candidates;
    std::vector<PendingEmission> m_pending;
};

} // namespace sonance::acoustics
