#include <sonance/acoustics/sound_system.hpp>
#include <sonance/acoustics/sound_emitter.hpp>
#include <sonance/acoustics/sound_listener.hpp>
#include <sonance/acoustics/sound_events.hpp>
#include <sonance/acoustics/scheduled_sound_emitter.hpp>
#include <sonance/acoustics/movement_noise.hpp>
#include <sonance/scene/world.hpp>
#include <sonance/scene/transform.hpp>
#include <sonance/core/event_dispatcher.hpp>
#include <sonance/core/log.hpp>
#include <algorithm>
#include <cmath>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace sonance::acoustics {

using namespace sonance::core;

namespace {

// Hands the shared candidate buffer to one propagate call and gives it back
// on every exit. A reaction that emits again gets a fresh buffer instead of
// clobbering the one being iterated.
class CandidateLease {
public:
    explicit CandidateLease(std::vector<ListenerCandidate>& owner)
        : m_owner(owner), m_buffer(std::move(owner)) {
        m_buffer.clear();
    }

    ~CandidateLease() {
        if (m_owner.capacity() < m_buffer.capacity()) {
            m_buffer.clear();
            m_owner = std::move(m_buffer);
        }
    }

    std::vector<ListenerCandidate>& buffer() { return m_buffer; }

private:
    std::vector<ListenerCandidate>& m_owner;
    std::vector<ListenerCandidate> m_buffer;
};

std::string describe(const scene::World& world, scene::Entity entity) {
    return entity == scene::NullEntity ? std::string("environment") : world.name_of(entity);
}

// Subscribers observe propagation; one that throws is logged and skipped
template<typename T>
void notify(EventDispatcher* events, const T& event, const char* name) {
    if (!events) return;
    try {
        events->dispatch(event);
    } catch (const std::exception& e) {
        log(LogLevel::Warn, "acoustics", std::string(name) + " subscriber threw: " + e.what());
    }
}

} // anonymous namespace

void PropagationSettings::validate() const {
    if (!(min_radius > 0.0f) || !(max_radius > min_radius)) {
        throw std::invalid_argument("PropagationSettings: need 0 < min_radius < max_radius, got " +
                                    std::to_string(min_radius) + " and " + std::to_string(max_radius));
    }
    if (max_candidates == 0 || max_candidates > MAX_CANDIDATES_LIMIT) {
        throw std::invalid_argument("PropagationSettings: max_candidates must be in [1, " +
                                    std::to_string(MAX_CANDIDATES_LIMIT) + "], got " +
                                    std::to_string(max_candidates));
    }
}

SoundSystem::SoundSystem(ISoundQueries& queries, EventDispatcher* events,
                         const PropagationSettings& settings)
    : m_queries(queries)
    , m_events(events)
    , m_settings(settings)
{
    m_settings.validate();
    m_candidates.reserve(m_settings.max_candidates);
}

void SoundSystem::set_settings(const PropagationSettings& settings) {
    settings.validate();
    m_settings = settings;
}

float SoundSystem::radius_for(float loudness) const {
    return hearing_radius(loudness, m_settings.min_radius, m_settings.max_radius);
}

// ============================================================================
// Emission
// ============================================================================

bool SoundSystem::emit_sound(scene::World& world, scene::Entity entity) {
    const auto* emitter = world.try_get<SoundEmitter>(entity);
    if (!emitter) {
        log(LogLevel::Warn, "acoustics", "emit_sound: '" + describe(world, entity) + "' has no SoundEmitter");
        return false;
    }
    return emit_sound(world, entity, emitter->default_loudness(), emitter->default_quality());
}

bool SoundSystem::emit_sound(scene::World& world, scene::Entity entity, float loudness, float quality) {
    auto* emitter = world.try_get<SoundEmitter>(entity);
    if (!emitter) {
        log(LogLevel::Warn, "acoustics", "emit_sound: '" + describe(world, entity) + "' has no SoundEmitter");
        return false;
    }
    if (!emitter->enabled()) return false;

    float clamped = std::isnan(loudness) ? 0.0f : saturate(loudness);
    emitter->record_emission(clamped, quality, m_time);

    SoundEmission emission;
    emission.origin = scene::get_world_position(world, entity) +
                      scene::rotate_offset(world, entity, emitter->emit_offset());
    emission.velocity = scene::get_velocity(world, entity);
    emission.loudness = clamped;
    emission.quality = quality;
    emission.obstruction_mask = emitter->obstruction_mask();
    emission.wall_penalty = emitter->wall_penalty();
    emission.source = entity;

    propagate(world, emission);
    return true;
}

void SoundSystem::emit_sound_at(scene::World& world, const Vec3& position, float loudness,
                                float quality, const ObstructionProfile& profile) {
    SoundEmission emission;
    emission.origin = position;
    emission.loudness = loudness;
    emission.quality = quality;
    emission.obstruction_mask = profile.mask;
    emission.wall_penalty = profile.wall_penalty;
    propagate(world, emission);
}

// ============================================================================
// Propagation
// ============================================================================

void SoundSystem::propagate(scene::World& world, const SoundEmission& emission) {
    if (!(emission.loudness > 0.0f)) return;

    const float loudness = saturate(emission.loudness);
    const float radius = radius_for(loudness);
    const float wall_penalty = saturate(emission.wall_penalty);

    CandidateLease lease(m_candidates);
    auto& candidates = lease.buffer();

    try {
        m_queries.find_listeners_in_sphere(emission.origin, radius, candidates);
    } catch (const std::exception& e) {
        log(LogLevel::Warn, "acoustics",
            "Listener query failed, sound from '" + describe(world, emission.source) + "' dropped: " + e.what());
        return;
    }

    if (candidates.size() > m_settings.max_candidates) {
        log(LogLevel::Debug, "acoustics",
            std::to_string(candidates.size() - m_settings.max_candidates) +
            " listeners beyond the candidate limit were skipped");
        candidates.resize(m_settings.max_candidates);
    }

    if (m_events) {
        SoundEmittedEvent event;
        event.source = emission.source;
        event.origin = emission.origin;
        event.radius = radius;
        event.loudness = loudness;
        event.quality = emission.quality;
        event.time = m_time;
        notify(m_events, event, "SoundEmittedEvent");
    }

    for (const auto& candidate : candidates) {
        if (m_settings.skip_source_listener && candidate.entity == emission.source) continue;
        if (!world.valid(candidate.entity)) continue;

        auto* listener = world.try_get<SoundListener>(candidate.entity);
        if (!listener || !listener->enabled()) continue;

        const float distance = glm::length(candidate.position - emission.origin);
        if (distance > radius) continue;

        float heard = loudness * distance_falloff(distance, radius);
        if (heard <= 0.0f) continue;

        uint32_t walls = 0;
        try {
            walls = m_queries.count_obstructions(emission.origin, candidate.position, emission.obstruction_mask);
        } catch (const std::exception& e) {
            log(LogLevel::Warn, "acoustics",
                "Obstruction query failed, sound from '" + describe(world, emission.source) + "' dropped: " + e.what());
            return;
        }
        heard *= obstruction_attenuation(wall_penalty, walls);
        if (heard <= 0.0f) continue;

        HeardSound sound;
        sound.loudness = heard;
        sound.source_position = emission.origin;
        sound.quality = emission.quality;
        sound.source_velocity = emission.velocity;
        sound.source = emission.source;
        sound.listener = candidate.entity;

        bool fired = false;
        try {
            fired = listener->check_sound(sound);
        } catch (const std::exception& e) {
            log(LogLevel::Warn, "acoustics",
                "Reaction of '" + world.name_of(candidate.entity) + "' threw: " + e.what());
        }

        if (m_events) {
            SoundCheckedEvent checked;
            checked.listener = candidate.entity;
            checked.source = emission.source;
            checked.source_position = emission.origin;
            checked.loudness = heard;
            checked.quality = emission.quality;
            checked.wall_count = walls;
            checked.heard = fired;
            checked.time = m_time;
            notify(m_events, checked, "SoundCheckedEvent");

            if (fired) {
                notify(m_events, SoundHeardEvent{sound, m_time}, "SoundHeardEvent");
            }
        }
    }
}

// ============================================================================
// Update
// ============================================================================

void SoundSystem::update(scene::World& world, float dt) {
    // Time never runs backwards
    dt = std::max(dt, 0.0f);
    m_time += dt;

    update_scheduled_emitters(world);
    update_movement_noise(world, dt);
}

void SoundSystem::update_scheduled_emitters(scene::World& world) {
    std::vector<ScheduledSound> due;

    auto view = world.view<ScheduledSoundEmitter>();
    for (auto entity : view) {
        auto& scheduled = view.get<ScheduledSoundEmitter>(entity);

        if (scheduled.wants_auto_trigger()) {
            scheduled.mark_auto_triggered();
            scheduled.trigger(m_time);
        }

        due.clear();
        scheduled.advance(m_time, due);
        for (const auto& sound : due) {
            m_pending.push_back(PendingEmission{entity, sound.loudness, sound.quality});
        }
    }

    flush_pending(world);
}

void SoundSystem::update_movement_noise(scene::World& world, float dt) {
    std::vector<float> noises;

    auto view = world.view<MovementNoiseComponent>();
    for (auto entity : view) {
        auto& movement = view.get<MovementNoiseComponent>(entity);

        noises.clear();
        movement.advance(dt, noises);
        for (float loudness : noises) {
            m_pending.push_back(PendingEmission{entity, loudness, movement.quality});
        }
    }

    flush_pending(world);
}

void SoundSystem::flush_pending(scene::World& world) {
    // Emitting runs reactions, which may touch the world, so it happens
    // after iteration
    std::vector<PendingEmission> pending;
    pending.swap(m_pending);

    for (const auto& p : pending) {
        if (!world.valid(p.entity)) continue;
        if (!world.has<SoundEmitter>(p.entity)) {
            world.emplace<SoundEmitter>(p.entity);
        }
        emit_sound(world, p.entity, p.loudness, p.quality);
    }

    pending.clear();
    if (m_pending.empty()) {
        m_pending.swap(pending);
    }
}

} // namespace sonance::acoustics
