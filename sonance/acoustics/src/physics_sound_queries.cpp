#include <sonance/acoustics/physics_sound_queries.hpp>
#include <sonance/acoustics/sound_listener.hpp>
#include <sonance/scene/world.hpp>
#include <sonance/scene/transform.hpp>
#include <sonance/core/log.hpp>
#include <string>

namespace sonance::acoustics {

using namespace sonance::core;

namespace {

uint64_t to_user_data(scene::Entity entity) {
    return static_cast<uint64_t>(entt::to_integral(entity));
}

scene::Entity from_user_data(uint64_t user_data) {
    return static_cast<scene::Entity>(static_cast<entt::id_type>(user_data));
}

constexpr LayerMask LISTENER_MASK = physics::make_mask({physics::layers::LISTENER});

} // anonymous namespace

PhysicsSoundQueries::PhysicsSoundQueries(physics::PhysicsWorld& physics, float listener_radius)
    : m_physics(physics)
    , m_listener_radius(listener_radius > 0.0f ? listener_radius : DEFAULT_LISTENER_RADIUS)
{
    if (!m_physics.is_initialized()) {
        log(LogLevel::Warn, "acoustics", "PhysicsSoundQueries created on an uninitialized physics world");
    }
}

PhysicsSoundQueries::~PhysicsSoundQueries() {
    for (const auto& [entity, body] : m_bodies) {
        m_physics.destroy_body(body);
    }
}

bool PhysicsSoundQueries::register_listener(const scene::World& world, scene::Entity entity) {
    if (is_registered(entity)) return true;

    physics::SphereShapeSettings sphere{m_listener_radius};

    physics::BodySettings settings;
    settings.type = physics::BodyType::Kinematic;
    settings.shape = &sphere;
    settings.position = scene::get_world_position(world, entity);
    settings.layer = physics::layers::LISTENER;
    settings.is_sensor = true;
    settings.user_data = to_user_data(entity);

    physics::PhysicsBodyId body = m_physics.create_body(settings);
    if (!body.valid()) {
        log(LogLevel::Error, "acoustics",
            "Failed to create hearing volume for '" + world.name_of(entity) + "'");
        return false;
    }

    m_bodies.emplace(entity, body);
    return true;
}

void PhysicsSoundQueries::unregister_listener(scene::Entity entity) {
    auto it = m_bodies.find(entity);
    if (it == m_bodies.end()) return;
    m_physics.destroy_body(it->second);
    m_bodies.erase(it);
}

bool PhysicsSoundQueries::is_registered(scene::Entity entity) const {
    return m_bodies.find(entity) != m_bodies.end();
}

void PhysicsSoundQueries::sync(const scene::World& world) {
    m_stale.clear();
    for (const auto& [entity, body] : m_bodies) {
        if (!world.valid(entity) || !world.has<SoundListener>(entity)) {
            m_stale.push_back(entity);
        }
    }
    for (scene::Entity entity : m_stale) {
        unregister_listener(entity);
    }

    auto view = world.view<SoundListener>();
    for (auto entity : view) {
        auto it = m_bodies.find(entity);
        if (it == m_bodies.end()) {
            register_listener(world, entity);
        } else {
            m_physics.set_position(it->second, scene::get_world_position(world, entity));
        }
    }
}

void PhysicsSoundQueries::find_listeners_in_sphere(const Vec3& center, float radius,
                                                   std::vector<ListenerCandidate>& out) const {
    m_physics.overlap_sphere(center, radius, m_overlap_buffer, LISTENER_MASK);

    for (const auto& body : m_overlap_buffer) {
        ListenerCandidate candidate;
        candidate.entity = from_user_data(m_physics.get_user_data(body));
        candidate.position = m_physics.get_position(body);
        out.push_back(candidate);
    }
}

uint32_t PhysicsSoundQueries::count_obstructions(const Vec3& from, const Vec3& to, LayerMask mask) const {
    Vec3 delta = to - from;
    float distance = glm::length(delta);
    if (distance < 1e-6f) return 0;

    m_physics.raycast_all(from, delta / distance, distance, m_hit_buffer, mask);
    return static_cast<uint32_t>(m_hit_buffer.size());
}

} // namespace sonance::acoustics
