#pragma once

#include <sonance/acoustics/sound_queries.hpp>
#include <sonance/physics/physics_world.hpp>
#include <unordered_map>
#include <vector>

namespace sonance::scene { class World; }

namespace sonance::acoustics {

// Query backend on top of the physics world. Listeners become kinematic
// sensor spheres on the LISTENER layer whose user data is the entity, walls
// are whatever static geometry the host already put in the world.
class PhysicsSoundQueries final : public ISoundQueries {
public:
    static constexpr float DEFAULT_LISTENER_RADIUS = 0.5f;

    // The physics world must be initialized and outlive this object
    explicit PhysicsSoundQueries(physics::PhysicsWorld& physics,
                                 float listener_radius = DEFAULT_LISTENER_RADIUS);
    ~PhysicsSoundQueries();

    PhysicsSoundQueries(const PhysicsSoundQueries&) = delete;
    PhysicsSoundQueries& operator=(const PhysicsSoundQueries&) = delete;

    // Returns false if the body could not be created
    bool register_listener(const scene::World& world, scene::Entity entity);
    void unregister_listener(scene::Entity entity);
    bool is_registered(scene::Entity entity) const;
    size_t listener_count() const { return m_bodies.size(); }

    // Register new listeners, drop ones that lost their SoundListener and
    // move every body to its entity's current position
    void sync(const scene::World& world);

    // ISoundQueries
    void find_listeners_in_sphere(const Vec3& center, float radius,
                                  std::vector<ListenerCandidate>& out) const override;
    uint32_t count_obstructions(const Vec3& from, const Vec3& to, LayerMask mask) const override;

private:
    physics::PhysicsWorld& m_physics;
    float m_listener_radius;
    std::unordered_map<scene::Entity, physics::PhysicsBodyId> m_bodies;

    // Reused across queries
    mutable std::vector<physics::PhysicsBodyId> m_overlap_buffer;
    mutable std::vector<physics::RaycastHit> m_hit_buffer;
    std::vector<scene::Entity> m_stale;
};

} // namespace sonance::acoustics
