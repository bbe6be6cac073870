#include <sonance/physics/physics_world.hpp>
#include <sonance/core/log.hpp>

namespace sonance::physics {

using namespace sonance::core;

// These are implemented in jolt_impl.cpp
extern void init_physics_impl(PhysicsWorld::Impl* impl, const PhysicsSettings& settings);
extern void shutdown_physics_impl(PhysicsWorld::Impl* impl);
extern bool is_initialized_impl(const PhysicsWorld::Impl* impl);
extern PhysicsBodyId create_body_impl(PhysicsWorld::Impl* impl, const BodySettings& settings);
extern void destroy_body_impl(PhysicsWorld::Impl* impl, PhysicsBodyId id);
extern bool is_valid_impl(const PhysicsWorld::Impl* impl, PhysicsBodyId id);
extern void set_position_impl(PhysicsWorld::Impl* impl, PhysicsBodyId id, const Vec3& pos);
extern Vec3 get_position_impl(const PhysicsWorld::Impl* impl, PhysicsBodyId id);
extern uint64_t get_user_data_impl(const PhysicsWorld::Impl* impl, PhysicsBodyId id);
extern uint16_t get_layer_impl(const PhysicsWorld::Impl* impl, PhysicsBodyId id);
extern void raycast_all_impl(const PhysicsWorld::Impl* impl, const Vec3& origin, const Vec3& dir,
                             float max_dist, LayerMask mask, std::vector<RaycastHit>& out_hits);
extern void overlap_sphere_impl(const PhysicsWorld::Impl* impl, const Vec3& center, float radius,
                                LayerMask mask, std::vector<PhysicsBodyId>& out_bodies);
extern uint32_t get_body_count_impl(const PhysicsWorld::Impl* impl);

// Constructor, destructor and moves are defined in jolt_impl.cpp where Impl is complete

void PhysicsWorld::init(const PhysicsSettings& settings) {
    if (is_initialized_impl(m_impl.get())) {
        log(LogLevel::Warn, "physics", "Physics world already initialized");
        return;
    }
    init_physics_impl(m_impl.get(), settings);
    log(LogLevel::Info, "physics", "Physics world initialized");
}

void PhysicsWorld::shutdown() {
    if (!is_initialized_impl(m_impl.get())) return;
    shutdown_physics_impl(m_impl.get());
    log(LogLevel::Info, "physics", "Physics world shutdown");
}

bool PhysicsWorld::is_initialized() const {
    return is_initialized_impl(m_impl.get());
}

PhysicsBodyId PhysicsWorld::create_body(const BodySettings& settings) {
    PhysicsBodyId id = create_body_impl(m_impl.get(), settings);
    if (!id.valid()) {
        log(LogLevel::Error, "physics", "Failed to create physics body");
    }
    return id;
}

void PhysicsWorld::destroy_body(PhysicsBodyId id) {
    destroy_body_impl(m_impl.get(), id);
}

bool PhysicsWorld::is_valid(PhysicsBodyId id) const {
    return is_valid_impl(m_impl.get(), id);
}

void PhysicsWorld::set_position(PhysicsBodyId id, const Vec3& pos) {
    set_position_impl(m_impl.get(), id, pos);
}

Vec3 PhysicsWorld::get_position(PhysicsBodyId id) const {
    return get_position_impl(m_impl.get(), id);
}

uint64_t PhysicsWorld::get_user_data(PhysicsBodyId id) const {
    return get_user_data_impl(m_impl.get(), id);
}

uint16_t PhysicsWorld::get_layer(PhysicsBodyId id) const {
    return get_layer_impl(m_impl.get(), id);
}

RaycastHit PhysicsWorld::raycast(const Vec3& origin, const Vec3& direction, float max_distance,
                                 LayerMask layer_mask) const {
    std::vector<RaycastHit> hits;
    raycast_all_impl(m_impl.get(), origin, direction, max_distance, layer_mask, hits);
    return hits.empty() ? RaycastHit{} : hits.front();
}

std::vector<RaycastHit> PhysicsWorld::raycast_all(const Vec3& origin, const Vec3& direction,
                                                  float max_distance, LayerMask layer_mask) const {
    std::vector<RaycastHit> hits;
    raycast_all_impl(m_impl.get(), origin, direction, max_distance, layer_mask, hits);
    return hits;
}

void PhysicsWorld::raycast_all(const Vec3& origin, const Vec3& direction, float max_distance,
                               std::vector<RaycastHit>& out_hits, LayerMask layer_mask) const {
    raycast_all_impl(m_impl.get(), origin, direction, max_distance, layer_mask, out_hits);
}

std::vector<PhysicsBodyId> PhysicsWorld::overlap_sphere(const Vec3& center, float radius,
                                                        LayerMask layer_mask) const {
    std::vector<PhysicsBodyId> bodies;
    overlap_sphere_impl(m_impl.get(), center, radius, layer_mask, bodies);
    return bodies;
}

void PhysicsWorld::overlap_sphere(const Vec3& center, float radius,
                                  std::vector<PhysicsBodyId>& out_bodies, LayerMask layer_mask) const {
    overlap_sphere_impl(m_impl.get(), center, radius, layer_mask, out_bodies);
}

uint32_t PhysicsWorld::get_body_count() const {
    return get_body_count_impl(m_impl.get());
}

} // namespace sonance::physics
