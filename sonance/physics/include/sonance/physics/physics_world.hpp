#pragma once

#include <sonance/physics/body.hpp>
#include <sonance/physics/shapes.hpp>
#include <sonance/physics/layers.hpp>
#include <memory>
#include <vector>

namespace sonance::physics {

// Raycast hit result
struct RaycastHit {
    PhysicsBodyId body;
    Vec3 point{0.0f};
    Vec3 normal{0.0f};
    float distance = 0.0f;
    bool hit = false;
};

struct PhysicsSettings {
    uint32_t max_bodies = 65536;
    uint32_t max_body_pairs = 65536;
    uint32_t max_contact_constraints = 10240;
};

// Physics world - owns the collision broad phase used for scene queries.
// Simulation stepping belongs to the host's movement code, this world is
// only kept in sync (set_position) and queried.
class PhysicsWorld {
public:
    struct Impl;

    PhysicsWorld();
    ~PhysicsWorld();

    // Non-copyable
    PhysicsWorld(const PhysicsWorld&) = delete;
    PhysicsWorld& operator=(const PhysicsWorld&) = delete;

    // Movable
    PhysicsWorld(PhysicsWorld&&) noexcept;
    PhysicsWorld& operator=(PhysicsWorld&&) noexcept;

    // Initialization
    void init(const PhysicsSettings& settings = {});
    void shutdown();
    bool is_initialized() const;

    // Body management
    PhysicsBodyId create_body(const BodySettings& settings);
    void destroy_body(PhysicsBodyId id);
    bool is_valid(PhysicsBodyId id) const;

    // Body transform
    void set_position(PhysicsBodyId id, const Vec3& pos);
    Vec3 get_position(PhysicsBodyId id) const;

    uint64_t get_user_data(PhysicsBodyId id) const;
    uint16_t get_layer(PhysicsBodyId id) const;

    // Queries. Ray casts ignore sensor bodies and only consider layers in
    // layer_mask; each body is reported once, nearest first.
    RaycastHit raycast(const Vec3& origin, const Vec3& direction, float max_distance,
                       LayerMask layer_mask = ALL_LAYERS) const;
    std::vector<RaycastHit> raycast_all(const Vec3& origin, const Vec3& direction,
                                        float max_distance, LayerMask layer_mask = ALL_LAYERS) const;
    // Buffer variant, clears out_hits and reuses its capacity
    void raycast_all(const Vec3& origin, const Vec3& direction, float max_distance,
                     std::vector<RaycastHit>& out_hits, LayerMask layer_mask = ALL_LAYERS) const;

    // Broad phase sphere overlap: every body whose bounds touch the sphere,
    // sensors included. Results are conservative.
    std::vector<PhysicsBodyId> overlap_sphere(const Vec3& center, float radius,
                                              LayerMask layer_mask = ALL_LAYERS) const;
    void overlap_sphere(const Vec3& center, float radius, std::vector<PhysicsBodyId>& out_bodies,
                        LayerMask layer_mask = ALL_LAYERS) const;

    // Statistics
    uint32_t get_body_count() const;

private:
    std::unique_ptr<Impl> m_impl;
};

} // namespace sonance::physics
