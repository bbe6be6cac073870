// Jolt Physics implementation
// This file contains all Jolt-specific code to isolate it from the public API

#include <sonance/physics/physics_world.hpp>
#include <sonance/core/log.hpp>

// Jolt includes
#include <Jolt/Jolt.h>
#include <Jolt/RegisterTypes.h>
#include <Jolt/Core/Factory.h>
#include <Jolt/Physics/PhysicsSettings.h>
#include <Jolt/Physics/PhysicsSystem.h>
#include <Jolt/Physics/Collision/Shape/BoxShape.h>
#include <Jolt/Physics/Collision/Shape/SphereShape.h>
#include <Jolt/Physics/Collision/Shape/CapsuleShape.h>
#include <Jolt/Physics/Collision/RayCast.h>
#include <Jolt/Physics/Collision/CastResult.h>
#include <Jolt/Physics/Collision/CollisionCollectorImpl.h>
#include <Jolt/Physics/Collision/NarrowPhaseQuery.h>
#include <Jolt/Physics/Collision/BroadPhase/BroadPhaseQuery.h>
#include <Jolt/Physics/Collision/ObjectLayer.h>
#include <Jolt/Physics/Body/Body.h>
#include <Jolt/Physics/Body/BodyFilter.h>
#include <Jolt/Physics/Body/BodyLock.h>
#include <Jolt/Physics/Body/BodyCreationSettings.h>

#include <algorithm>
#include <unordered_map>

namespace sonance::physics {

using namespace sonance::core;

namespace {

// Jolt's allocator and type factory are process-wide; the first world sets
// them up and the last one tears them down.
int s_jolt_users = 0;

void acquire_jolt() {
    if (s_jolt_users++ == 0) {
        JPH::RegisterDefaultAllocator();
        JPH::Factory::sInstance = new JPH::Factory();
        JPH::RegisterTypes();
    }
}

void release_jolt() {
    if (s_jolt_users > 0 && --s_jolt_users == 0) {
        JPH::UnregisterTypes();
        delete JPH::Factory::sInstance;
        JPH::Factory::sInstance = nullptr;
    }
}

// Broad phase layer implementation
namespace BroadPhaseLayers {
    static constexpr JPH::BroadPhaseLayer NON_MOVING(0);
    static constexpr JPH::BroadPhaseLayer MOVING(1);
    static constexpr JPH::uint NUM_LAYERS(2);
}

bool is_non_moving_layer(JPH::ObjectLayer layer) {
    return layer == layers::STATIC || layer == layers::WALL;
}

class BPLayerInterfaceImpl final : public JPH::BroadPhaseLayerInterface {
public:
    JPH::uint GetNumBroadPhaseLayers() const override { return BroadPhaseLayers::NUM_LAYERS; }

    JPH::BroadPhaseLayer GetBroadPhaseLayer(JPH::ObjectLayer layer) const override {
        return is_non_moving_layer(layer) ? BroadPhaseLayers::NON_MOVING : BroadPhaseLayers::MOVING;
    }

#if defined(JPH_EXTERNAL_PROFILE) || defined(JPH_PROFILE_ENABLED)
    const char* GetBroadPhaseLayerName(JPH::BroadPhaseLayer layer) const override {
        switch ((JPH::BroadPhaseLayer::Type)layer) {
            case (JPH::BroadPhaseLayer::Type)BroadPhaseLayers::NON_MOVING: return "NON_MOVING";
            case (JPH::BroadPhaseLayer::Type)BroadPhaseLayers::MOVING: return "MOVING";
            default: return "UNKNOWN";
        }
    }
#endif
};

class ObjectVsBroadPhaseLayerFilterImpl final : public JPH::ObjectVsBroadPhaseLayerFilter {
public:
    bool ShouldCollide(JPH::ObjectLayer layer1, JPH::BroadPhaseLayer layer2) const override {
        if (is_non_moving_layer(layer1)) return layer2 == BroadPhaseLayers::MOVING;
        return true;
    }
};

class ObjectLayerPairFilterImpl final : public JPH::ObjectLayerPairFilter {
public:
    explicit ObjectLayerPairFilterImpl(const CollisionFilter& filter) : m_filter(filter) {}

    bool ShouldCollide(JPH::ObjectLayer obj1, JPH::ObjectLayer obj2) const override {
        return m_filter.should_collide(obj1, obj2);
    }

private:
    const CollisionFilter& m_filter;
};

// Query filter: accept only object layers present in a mask
class LayerMaskObjectFilter final : public JPH::ObjectLayerFilter {
public:
    explicit LayerMaskObjectFilter(LayerMask mask) : m_mask(mask) {}

    bool ShouldCollide(JPH::ObjectLayer layer) const override {
        return layer < layers::MAX_LAYERS && mask_contains(m_mask, static_cast<uint16_t>(layer));
    }

private:
    LayerMask m_mask;
};

// Query filter: triggers and hearing volumes never block a ray
class IgnoreSensorsBodyFilter final : public JPH::BodyFilter {
public:
    bool ShouldCollideLocked(const JPH::Body& body) const override {
        return !body.IsSensor();
    }
};

Vec3 to_vec3(JPH::RVec3Arg v) {
    return Vec3{static_cast<float>(v.GetX()), static_cast<float>(v.GetY()), static_cast<float>(v.GetZ())};
}

} // anonymous namespace

struct BodyRecord {
    JPH::BodyID body_id;
    uint64_t user_data = 0;
    uint16_t layer = layers::STATIC;
};

// Physics world implementation
struct PhysicsWorld::Impl {
    CollisionFilter collision_filter;

    BPLayerInterfaceImpl broad_phase_layer_interface;
    ObjectVsBroadPhaseLayerFilterImpl object_vs_broadphase_filter;
    ObjectLayerPairFilterImpl object_layer_pair_filter{collision_filter};

    std::unique_ptr<JPH::PhysicsSystem> physics_system;

    std::unordered_map<uint32_t, BodyRecord> body_map;
    uint32_t next_body_id = 1;

    bool initialized = false;
};

void shutdown_physics_impl(PhysicsWorld::Impl* impl);

// Constructor, destructor and move operations must be defined here where Impl is complete
PhysicsWorld::PhysicsWorld()
    : m_impl(std::make_unique<Impl>())
{
    acquire_jolt();
}

PhysicsWorld::~PhysicsWorld() {
    if (m_impl) {
        shutdown_physics_impl(m_impl.get());
        m_impl.reset();
        release_jolt();
    }
}

PhysicsWorld::PhysicsWorld(PhysicsWorld&&) noexcept = default;

PhysicsWorld& PhysicsWorld::operator=(PhysicsWorld&& other) noexcept {
    if (this != &other) {
        if (m_impl) {
            shutdown_physics_impl(m_impl.get());
            m_impl.reset();
            release_jolt();
        }
        m_impl = std::move(other.m_impl);
    }
    return *this;
}

// Implementation functions

void init_physics_impl(PhysicsWorld::Impl* impl, const PhysicsSettings& settings) {
    if (!impl || impl->initialized) return;

    const JPH::uint num_body_mutexes = 0;  // Jolt picks a default

    impl->physics_system = std::make_unique<JPH::PhysicsSystem>();
    impl->physics_system->Init(
        settings.max_bodies, num_body_mutexes, settings.max_body_pairs,
        settings.max_contact_constraints,
        impl->broad_phase_layer_interface,
        impl->object_vs_broadphase_filter,
        impl->object_layer_pair_filter
    );

    impl->initialized = true;
}

void shutdown_physics_impl(PhysicsWorld::Impl* impl) {
    if (!impl || !impl->initialized) return;

    JPH::BodyInterface& body_interface = impl->physics_system->GetBodyInterface();
    for (const auto& [id, record] : impl->body_map) {
        body_interface.RemoveBody(record.body_id);
        body_interface.DestroyBody(record.body_id);
    }

    impl->body_map.clear();
    impl->physics_system.reset();
    impl->initialized = false;
}

bool is_initialized_impl(const PhysicsWorld::Impl* impl) {
    return impl && impl->initialized;
}

PhysicsBodyId create_body_impl(PhysicsWorld::Impl* impl, const BodySettings& settings) {
    if (!impl || !impl->initialized) return PhysicsBodyId{};
    if (settings.layer >= layers::MAX_LAYERS) return PhysicsBodyId{};

    // Create shape based on settings
    JPH::RefConst<JPH::Shape> shape;

    if (settings.shape) {
        switch (settings.shape->type) {
            case ShapeType::Box: {
                const auto* box = static_cast<const BoxShapeSettings*>(settings.shape);
                Vec3 half = glm::max(box->half_extents, Vec3{0.001f});
                float convex_radius = std::min(JPH::cDefaultConvexRadius,
                                               std::min(half.x, std::min(half.y, half.z)));
                shape = new JPH::BoxShape(JPH::Vec3(half.x, half.y, half.z), convex_radius);
                break;
            }
            case ShapeType::Sphere: {
                const auto* sphere = static_cast<const SphereShapeSettings*>(settings.shape);
                shape = new JPH::SphereShape(std::max(sphere->radius, 0.001f));
                break;
            }
            case ShapeType::Capsule: {
                const auto* capsule = static_cast<const CapsuleShapeSettings*>(settings.shape);
                shape = new JPH::CapsuleShape(std::max(capsule->half_height, 0.001f),
                                              std::max(capsule->radius, 0.001f));
                break;
            }
        }
    } else {
        shape = new JPH::BoxShape(JPH::Vec3(0.5f, 0.5f, 0.5f));
    }

    // Determine motion type
    JPH::EMotionType motion_type;
    JPH::EActivation activation = JPH::EActivation::Activate;
    switch (settings.type) {
        case BodyType::Static:
            motion_type = JPH::EMotionType::Static;
            activation = JPH::EActivation::DontActivate;
            break;
        case BodyType::Kinematic:
            motion_type = JPH::EMotionType::Kinematic;
            break;
        case BodyType::Dynamic:
        default:
            motion_type = JPH::EMotionType::Dynamic;
            break;
    }

    PhysicsBodyId id{impl->next_body_id++};

    JPH::BodyCreationSettings body_settings(
        shape,
        JPH::RVec3(settings.position.x, settings.position.y, settings.position.z),
        JPH::Quat(settings.rotation.x, settings.rotation.y, settings.rotation.z, settings.rotation.w),
        motion_type,
        static_cast<JPH::ObjectLayer>(settings.layer)
    );
    body_settings.mIsSensor = settings.is_sensor;
    body_settings.mUserData = id.id;

    JPH::BodyInterface& body_interface = impl->physics_system->GetBodyInterface();
    JPH::BodyID body_id = body_interface.CreateAndAddBody(body_settings, activation);
    if (body_id.IsInvalid()) {
        return PhysicsBodyId{};
    }

    impl->body_map[id.id] = BodyRecord{body_id, settings.user_data, settings.layer};
    return id;
}

void destroy_body_impl(PhysicsWorld::Impl* impl, PhysicsBodyId id) {
    if (!impl || !impl->initialized) return;

    auto it = impl->body_map.find(id.id);
    if (it == impl->body_map.end()) return;

    JPH::BodyInterface& body_interface = impl->physics_system->GetBodyInterface();
    body_interface.RemoveBody(it->second.body_id);
    body_interface.DestroyBody(it->second.body_id);

    impl->body_map.erase(it);
}

bool is_valid_impl(const PhysicsWorld::Impl* impl, PhysicsBodyId id) {
    if (!impl) return false;
    return impl->body_map.find(id.id) != impl->body_map.end();
}

void set_position_impl(PhysicsWorld::Impl* impl, PhysicsBodyId id, const Vec3& pos) {
    if (!impl || !impl->initialized) return;
    auto it = impl->body_map.find(id.id);
    if (it == impl->body_map.end()) return;

    JPH::BodyInterface& body_interface = impl->physics_system->GetBodyInterface();
    body_interface.SetPosition(it->second.body_id, JPH::RVec3(pos.x, pos.y, pos.z),
                               JPH::EActivation::DontActivate);
}

Vec3 get_position_impl(const PhysicsWorld::Impl* impl, PhysicsBodyId id) {
    if (!impl || !impl->initialized) return Vec3{0.0f};
    auto it = impl->body_map.find(id.id);
    if (it == impl->body_map.end()) return Vec3{0.0f};

    const JPH::BodyInterface& body_interface = impl->physics_system->GetBodyInterface();
    return to_vec3(body_interface.GetPosition(it->second.body_id));
}

uint64_t get_user_data_impl(const PhysicsWorld::Impl* impl, PhysicsBodyId id) {
    if (!impl) return 0;
    auto it = impl->body_map.find(id.id);
    return it != impl->body_map.end() ? it->second.user_data : 0;
}

uint16_t get_layer_impl(const PhysicsWorld::Impl* impl, PhysicsBodyId id) {
    if (!impl) return layers::STATIC;
    auto it = impl->body_map.find(id.id);
    return it != impl->body_map.end() ? it->second.layer : layers::STATIC;
}

void raycast_all_impl(const PhysicsWorld::Impl* impl, const Vec3& origin, const Vec3& dir,
                      float max_dist, LayerMask mask, std::vector<RaycastHit>& out_hits) {
    out_hits.clear();
    if (!impl || !impl->initialized || max_dist <= 0.0f || mask == NO_LAYERS) return;

    float len = glm::length(dir);
    if (len < 1e-6f) return;
    Vec3 step = (dir / len) * max_dist;

    JPH::RRayCast ray{JPH::RVec3(origin.x, origin.y, origin.z), JPH::Vec3(step.x, step.y, step.z)};
    JPH::RayCastSettings ray_settings;
    ray_settings.mTreatConvexAsSolid = true;

    JPH::AllHitCollisionCollector<JPH::CastRayCollector> collector;
    JPH::BroadPhaseLayerFilter broad_phase_filter;
    LayerMaskObjectFilter layer_filter(mask);
    IgnoreSensorsBodyFilter body_filter;

    impl->physics_system->GetNarrowPhaseQuery().CastRay(
        ray, ray_settings, collector, broad_phase_filter, layer_filter, body_filter);

    if (!collector.HadHit()) return;
    collector.Sort();

    const JPH::BodyInterface& body_interface = impl->physics_system->GetBodyInterface();
    const JPH::BodyLockInterface& lock_interface = impl->physics_system->GetBodyLockInterface();

    for (const JPH::RayCastResult& result : collector.mHits) {
        PhysicsBodyId body{static_cast<uint32_t>(body_interface.GetUserData(result.mBodyID))};

        // Mesh shapes can report several faces of one body, keep the nearest
        bool seen = std::any_of(out_hits.begin(), out_hits.end(),
            [&body](const RaycastHit& h) { return h.body == body; });
        if (seen) continue;

        JPH::RVec3 point = ray.GetPointOnRay(result.mFraction);

        RaycastHit hit;
        hit.body = body;
        hit.hit = true;
        hit.distance = result.mFraction * max_dist;
        hit.point = to_vec3(point);

        JPH::BodyLockRead lock(lock_interface, result.mBodyID);
        if (lock.Succeeded()) {
            JPH::Vec3 normal = lock.GetBody().GetWorldSpaceSurfaceNormal(result.mSubShapeID2, point);
            hit.normal = Vec3{normal.GetX(), normal.GetY(), normal.GetZ()};
        }

        out_hits.push_back(hit);
    }
}

void overlap_sphere_impl(const PhysicsWorld::Impl* impl, const Vec3& center, float radius,
                         LayerMask mask, std::vector<PhysicsBodyId>& out_bodies) {
    out_bodies.clear();
    if (!impl || !impl->initialized || radius <= 0.0f || mask == NO_LAYERS) return;

    JPH::AllHitCollisionCollector<JPH::CollideShapeBodyCollector> collector;
    JPH::BroadPhaseLayerFilter broad_phase_filter;
    LayerMaskObjectFilter layer_filter(mask);

    impl->physics_system->GetBroadPhaseQuery().CollideSphere(
        JPH::Vec3(center.x, center.y, center.z), radius, collector, broad_phase_filter, layer_filter);

    const JPH::BodyInterface& body_interface = impl->physics_system->GetBodyInterface();
    for (const JPH::BodyID& body_id : collector.mHits) {
        out_bodies.push_back(PhysicsBodyId{static_cast<uint32_t>(body_interface.GetUserData(body_id))});
    }
}

uint32_t get_body_count_impl(const PhysicsWorld::Impl* impl) {
    if (!impl) return 0;
    return static_cast<uint32_t>(impl->body_map.size());
}

} // namespace sonance::physics
