#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <sonance/physics/physics_world.hpp>
#include <algorithm>

using namespace sonance::physics;
using namespace sonance::core;
using Catch::Matchers::WithinAbs;

namespace {

PhysicsBodyId add_wall(PhysicsWorld& world, const Vec3& position, uint16_t layer = layers::WALL) {
    BoxShapeSettings box{Vec3{0.1f, 2.0f, 2.0f}};
    BodySettings settings;
    settings.shape = &box;
    settings.position = position;
    settings.layer = layer;
    return world.create_body(settings);
}

PhysicsBodyId add_listener(PhysicsWorld& world, const Vec3& position, uint64_t user_data) {
    SphereShapeSettings sphere{0.5f};
    BodySettings settings;
    settings.type = BodyType::Kinematic;
    settings.shape = &sphere;
    settings.position = position;
    settings.layer = layers::LISTENER;
    settings.is_sensor = true;
    settings.user_data = user_data;
    return world.create_body(settings);
}

} // namespace

TEST_CASE("RaycastHit defaults", "[physics][world]") {
    RaycastHit hit;

    REQUIRE_FALSE(hit.body.valid());
    REQUIRE_THAT(hit.distance, WithinAbs(0.0f, 0.001f));
    REQUIRE(hit.hit == false);
}

TEST_CASE("BodySettings defaults", "[physics][body]") {
    BodySettings settings;

    REQUIRE(settings.type == BodyType::Static);
    REQUIRE(settings.shape == nullptr);
    REQUIRE(settings.layer == layers::STATIC);
    REQUIRE_FALSE(settings.is_sensor);
    REQUIRE(settings.user_data == 0);
    REQUIRE_THAT(settings.rotation.w, WithinAbs(1.0f, 0.001f));
}

TEST_CASE("PhysicsWorld lifecycle", "[physics][world]") {
    PhysicsWorld world;
    REQUIRE_FALSE(world.is_initialized());

    SECTION("Bodies cannot be created before init") {
        SphereShapeSettings sphere;
        BodySettings settings;
        settings.shape = &sphere;
        REQUIRE_FALSE(world.create_body(settings).valid());
    }

    SECTION("Init and shutdown") {
        world.init();
        REQUIRE(world.is_initialized());

        PhysicsBodyId wall = add_wall(world, Vec3{0.0f});
        REQUIRE(wall.valid());
        REQUIRE(world.is_valid(wall));
        REQUIRE(world.get_body_count() == 1);
        REQUIRE(world.get_layer(wall) == layers::WALL);

        world.destroy_body(wall);
        REQUIRE_FALSE(world.is_valid(wall));
        REQUIRE(world.get_body_count() == 0);

        world.shutdown();
        REQUIRE_FALSE(world.is_initialized());
    }
}

TEST_CASE("PhysicsWorld raycast_all counts blocking bodies", "[physics][world][raycast]") {
    PhysicsWorld world;
    world.init();

    add_wall(world, Vec3{2.0f, 0.0f, 0.0f});
    add_wall(world, Vec3{5.0f, 0.0f, 0.0f});
    add_wall(world, Vec3{8.0f, 0.0f, 0.0f}, layers::STATIC);
    add_listener(world, Vec3{4.0f, 0.0f, 0.0f}, 99);

    const Vec3 origin{0.0f};
    const Vec3 dir{1.0f, 0.0f, 0.0f};
    const LayerMask walls = make_mask({layers::WALL});

    SECTION("Only masked layers are reported, nearest first") {
        auto hits = world.raycast_all(origin, dir, 10.0f, walls);
        REQUIRE(hits.size() == 2);
        REQUIRE(hits[0].distance < hits[1].distance);
        REQUIRE_THAT(hits[0].distance, WithinAbs(1.9f, 0.05f));
    }

    SECTION("Sensors never block") {
        auto hits = world.raycast_all(origin, dir, 10.0f, ALL_LAYERS);
        REQUIRE(hits.size() == 3);
        for (const auto& hit : hits) {
            REQUIRE(world.get_layer(hit.body) != layers::LISTENER);
        }
    }

    SECTION("Ray length limits hits") {
        std::vector<RaycastHit> hits;
        world.raycast_all(origin, dir, 3.0f, hits, walls);
        REQUIRE(hits.size() == 1);
    }

    SECTION("Single raycast returns the nearest") {
        RaycastHit hit = world.raycast(origin, dir, 10.0f, walls);
        REQUIRE(hit.hit);
        REQUIRE_THAT(hit.point.x, WithinAbs(1.9f, 0.05f));
    }

    SECTION("Zero length ray hits nothing") {
        REQUIRE(world.raycast_all(origin, dir, 0.0f, walls).empty());
        REQUIRE(world.raycast_all(origin, Vec3{0.0f}, 10.0f, walls).empty());
    }
}

TEST_CASE("PhysicsWorld overlap_sphere finds sensors", "[physics][world][overlap]") {
    PhysicsWorld world;
    world.init();

    PhysicsBodyId near_listener = add_listener(world, Vec3{3.0f, 0.0f, 0.0f}, 7);
    add_listener(world, Vec3{30.0f, 0.0f, 0.0f}, 8);
    add_wall(world, Vec3{1.0f, 0.0f, 0.0f});

    auto bodies = world.overlap_sphere(Vec3{0.0f}, 5.0f, make_mask({layers::LISTENER}));
    REQUIRE(bodies.size() == 1);
    REQUIRE(bodies[0] == near_listener);
    REQUIRE(world.get_user_data(bodies[0]) == 7);

    SECTION("Moving a body updates overlaps") {
        world.set_position(near_listener, Vec3{20.0f, 0.0f, 0.0f});
        REQUIRE_THAT(world.get_position(near_listener).x, WithinAbs(20.0f, 0.001f));

        std::vector<PhysicsBodyId> out;
        world.overlap_sphere(Vec3{0.0f}, 5.0f, out, make_mask({layers::LISTENER}));
        REQUIRE(out.empty());
    }
}

TEST_CASE("PhysicsWorld move keeps bodies", "[physics][world]") {
    PhysicsWorld a;
    a.init();
    PhysicsBodyId wall = add_wall(a, Vec3{0.0f});

    PhysicsWorld b = std::move(a);
    REQUIRE(b.is_initialized());
    REQUIRE(b.is_valid(wall));
    REQUIRE(b.get_body_count() == 1);
}
