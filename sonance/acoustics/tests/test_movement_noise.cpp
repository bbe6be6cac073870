#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <sonance/acoustics/movement_noise.hpp>
#include <sonance/acoustics/sound_system.hpp>
#include <sonance/acoustics/sound_emitter.hpp>
#include <sonance/acoustics/sound_listener.hpp>
#include <sonance/scene/world.hpp>
#include <sonance/scene/transform.hpp>
#include "fake_sound_queries.hpp"
#include <cstring>
#include <vector>

using namespace sonance;
using namespace sonance::acoustics;
using Catch::Matchers::WithinAbs;

TEST_CASE("MovementNoiseComponent defaults", "[acoustics][movement]") {
    MovementNoiseComponent noise;

    REQUIRE(noise.state() == MovementState::Idle);
    REQUIRE_THAT(noise.walking.loudness, WithinAbs(0.3f, 0.0001f));
    REQUIRE_THAT(noise.walking.interval, WithinAbs(1.0f, 0.0001f));
    REQUIRE_THAT(noise.running.loudness, WithinAbs(0.6f, 0.0001f));
    REQUIRE_THAT(noise.running.interval, WithinAbs(0.5f, 0.0001f));
    REQUIRE_THAT(noise.crouch_walking.loudness, WithinAbs(0.15f, 0.0001f));
    REQUIRE_THAT(noise.crouch_walking.interval, WithinAbs(2.0f, 0.0001f));
    REQUIRE_THAT(noise.quality, WithinAbs(1.0f, 0.0001f));
    REQUIRE(std::strcmp(to_string(MovementState::CrouchWalking), "CrouchWalking") == 0);
}

TEST_CASE("MovementNoiseComponent footstep cadence", "[acoustics][movement]") {
    MovementNoiseComponent noise;
    std::vector<float> out;

    SECTION("Idle is silent") {
        for (int i = 0; i < 10; ++i) noise.advance(0.5f, out);
        REQUIRE(out.empty());
    }

    SECTION("First step right away, then every interval") {
        noise.set_state(MovementState::Running);

        noise.advance(0.25f, out);
        REQUIRE(out.size() == 1);
        REQUIRE_THAT(out[0], WithinAbs(0.6f, 0.0001f));

        noise.advance(0.25f, out);
        REQUIRE(out.size() == 1);
        noise.advance(0.25f, out);
        REQUIRE(out.size() == 2);
        noise.advance(0.25f, out);
        noise.advance(0.25f, out);
        REQUIRE(out.size() == 3);
    }

    SECTION("Changing state restarts the cadence") {
        noise.set_state(MovementState::Walking);
        noise.advance(0.5f, out);
        noise.set_state(MovementState::CrouchWalking);
        noise.advance(0.5f, out);
        REQUIRE(out.size() == 2);
        REQUIRE_THAT(out[1], WithinAbs(0.15f, 0.0001f));
    }

    SECTION("Setting the same state keeps the cadence") {
        noise.set_state(MovementState::Walking);
        noise.advance(0.5f, out);
        noise.set_state(MovementState::Walking);
        noise.advance(0.25f, out);
        REQUIRE(out.size() == 1);
    }

    SECTION("A negative step leaves the cadence alone") {
        noise.set_state(MovementState::Walking);
        noise.advance(0.5f, out);
        noise.advance(0.5f, out);
        noise.advance(-5.0f, out);
        noise.advance(0.5f, out);
        REQUIRE(out.size() == 2);
    }

    SECTION("In air is silent") {
        noise.set_state(MovementState::InAir);
        noise.advance(1.0f, out);
        REQUIRE(out.empty());
    }
}

TEST_CASE("MovementNoiseComponent one-shots", "[acoustics][movement]") {
    MovementNoiseComponent noise;
    std::vector<float> out;

    noise.jump();
    noise.land();
    noise.fall_damage();
    noise.advance(0.0f, out);

    REQUIRE(out.size() == 3);
    REQUIRE_THAT(out[0], WithinAbs(0.4f, 0.0001f));
    REQUIRE_THAT(out[1], WithinAbs(0.5f, 0.0001f));
    REQUIRE_THAT(out[2], WithinAbs(0.7f, 0.0001f));

    out.clear();
    noise.advance(1.0f, out);
    REQUIRE(out.empty());

    SECTION("Queued one-shots are capped between updates") {
        for (int i = 0; i < 100; ++i) noise.jump();
        REQUIRE(noise.pending_one_shots() == MovementNoiseComponent::MAX_PENDING_ONE_SHOTS);

        noise.advance(0.0f, out);
        REQUIRE(out.size() == MovementNoiseComponent::MAX_PENDING_ONE_SHOTS);
        REQUIRE(noise.pending_one_shots() == 0);
    }
}

TEST_CASE("SoundSystem emits footsteps", "[acoustics][movement][system]") {
    scene::World world;
    FakeSoundQueries queries;
    SoundSystem system{queries};

    std::vector<HeardSound> heard;
    scene::Entity guard = world.create("guard");
    world.emplace<scene::LocalTransform>(guard, Vec3{0.0f});
    world.emplace<SoundListener>(guard).set_reaction(
        [&heard](const HeardSound& s) { heard.push_back(s); });
    queries.add(guard, Vec3{0.0f});

    scene::Entity player = world.create("player");
    world.emplace<scene::LocalTransform>(player, Vec3{0.0f});
    world.emplace<SoundEmitter>(player);
    world.emplace<MovementNoiseComponent>(player).set_state(MovementState::Running);

    system.update(world, 0.25f);
    system.update(world, 0.25f);
    system.update(world, 0.25f);

    // Running is loud enough for the default threshold
    REQUIRE(heard.size() == 2);
    REQUIRE_THAT(heard[0].quality, WithinAbs(1.0f, 0.0001f));
    REQUIRE(world.get<SoundEmitter>(player).emission_count() == 2);

    SECTION("Crouching sneaks past the default threshold") {
        world.get<MovementNoiseComponent>(player).set_state(MovementState::CrouchWalking);
        system.update(world, 0.25f);
        REQUIRE(heard.size() == 2);
        REQUIRE(world.get<SoundEmitter>(player).emission_count() == 3);
    }

    SECTION("A negative dt neither rewinds the clock nor the footsteps") {
        system.update(world, -1.0f);
        REQUIRE(system.time() == 0.75);

        system.update(world, 0.25f);
        system.update(world, 0.25f);
        REQUIRE(heard.size() == 3);
    }
}
