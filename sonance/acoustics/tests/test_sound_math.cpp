#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <sonance/acoustics/sound_math.hpp>

using namespace sonance::acoustics;
using Catch::Matchers::WithinAbs;

TEST_CASE("Hearing radius", "[acoustics][math]") {
    SECTION("Full loudness reaches the max radius") {
        REQUIRE_THAT(hearing_radius(1.0f), WithinAbs(50.0f, 0.0001f));
    }

    SECTION("Silence keeps the min radius") {
        REQUIRE_THAT(hearing_radius(0.0f), WithinAbs(0.5f, 0.0001f));
    }

    SECTION("Quadratic in loudness") {
        REQUIRE_THAT(hearing_radius(0.5f), WithinAbs(12.875f, 0.0001f));
        REQUIRE_THAT(hearing_radius(0.05f), WithinAbs(0.62375f, 0.0001f));
    }

    SECTION("Monotonic in loudness") {
        float previous = hearing_radius(0.0f);
        for (int i = 1; i <= 20; ++i) {
            float r = hearing_radius(i / 20.0f);
            REQUIRE(r > previous);
            previous = r;
        }
    }

    SECTION("Custom range") {
        REQUIRE_THAT(hearing_radius(1.0f, 1.0f, 10.0f), WithinAbs(10.0f, 0.0001f));
        REQUIRE_THAT(hearing_radius(0.0f, 1.0f, 10.0f), WithinAbs(1.0f, 0.0001f));
    }
}

TEST_CASE("Distance falloff", "[acoustics][math]") {
    SECTION("Full at the origin") {
        REQUIRE_THAT(distance_falloff(0.0f, 10.0f), WithinAbs(1.0f, 0.0001f));
    }

    SECTION("Exactly zero at the radius") {
        REQUIRE(distance_falloff(10.0f, 10.0f) == 0.0f);
        REQUIRE(distance_falloff(12.875f, 12.875f) == 0.0f);
    }

    SECTION("Zero beyond the radius") {
        REQUIRE(distance_falloff(15.0f, 10.0f) == 0.0f);
    }

    SECTION("Three quarters at half the radius") {
        REQUIRE_THAT(distance_falloff(5.0f, 10.0f), WithinAbs(0.75f, 0.0001f));
    }

    SECTION("Monotonically non-increasing") {
        float previous = distance_falloff(0.0f, 10.0f);
        for (int i = 1; i <= 60; ++i) {
            float f = distance_falloff(i * 0.25f, 10.0f);
            REQUIRE(f <= previous);
            previous = f;
        }
    }

    SECTION("Degenerate radius is silent") {
        REQUIRE(distance_falloff(0.0f, 0.0f) == 0.0f);
        REQUIRE(distance_falloff(1.0f, -1.0f) == 0.0f);
    }
}

TEST_CASE("Obstruction attenuation", "[acoustics][math]") {
    SECTION("No walls, no loss") {
        REQUIRE(obstruction_attenuation(0.8f, 0) == 1.0f);
    }

    SECTION("Each wall multiplies by the penalty") {
        for (uint32_t walls = 0; walls < 6; ++walls) {
            float current = obstruction_attenuation(0.8f, walls);
            float next = obstruction_attenuation(0.8f, walls + 1);
            REQUIRE_THAT(next, WithinAbs(current * 0.8f, 0.00001f));
        }
    }

    SECTION("Two walls at 0.8") {
        REQUIRE_THAT(obstruction_attenuation(0.8f, 2), WithinAbs(0.64f, 0.00001f));
    }

    SECTION("Penalty of one never attenuates") {
        REQUIRE_THAT(obstruction_attenuation(1.0f, 10), WithinAbs(1.0f, 0.00001f));
    }
}
