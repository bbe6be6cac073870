#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <sonance/acoustics/sound_settings.hpp>
#include <sonance/core/filesystem.hpp>
#include <sonance/core/log.hpp>
#include <cstdio>
#include <stdexcept>
#include <string>

using namespace sonance;
using namespace sonance::acoustics;
using Catch::Matchers::WithinAbs;

TEST_CASE("SoundSettings defaults", "[acoustics][settings]") {
    SoundSettings settings;

    REQUIRE_THAT(settings.propagation.min_radius, WithinAbs(0.5f, 0.0001f));
    REQUIRE_THAT(settings.propagation.max_radius, WithinAbs(50.0f, 0.0001f));
    REQUIRE(settings.propagation.max_candidates == 256);
    REQUIRE_THAT(settings.emitter.wall_penalty, WithinAbs(0.8f, 0.0001f));
    REQUIRE_THAT(settings.listener.hearing_threshold, WithinAbs(0.2f, 0.0001f));
    REQUIRE_THAT(settings.grid.cell_size, WithinAbs(8.0f, 0.0001f));
    REQUIRE(settings.is_valid());
}

TEST_CASE("SoundSettings parsing", "[acoustics][settings]") {
    SoundSettings settings;
    core::LogLevel previous = core::get_log_level();
    core::set_log_level(core::LogLevel::Fatal);

    SECTION("Present keys override, missing keys keep defaults") {
        REQUIRE(settings.load_from_string(R"({
            "propagation": { "max_radius": 30.0 },
            "listener": { "hearing_threshold": 0.35 }
        })"));

        REQUIRE_THAT(settings.propagation.max_radius, WithinAbs(30.0f, 0.0001f));
        REQUIRE_THAT(settings.propagation.min_radius, WithinAbs(0.5f, 0.0001f));
        REQUIRE_THAT(settings.listener.hearing_threshold, WithinAbs(0.35f, 0.0001f));
        REQUIRE_THAT(settings.emitter.default_loudness, WithinAbs(1.0f, 0.0001f));
    }

    SECTION("Malformed JSON leaves settings untouched") {
        REQUIRE_FALSE(settings.load_from_string("{ \"propagation\": "));
        REQUIRE_THAT(settings.propagation.max_radius, WithinAbs(50.0f, 0.0001f));
    }

    SECTION("Wrong value type is rejected") {
        REQUIRE_FALSE(settings.load_from_string(R"({ "grid": { "cell_size": "big" } })"));
        REQUIRE_THAT(settings.grid.cell_size, WithinAbs(8.0f, 0.0001f));
    }

    SECTION("Out of range values reject the whole document") {
        REQUIRE_FALSE(settings.load_from_string(R"({
            "propagation": { "max_radius": 20.0 },
            "emitter": { "wall_penalty": 1.5 }
        })"));
        REQUIRE_THAT(settings.propagation.max_radius, WithinAbs(50.0f, 0.0001f));
        REQUIRE_THAT(settings.emitter.wall_penalty, WithinAbs(0.8f, 0.0001f));

        REQUIRE_FALSE(settings.load_from_string(R"({ "propagation": { "min_radius": 60.0 } })"));
        REQUIRE_FALSE(settings.load_from_string(R"({ "grid": { "cell_size": 0.0 } })"));
    }

    SECTION("Negative candidate count is rejected, not wrapped") {
        REQUIRE_FALSE(settings.load_from_string(R"({ "propagation": { "max_candidates": -1 } })"));
        REQUIRE(settings.propagation.max_candidates == 256);

        REQUIRE_FALSE(settings.load_from_string(R"({ "propagation": { "max_candidates": 1000000 } })"));
        REQUIRE(settings.propagation.max_candidates == 256);

        REQUIRE(settings.load_from_string(R"({ "propagation": { "max_candidates": 64 } })"));
        REQUIRE(settings.propagation.max_candidates == 64);
    }

    SECTION("Obstruction mask must fit in 16 bits") {
        REQUIRE_FALSE(settings.load_from_string(R"({ "emitter": { "obstruction_mask": 70000 } })"));
        REQUIRE_FALSE(settings.load_from_string(R"({ "emitter": { "obstruction_mask": -5 } })"));
        REQUIRE(settings.emitter.obstruction_mask == DEFAULT_OBSTRUCTION_MASK);

        REQUIRE(settings.load_from_string(R"({ "emitter": { "obstruction_mask": 65535 } })"));
        REQUIRE(settings.emitter.obstruction_mask == 0xFFFF);
    }

    SECTION("Source listener skipping is read") {
        REQUIRE_FALSE(settings.propagation.skip_source_listener);
        REQUIRE(settings.load_from_string(R"({ "propagation": { "skip_source_listener": true } })"));
        REQUIRE(settings.propagation.skip_source_listener);
    }

    SECTION("Missing file") {
        REQUIRE_FALSE(settings.load("does/not/exist/sound.json"));
    }

    core::set_log_level(previous);
}

TEST_CASE("SoundSettings save and load", "[acoustics][settings]") {
    const std::string path = "sonance_sound_settings_test.json";

    SoundSettings original;
    original.propagation.max_radius = 40.0f;
    original.emitter.default_quality = 2.0f;
    original.emitter.obstruction_mask = 0x0180;
    original.grid.cell_size = 4.0f;
    REQUIRE(original.save(path));
    REQUIRE(core::FileSystem::exists(path));

    SoundSettings loaded;
    REQUIRE(loaded.load(path));
    REQUIRE_THAT(loaded.propagation.max_radius, WithinAbs(40.0f, 0.0001f));
    REQUIRE_THAT(loaded.emitter.default_quality, WithinAbs(2.0f, 0.0001f));
    REQUIRE(loaded.emitter.obstruction_mask == 0x0180);
    REQUIRE_THAT(loaded.grid.cell_size, WithinAbs(4.0f, 0.0001f));

    std::remove(path.c_str());
}

TEST_CASE("SoundSettings builds components", "[acoustics][settings]") {
    SoundSettings settings;
    settings.emitter.default_loudness = 0.7f;
    settings.emitter.wall_penalty = 0.6f;
    settings.listener.hearing_threshold = 0.45f;

    SoundEmitter emitter = settings.make_emitter();
    REQUIRE_THAT(emitter.default_loudness(), WithinAbs(0.7f, 0.0001f));
    REQUIRE_THAT(emitter.wall_penalty(), WithinAbs(0.6f, 0.0001f));
    REQUIRE(emitter.obstruction_mask() == DEFAULT_OBSTRUCTION_MASK);

    SoundListener listener = settings.make_listener();
    REQUIRE_THAT(listener.hearing_threshold(), WithinAbs(0.45f, 0.0001f));

    SECTION("Invalid emitter defaults throw") {
        settings.emitter.wall_penalty = 0.0f;
        REQUIRE_THROWS_AS(settings.make_emitter(), std::invalid_argument);
    }
}
