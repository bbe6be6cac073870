// Stealth Demo - Headless walk-through of sound propagation
//
// A player crosses a corridor past two guards. One guard stands behind a
// wall, the other in the open. The player walks, crouches, then sprints and
// jumps; each guard logs what it hears and where it thinks the noise is
// heading.
//
// Usage: sonance_demo [sound_settings.json]

#include <sonance/acoustics/acoustics.hpp>
#include <sonance/scene/world.hpp>
#include <sonance/scene/transform.hpp>
#include <sonance/core/event_dispatcher.hpp>
#include <sonance/core/log.hpp>
#include <algorithm>
#include <cstdio>
#include <string>

using namespace sonance::core;
using namespace sonance::scene;
namespace acoustics = sonance::acoustics;

// Last noise a guard reacted to
struct GuardAlert {
    Vec3 investigate_position{0.0f};
    float strongest = 0.0f;
    int sounds_heard = 0;
};

Entity create_guard(World& world, const std::string& name, const Vec3& position,
                    const acoustics::SoundSettings& settings) {
    Entity guard = world.create(name);
    world.emplace<LocalTransform>(guard, position);
    world.emplace<GuardAlert>(guard);

    auto& listener = world.emplace<acoustics::SoundListener>(guard, settings.make_listener());
    listener.set_reaction([&world, guard, name](const acoustics::HeardSound& sound) {
        auto& alert = world.get<GuardAlert>(guard);
        alert.investigate_position = sound.predicted_source_position(1.0f);
        alert.strongest = std::max(alert.strongest, sound.loudness);
        ++alert.sounds_heard;

        char buffer[160];
        std::snprintf(buffer, sizeof(buffer), "%s hears %.3f (q %.1f), investigating (%.1f, %.1f, %.1f)",
                      name.c_str(), sound.loudness, sound.quality, alert.investigate_position.x,
                      alert.investigate_position.y, alert.investigate_position.z);
        log(LogLevel::Info, "demo", std::string(buffer));
    });
    return guard;
}

int main(int argc, char** argv) {
    set_log_level(LogLevel::Info);

    acoustics::SoundSettings settings;
    if (argc > 1 && !settings.load(argv[1])) {
        log(LogLevel::Warn, "demo", std::string("Using default sound settings, could not load ") + argv[1]);
    }

    World world;
    EventDispatcher events;
    acoustics::SoundGridQueries grid{settings.grid.cell_size};
    acoustics::SoundSystem system{grid, &events, settings.propagation};
    acoustics::SoundDebugRecorder recorder{events};

    // Corridor along +x with a wall between the start and the first guard
    grid.add_occluder(AABB::from_center(Vec3{6.0f, 1.5f, 4.0f}, Vec3{4.0f, 1.5f, 0.2f}));

    Entity behind_wall = create_guard(world, "guard_behind_wall", Vec3{6.0f, 0.0f, 8.0f}, settings);
    Entity in_open = create_guard(world, "guard_in_open", Vec3{24.0f, 0.0f, 0.0f}, settings);

    Entity player = world.create("player");
    world.emplace<LocalTransform>(player, Vec3{0.0f});
    world.emplace<Velocity>(player);
    world.emplace<acoustics::SoundEmitter>(player, settings.make_emitter())
        .set_emit_offset(Vec3{0.0f, 1.0f, 0.0f});
    auto& movement = world.emplace<acoustics::MovementNoiseComponent>(player);

    // A generator at the end of the corridor hums every few seconds
    Entity generator = world.create("generator");
    world.emplace<LocalTransform>(generator, Vec3{40.0f, 0.0f, 0.0f});
    auto& hum = world.emplace<acoustics::ScheduledSoundEmitter>(generator);
    hum.add_sound(acoustics::ScheduledSound{0.35f, 0.0f, 1.0f, true, 3.0f});

    struct Leg {
        acoustics::MovementState state;
        float speed;
        float seconds;
    };
    const Leg route[] = {
        {acoustics::MovementState::Walking, 1.5f, 4.0f},
        {acoustics::MovementState::CrouchWalking, 0.8f, 4.0f},
        {acoustics::MovementState::Running, 5.0f, 2.0f},
    };

    const float dt = 0.1f;
    for (const Leg& leg : route) {
        log(LogLevel::Info, "demo", std::string("Player starts ") + acoustics::to_string(leg.state));
        movement.set_state(leg.state);
        world.get<Velocity>(player).linear = Vec3{leg.speed, 0.0f, 0.0f};

        for (float t = 0.0f; t < leg.seconds; t += dt) {
            world.get<LocalTransform>(player).position += world.get<Velocity>(player).linear * dt;
            grid.rebuild(world);
            system.update(world, dt);
        }
    }

    movement.set_state(acoustics::MovementState::InAir);
    movement.jump();
    system.update(world, dt);
    movement.land();
    movement.set_state(acoustics::MovementState::Idle);
    system.update(world, dt);

    for (Entity guard : {behind_wall, in_open}) {
        const auto& alert = world.get<GuardAlert>(guard);
        char buffer[128];
        std::snprintf(buffer, sizeof(buffer), "%s heard %d sounds, loudest %.3f",
                      world.name_of(guard).c_str(), alert.sounds_heard, alert.strongest);
        log(LogLevel::Info, "demo", std::string(buffer));
    }

    log(LogLevel::Info, "demo", "Listener checks recorded: " + std::to_string(recorder.check_count()) +
        ", emissions: " + std::to_string(recorder.emission_count()));
    return 0;
}
