#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace sonance::acoustics {

enum class MovementState : uint8_t {
    Idle,
    Walking,
    Running,
    CrouchWalking,
    InAir
};

const char* to_string(MovementState state);

struct FootstepProfile {
    float loudness = 0.0f;
    float interval = 1.0f;      // Seconds between footsteps
};

// Turns locomotion into periodic footsteps and one-shot jump/land noises.
// The movement controller sets the state, the sound system emits.
class MovementNoiseComponent {
public:
    FootstepProfile walking{0.3f, 1.0f};
    FootstepProfile running{0.6f, 0.5f};
    FootstepProfile crouch_walking{0.15f, 2.0f};

    float jump_loudness = 0.4f;
    float land_loudness = 0.5f;
    float fall_damage_loudness = 0.7f;
    float quality = 1.0f;

    // A different state restarts the cadence, its first step is due next update
    void set_state(MovementState state);
    MovementState state() const { return m_state; }

    // One-shots, emitted on the next update. At most MAX_PENDING_ONE_SHOTS
    // wait at once; further ones are dropped until the next update.
    static constexpr size_t MAX_PENDING_ONE_SHOTS = 8;
    void jump() { queue_one_shot(jump_loudness); }
    void land() { queue_one_shot(land_loudness); }
    void fall_damage() { queue_one_shot(fall_damage_loudness); }
    size_t pending_one_shots() const { return m_one_shots.size(); }

    // Appends the loudness of every noise due after dt seconds
    void advance(float dt, std::vector<float>& out);

private:
    const FootstepProfile* current_profile() const;
    void queue_one_shot(float loudness);

    MovementState m_state = MovementState::Idle;
    float m_step_timer = 0.0f;
    bool m_step_pending = false;
    std::vector<float> m_one_shots;
};

} // namespace sonance::acoustics
