#include <sonance/acoustics/movement_noise.hpp>

namespace sonance::acoustics {

const char* to_string(MovementState state) {
    switch (state) {
        case MovementState::Idle: return "Idle";
        case MovementState::Walking: return "Walking";
        case MovementState::Running: return "Running";
        case MovementState::CrouchWalking: return "CrouchWalking";
        case MovementState::InAir: return "InAir";
        default: return "Unknown";
    }
}

void MovementNoiseComponent::set_state(MovementState state) {
    if (state == m_state) return;
    m_state = state;
    m_step_timer = 0.0f;
    m_step_pending = current_profile() != nullptr;
}

void MovementNoiseComponent::queue_one_shot(float loudness) {
    if (m_one_shots.size() >= MAX_PENDING_ONE_SHOTS) return;
    m_one_shots.push_back(loudness);
}

const FootstepProfile* MovementNoiseComponent::current_profile() const {
    switch (m_state) {
        case MovementState::Walking: return &walking;
        case MovementState::Running: return &running;
        case MovementState::CrouchWalking: return &crouch_walking;
        default: return nullptr;
    }
}

void MovementNoiseComponent::advance(float dt, std::vector<float>& out) {
    for (float loudness : m_one_shots) {
        out.push_back(loudness);
    }
    m_one_shots.clear();

    const FootstepProfile* profile = current_profile();
    if (!profile) return;

    if (m_step_pending) {
        m_step_pending = false;
        m_step_timer = 0.0f;
        out.push_back(profile->loudness);
        return;
    }

    if (dt > 0.0f) {
        m_step_timer += dt;
    }
    if (profile->interval > 0.0f && m_step_timer >= profile->interval) {
        out.push_back(profile->loudness);
        m_step_timer -= profile->interval;
        if (m_step_timer >= profile->interval) {
            m_step_timer = 0.0f;
        }
    }
}

} // namespace sonance::acoustics
