#include <sonance/acoustics/sound_math.hpp>
#include <sonance/core/math.hpp>
#include <cmath>

namespace sonance::acoustics {

float hearing_radius(float loudness, float min_radius, float max_radius) {
    float l = core::saturate(loudness);
    return core::lerp(min_radius, max_radius, l * l);
}

float distance_falloff(float distance, float radius) {
    if (!(radius > 0.0f)) return 0.0f;
    float ratio = distance / radius;
    return core::saturate(1.0f - ratio * ratio);
}

float obstruction_attenuation(float wall_penalty, uint32_t wall_count) {
    if (wall_count == 0) return 1.0f;
    return std::pow(core::saturate(wall_penalty), static_cast<float>(wall_count));
}

} // namespace sonance::acoustics
