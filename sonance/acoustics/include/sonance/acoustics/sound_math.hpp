#pragma once

#include <cstdint>

namespace sonance::acoustics {

constexpr float DEFAULT_MIN_RADIUS = 0.5f;
constexpr float DEFAULT_MAX_RADIUS = 50.0f;

// Effective hearing radius: quadratic in loudness, so quiet sounds stay local
float hearing_radius(float loudness, float min_radius = DEFAULT_MIN_RADIUS,
                     float max_radius = DEFAULT_MAX_RADIUS);

// 1 - (d/r)^2, clamped to [0, 1]. Zero at and beyond the radius.
float distance_falloff(float distance, float radius);

// wall_penalty ^ wall_count
float obstruction_attenuation(float wall_penalty, uint32_t wall_count);

} // namespace sonance::acoustics
