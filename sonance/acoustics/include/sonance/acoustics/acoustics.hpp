#pragma once

// Umbrella header for sonance::acoustics module

#include <sonance/acoustics/sound_types.hpp>
#include <sonance/acoustics/sound_math.hpp>
#include <sonance/acoustics/sound_queries.hpp>
#include <sonance/acoustics/sound_emitter.hpp>
#include <sonance/acoustics/sound_listener.hpp>
#include <sonance/acoustics/sound_events.hpp>
#include <sonance/acoustics/sound_system.hpp>
#include <sonance/acoustics/sound_grid.hpp>
#include <sonance/acoustics/physics_sound_queries.hpp>
#include <sonance/acoustics/scheduled_sound_emitter.hpp>
#include <sonance/acoustics/movement_noise.hpp>
#include <sonance/acoustics/sound_settings.hpp>
#include <sonance/acoustics/sound_debug.hpp>
