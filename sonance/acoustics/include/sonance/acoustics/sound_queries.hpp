#pragma once

#include <sonance/acoustics/sound_types.hpp>
#include <vector>

namespace sonance::acoustics {

struct ListenerCandidate {
    scene::Entity entity = scene::NullEntity;
    Vec3 position{0.0f};
};

// Spatial and line-of-sight queries the propagation engine runs against.
// Implementations may throw std::exception; the sound system isolates it.
class ISoundQueries {
public:
    virtual ~ISoundQueries() = default;

    // Append every listener whose volume may touch the sphere. Broad phase,
    // extra candidates are fine, missing ones are not.
    virtual void find_listeners_in_sphere(const Vec3& center, float radius,
                                          std::vector<ListenerCandidate>& out) const = 0;

    // Number of distinct blocking bodies on the segment from -> to whose
    // layer is in mask. Sensors and triggers never count.
    virtual uint32_t count_obstructions(const Vec3& from, const Vec3& to, LayerMask mask) const = 0;
};

} // namespace sonance::acoustics
