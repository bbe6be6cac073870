#include <sonance/core/math.hpp>
#include <cmath>
#include <algorithm>

namespace sonance::core {

bool AABB::intersects_segment(const Vec3& from, const Vec3& to, float* t_enter) const {
    Vec3 delta = to - from;
    float t_min = 0.0f;
    float t_max = 1.0f;

    for (int axis = 0; axis < 3; ++axis) {
        if (std::abs(delta[axis]) < 1e-8f) {
            // Parallel to this slab, must already be inside it
            if (from[axis] < min[axis] || from[axis] > max[axis]) {
                return false;
            }
            continue;
        }

        float inv = 1.0f / delta[axis];
        float t0 = (min[axis] - from[axis]) * inv;
        float t1 = (max[axis] - from[axis]) * inv;
        if (t0 > t1) std::swap(t0, t1);

        t_min = std::max(t_min, t0);
        t_max = std::min(t_max, t1);
        if (t_min > t_max) {
            return false;
        }
    }

    if (t_enter) {
        *t_enter = t_min;
    }
    return true;
}

} // namespace sonance::core
