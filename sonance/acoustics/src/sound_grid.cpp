#include <sonance/acoustics/sound_grid.hpp>
#include <sonance/acoustics/sound_listener.hpp>
#include <sonance/scene/world.hpp>
#include <sonance/scene/transform.hpp>
#include <sonance/core/log.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace sonance::acoustics {

using namespace sonance::core;

SoundGridQueries::SoundGridQueries(float cell_size) {
    if (!(cell_size > 0.0f) || !std::isfinite(cell_size)) {
        throw std::invalid_argument("SoundGridQueries: cell size must be positive, got " +
                                    std::to_string(cell_size));
    }
    m_cell_size = cell_size;
    m_inv_cell_size = 1.0f / cell_size;
}

namespace {

// Keep far-off coordinates inside the key range
int32_t cell_coord(float value, float inv_cell_size) {
    constexpr float LIMIT = 1.0e9f;
    return static_cast<int32_t>(std::clamp(std::floor(value * inv_cell_size), -LIMIT, LIMIT));
}

} // anonymous namespace

SoundGridQueries::CellKey SoundGridQueries::cell_of(const Vec3& position) const {
    return CellKey{
        cell_coord(position.x, m_inv_cell_size),
        cell_coord(position.y, m_inv_cell_size),
        cell_coord(position.z, m_inv_cell_size)
    };
}

// ============================================================================
// Listeners
// ============================================================================

void SoundGridQueries::rebuild(const scene::World& world) {
    clear_listeners();

    auto view = world.view<SoundListener>();
    for (auto entity : view) {
        insert_listener(entity, scene::get_world_position(world, entity));
    }

    log(LogLevel::Trace, "acoustics",
        "Sound grid rebuilt: " + std::to_string(m_listener_count) + " listeners in " +
        std::to_string(m_cells.size()) + " cells");
}

void SoundGridQueries::insert_listener(scene::Entity entity, const Vec3& position) {
    m_cells[cell_of(position)].push_back(ListenerCandidate{entity, position});
    ++m_listener_count;
}

void SoundGridQueries::clear_listeners() {
    // Keep bucket storage, listeners usually land in the same cells again
    for (auto& [key, cell] : m_cells) {
        cell.clear();
    }
    m_listener_count = 0;
}

void SoundGridQueries::append_in_sphere(const std::vector<ListenerCandidate>& cell, const Vec3& center,
                                        float radius_sq, std::vector<ListenerCandidate>& out) {
    for (const auto& candidate : cell) {
        Vec3 d = candidate.position - center;
        if (glm::dot(d, d) <= radius_sq) {
            out.push_back(candidate);
        }
    }
}

void SoundGridQueries::find_listeners_in_sphere(const Vec3& center, float radius,
                                                std::vector<ListenerCandidate>& out) const {
    if (!(radius >= 0.0f) || m_listener_count == 0) return;

    const float radius_sq = radius * radius;
    const CellKey lo = cell_of(center - Vec3{radius});
    const CellKey hi = cell_of(center + Vec3{radius});

    const double span_cells =
        (static_cast<double>(hi.x) - lo.x + 1.0) *
        (static_cast<double>(hi.y) - lo.y + 1.0) *
        (static_cast<double>(hi.z) - lo.z + 1.0);

    // A sphere wider than the populated grid is cheaper to answer by
    // walking the buckets that exist
    if (span_cells > static_cast<double>(m_cells.size())) {
        for (const auto& [key, cell] : m_cells) {
            if (key.x < lo.x || key.x > hi.x || key.y < lo.y || key.y > hi.y ||
                key.z < lo.z || key.z > hi.z) {
                continue;
            }
            append_in_sphere(cell, center, radius_sq, out);
        }
        return;
    }

    for (int32_t x = lo.x; x <= hi.x; ++x) {
        for (int32_t y = lo.y; y <= hi.y; ++y) {
            for (int32_t z = lo.z; z <= hi.z; ++z) {
                auto it = m_cells.find(CellKey{x, y, z});
                if (it != m_cells.end()) {
                    append_in_sphere(it->second, center, radius_sq, out);
                }
            }
        }
    }
}

// ============================================================================
// Occluders
// ============================================================================

uint32_t SoundGridQueries::add_occluder(const AABB& bounds, uint16_t layer) {
    Occluder occluder;
    occluder.id = m_next_occluder_id++;
    occluder.bounds = AABB{glm::min(bounds.min, bounds.max), glm::max(bounds.min, bounds.max)};
    occluder.layer = layer;
    m_occluders.push_back(occluder);
    return occluder.id;
}

bool SoundGridQueries::remove_occluder(uint32_t id) {
    auto it = std::find_if(m_occluders.begin(), m_occluders.end(),
        [id](const Occluder& o) { return o.id == id; });
    if (it == m_occluders.end()) return false;
    m_occluders.erase(it);
    return true;
}

void SoundGridQueries::clear_occluders() {
    m_occluders.clear();
}

uint32_t SoundGridQueries::count_obstructions(const Vec3& from, const Vec3& to, LayerMask mask) const {
    Vec3 delta = to - from;
    if (glm::dot(delta, delta) < 1e-12f) return 0;

    AABB segment_bounds{glm::min(from, to), glm::max(from, to)};

    uint32_t count = 0;
    for (const auto& occluder : m_occluders) {
        if (!physics::mask_contains(mask, occluder.layer)) continue;
        if (!occluder.bounds.intersects(segment_bounds)) continue;
        if (occluder.bounds.intersects_segment(from, to)) {
            ++count;
        }
    }
    return count;
}

} // namespace sonance::acoustics
