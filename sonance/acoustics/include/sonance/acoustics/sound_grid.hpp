#pragma once

#include <sonance/acoustics/sound_queries.hpp>
#include <sonance/core/math.hpp>
#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace sonance::scene { class World; }

namespace sonance::acoustics {

// Standalone query backend: a 3D spatial hash of listener positions plus a
// flat list of axis-aligned wall boxes. Useful for tools, tests and hosts
// without a physics world.
class SoundGridQueries final : public ISoundQueries {
public:
    static constexpr float DEFAULT_CELL_SIZE = 8.0f;

    // Throws std::invalid_argument unless cell_size is finite and positive
    explicit SoundGridQueries(float cell_size = DEFAULT_CELL_SIZE);

    float cell_size() const { return m_cell_size; }

    // ========================================================================
    // Listeners
    // ========================================================================

    // Re-index every entity carrying a SoundListener at its world position
    void rebuild(const scene::World& world);

    void insert_listener(scene::Entity entity, const Vec3& position);
    void clear_listeners();
    size_t listener_count() const { return m_listener_count; }

    // ========================================================================
    // Occluders
    // ========================================================================

    uint32_t add_occluder(const core::AABB& bounds, uint16_t layer = physics::layers::WALL);
    bool remove_occluder(uint32_t id);
    void clear_occluders();
    size_t occluder_count() const { return m_occluders.size(); }

    // ISoundQueries
    void find_listeners_in_sphere(const Vec3& center, float radius,
                                  std::vector<ListenerCandidate>& out) const override;
    uint32_t count_obstructions(const Vec3& from, const Vec3& to, LayerMask mask) const override;

private:
    struct CellKey {
        int32_t x = 0;
        int32_t y = 0;
        int32_t z = 0;

        bool operator==(const CellKey& other) const {
            return x == other.x && y == other.y && z == other.z;
        }
    };

    struct CellKeyHash {
        size_t operator()(const CellKey& key) const {
            // Large primes, see Teschner et al. "Optimized Spatial Hashing"
            return static_cast<size_t>(
                (static_cast<uint64_t>(static_cast<uint32_t>(key.x)) * 73856093u) ^
                (static_cast<uint64_t>(static_cast<uint32_t>(key.y)) * 19349663u) ^
                (static_cast<uint64_t>(static_cast<uint32_t>(key.z)) * 83492791u));
        }
    };

    struct Occluder {
        uint32_t id = 0;
        core::AABB bounds;
        uint16_t layer = physics::layers::WALL;
    };

    CellKey cell_of(const Vec3& position) const;
    static void append_in_sphere(const std::vector<ListenerCandidate>& cell, const Vec3& center,
                                 float radius_sq, std::vector<ListenerCandidate>& out);

    float m_cell_size;
    float m_inv_cell_size;
    std::unordered_map<CellKey, std::vector<ListenerCandidate>, CellKeyHash> m_cells;
    size_t m_listener_count = 0;

    std::vector<Occluder> m_occluders;
    uint32_t m_next_occluder_id = 1;
};

} // namespace sonance::acoustics
