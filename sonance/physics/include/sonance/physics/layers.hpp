#pragma once

#include <cstdint>
#include <bitset>
#include <initializer_list>

namespace sonance::physics {

// Predefined collision layers
namespace layers {
    constexpr uint16_t STATIC = 0;
    constexpr uint16_t DYNAMIC = 1;
    constexpr uint16_t PLAYER = 2;
    constexpr uint16_t ENEMY = 3;
    constexpr uint16_t TRIGGER = 4;
    constexpr uint16_t DEBRIS = 5;
    constexpr uint16_t PROJECTILE = 6;
    constexpr uint16_t WALL = 7;        // Sound-blocking level geometry
    constexpr uint16_t LISTENER = 8;    // Hearing volumes, always sensors
    // User-defined layers start at 9
    constexpr uint16_t USER_START = 9;
    constexpr uint16_t MAX_LAYERS = 16;
}

// Layer masks select layers by bit, one bit per layer
using LayerMask = uint16_t;

constexpr LayerMask ALL_LAYERS = 0xFFFF;
constexpr LayerMask NO_LAYERS = 0;

constexpr LayerMask layer_bit(uint16_t layer) {
    return layer < layers::MAX_LAYERS ? static_cast<LayerMask>(1u << layer) : NO_LAYERS;
}

constexpr LayerMask make_mask(std::initializer_list<uint16_t> layer_list) {
    LayerMask mask = NO_LAYERS;
    for (uint16_t layer : layer_list) {
        mask = static_cast<LayerMask>(mask | layer_bit(layer));
    }
    return mask;
}

constexpr bool mask_contains(LayerMask mask, uint16_t layer) {
    return (mask & layer_bit(layer)) != 0;
}

// Collision filter - defines which layers collide with which
class CollisionFilter {
public:
    CollisionFilter() {
        // Default: everything collides with everything
        for (uint16_t i = 0; i < layers::MAX_LAYERS; ++i) {
            m_matrix[i].set();
        }
    }

    void set_collision(uint16_t layer_a, uint16_t layer_b, bool collides) {
        if (layer_a >= layers::MAX_LAYERS || layer_b >= layers::MAX_LAYERS) return;
        m_matrix[layer_a][layer_b] = collides;
        m_matrix[layer_b][layer_a] = collides;
    }

    bool should_collide(uint16_t layer_a, uint16_t layer_b) const {
        if (layer_a >= layers::MAX_LAYERS || layer_b >= layers::MAX_LAYERS) return false;
        return m_matrix[layer_a][layer_b];
    }

private:
    std::bitset<layers::MAX_LAYERS> m_matrix[layers::MAX_LAYERS];
};

} // namespace sonance::physics
