#pragma once

#include <entt/entt.hpp>
#include <cstdint>
#include <string>

namespace sonance::scene {

// Entity is just a type alias for entt::entity
using Entity = entt::entity;

// Null entity constant
constexpr Entity NullEntity = entt::null;

// Name and stable id, used in log lines and debug overlays
struct EntityInfo {
    std::string name;
    uint64_t uuid = 0;
};

// Integral id for log output
inline uint32_t entity_id(Entity e) {
    return static_cast<uint32_t>(entt::to_integral(e));
}

} // namespace sonance::scene
