#include <sonance/scene/world.hpp>

namespace sonance::scene {

Entity World::create() {
    Entity e = m_registry.create();
    auto& info = m_registry.emplace<EntityInfo>(e);
    info.uuid = m_next_uuid++;
    info.name = "Entity_" + std::to_string(info.uuid);
    ++m_alive;
    return e;
}

Entity World::create(const std::string& name) {
    Entity e = m_registry.create();
    auto& info = m_registry.emplace<EntityInfo>(e);
    info.uuid = m_next_uuid++;
    info.name = name;
    ++m_alive;
    return e;
}

void World::destroy(Entity e) {
    if (!valid(e)) return;
    m_registry.destroy(e);
    --m_alive;
}

bool World::valid(Entity e) const {
    return m_registry.valid(e);
}

void World::clear() {
    m_registry.clear();
    m_next_uuid = 1;
    m_alive = 0;
}

Entity World::find_by_name(const std::string& name) const {
    auto view = m_registry.view<EntityInfo>();
    for (auto [entity, info] : view.each()) {
        if (info.name == name) {
            return entity;
        }
    }
    return NullEntity;
}

std::string World::name_of(Entity e) const {
    if (e == NullEntity) return "<none>";
    if (valid(e)) {
        if (const auto* info = m_registry.try_get<EntityInfo>(e)) {
            return info->name;
        }
    }
    return "#" + std::to_string(entity_id(e));
}

} // namespace sonance::scene
