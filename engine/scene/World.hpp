#pragma once

#include <unordered_map>

#include "engine/scene/Components.hpp"

namespace engine::scene
{
class World
{
public:
    Entity CreateEntity();

    /// Removes every component of the entity. Returns false if it was already gone,
    /// so contact handlers can treat "still alive" and "destroy" as one step.
    bool DestroyEntity(Entity entity);
    void Clear();

    [[nodiscard]] bool HasEntity(Entity entity) const;

    std::unordered_map<Entity, Transform>& Transforms() { return m_transforms; }
    std::unordered_map<Entity, PlayerComponent>& Players() { return m_players; }
    std::unordered_map<Entity, PickupComponent>& Pickups() { return m_pickups; }
    std::unordered_map<Entity, HostileComponent>& Hostiles() { return m_hostiles; }
    std::unordered_map<Entity, NameComponent>& Names() { return m_names; }

    [[nodiscard]] const std::unordered_map<Entity, Transform>& Transforms() const { return m_transforms; }
    [[nodiscard]] const std::unordered_map<Entity, PlayerComponent>& Players() const { return m_players; }
    [[nodiscard]] const std::unordered_map<Entity, PickupComponent>& Pickups() const { return m_pickups; }
    [[nodiscard]] const std::unordered_map<Entity, HostileComponent>& Hostiles() const { return m_hostiles; }
    [[nodiscard]] const std::unordered_map<Entity, NameComponent>& Names() const { return m_names; }

private:
    Entity m_nextEntity = 1;
    std::unordered_map<Entity, Transform> m_transforms;
    std::unordered_map<Entity, PlayerComponent> m_players;
    std::unordered_map<Entity, PickupComponent> m_pickups;
    std::unordered_map<Entity, HostileComponent> m_hostiles;
    std::unordered_map<Entity, NameComponent> m_names;
};
} // namespace engine::scene
