#include "engine/scene/World.hpp"

namespace engine::scene
{
Entity World::CreateEntity()
{
    return m_nextEntity++;
}

bool World::DestroyEntity(Entity entity)
{
    if (!HasEntity(entity))
    {
        return false;
    }

    m_transforms.erase(entity);
    m_players.erase(entity);
    m_pickups.erase(entity);
    m_hostiles.erase(entity);
    m_names.erase(entity);
    return true;
}

void World::Clear()
{
    m_nextEntity = 1;
    m_transforms.clear();
    m_players.clear();
    m_pickups.clear();
    m_hostiles.clear();
    m_names.clear();
}

bool World::HasEntity(Entity entity) const
{
    return m_transforms.contains(entity) || m_players.contains(entity) || m_pickups.contains(entity) ||
           m_hostiles.contains(entity) || m_names.contains(entity);
}
} // namespace engine::scene
