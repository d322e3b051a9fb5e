#include "game/gameplay/PickupSystem.hpp"

#include <cmath>

#include "engine/physics/PhysicsWorld.hpp"
#include "engine/scene/World.hpp"
#include "game/gameplay/SessionController.hpp"

namespace game::gameplay
{
PickupSystem::PickupSystem(engine::scene::World& world, engine::physics::PhysicsWorld& physics)
    : m_world(world)
    , m_physics(physics)
{
}

engine::scene::Entity PickupSystem::SpawnPickup(const glm::vec3& position, const engine::scene::PickupComponent& pickup)
{
    const engine::scene::Entity entity = m_world.CreateEntity();

    engine::scene::Transform transform;
    transform.position = position;
    m_world.Transforms()[entity] = transform;
    m_world.Pickups()[entity] = pickup;
    m_world.Names()[entity] = engine::scene::NameComponent{"Coin"};

    m_physics.AddTrigger(engine::physics::TriggerVolume{
        entity,
        position,
        glm::vec3{pickup.radius},
        engine::physics::TriggerKind::Pickup,
    });
    return entity;
}

void PickupSystem::Update(float deltaSeconds)
{
    for (auto& [entity, pickup] : m_world.Pickups())
    {
        auto transformIt = m_world.Transforms().find(entity);
        if (transformIt == m_world.Transforms().end())
        {
            continue;
        }

        float& yaw = transformIt->second.rotationEuler.y;
        yaw = std::fmod(yaw + pickup.rotateSpeedDegrees * deltaSeconds, 360.0F);
        if (yaw < 0.0F)
        {
            yaw += 360.0F;
        }
    }
}

bool PickupSystem::HandleContact(engine::scene::Entity pickup, SessionController& session)
{
    const auto pickupIt = m_world.Pickups().find(pickup);
    if (pickupIt == m_world.Pickups().end())
    {
        return false;
    }

    const int value = pickupIt->second.value;
    m_physics.RemoveTrigger(pickup);
    if (!m_world.DestroyEntity(pickup))
    {
        return false;
    }

    session.AddCollectible(value);
    return true;
}

std::size_t PickupSystem::ActiveCount() const
{
    return m_world.Pickups().size();
}
} // namespace game::gameplay
