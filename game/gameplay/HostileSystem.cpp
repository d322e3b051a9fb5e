#include "game/gameplay/HostileSystem.hpp"

#include <cmath>
#include <iostream>
#include <optional>

#include <glm/geometric.hpp>
#include <glm/trigonometric.hpp>

#include "engine/physics/PhysicsWorld.hpp"
#include "engine/scene/World.hpp"
#include "game/gameplay/PlayerHealth.hpp"

namespace game::gameplay
{
HostileSystem::HostileSystem(engine::scene::World& world, engine::physics::PhysicsWorld& physics)
    : m_world(world)
    , m_physics(physics)
{
}

void HostileSystem::SetTarget(engine::scene::Entity player)
{
    m_target = player;
    m_warnedMissingTarget = false;
}

engine::scene::Entity HostileSystem::SpawnHostile(const glm::vec3& position, const engine::scene::HostileComponent& hostile)
{
    const engine::scene::Entity entity = m_world.CreateEntity();

    engine::scene::Transform transform;
    transform.position = position;
    m_world.Transforms()[entity] = transform;
    m_world.Hostiles()[entity] = hostile;
    m_world.Names()[entity] = engine::scene::NameComponent{"Enemy"};

    m_physics.AddTrigger(engine::physics::TriggerVolume{
        entity,
        position + glm::vec3{0.0F, kBodyHalfHeight, 0.0F},
        glm::vec3{hostile.contactRadius, kBodyHalfHeight, hostile.contactRadius},
        engine::physics::TriggerKind::Hostile,
    });
    return entity;
}

void HostileSystem::Update(float deltaSeconds)
{
    const glm::vec3* targetPosition = nullptr;
    const auto targetIt = m_world.Transforms().find(m_target);
    if (targetIt != m_world.Transforms().end())
    {
        targetPosition = &targetIt->second.position;
    }
    else if (!m_warnedMissingTarget && !m_world.Hostiles().empty())
    {
        std::cerr << "[Enemy] Warning: no player found; enemies stay idle\n";
        m_warnedMissingTarget = true;
    }

    for (auto& [entity, hostile] : m_world.Hostiles())
    {
        UpdateOne(entity, hostile, deltaSeconds, targetPosition);
    }
}

void HostileSystem::UpdateOne(
    engine::scene::Entity entity,
    engine::scene::HostileComponent& hostile,
    float deltaSeconds,
    const glm::vec3* targetPosition
)
{
    auto transformIt = m_world.Transforms().find(entity);
    if (transformIt == m_world.Transforms().end())
    {
        return;
    }
    engine::scene::Transform& transform = transformIt->second;

    hostile.moving = false;
    hostile.animSpeed = 0.0F;

    if (targetPosition != nullptr)
    {
        glm::vec3 toTarget = *targetPosition - transform.position;
        toTarget.y = 0.0F;
        const float distance = glm::length(toTarget);

        if (distance > hostile.stopDistance)
        {
            const glm::vec3 direction = toTarget / distance;
            transform.position += direction * hostile.moveSpeed * deltaSeconds;
            transform.forward = direction;
            transform.rotationEuler.y = glm::degrees(std::atan2(-direction.x, -direction.z));
            hostile.moving = true;
            hostile.animSpeed = hostile.moveSpeed;
        }
    }

    // Anchored every frame, moving or not.
    const std::optional<float> groundHeight = m_physics.SampleGroundHeight(transform.position.x, transform.position.z);
    if (groundHeight.has_value())
    {
        transform.position.y = *groundHeight + hostile.groundOffset;
    }

    m_physics.UpdateTriggerCenter(entity, transform.position + glm::vec3{0.0F, kBodyHalfHeight, 0.0F});
}

bool HostileSystem::HandleContact(engine::scene::Entity hostile, PlayerHealth& health)
{
    const auto hostileIt = m_world.Hostiles().find(hostile);
    if (hostileIt == m_world.Hostiles().end())
    {
        return false;
    }

    health.ApplyDamage(hostileIt->second.damage);

    m_physics.RemoveTrigger(hostile);
    m_world.DestroyEntity(hostile);
    return true;
}

std::size_t HostileSystem::ActiveCount() const
{
    return m_world.Hostiles().size();
}
} // namespace game::gameplay
