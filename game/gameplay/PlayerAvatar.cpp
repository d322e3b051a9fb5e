#include "game/gameplay/PlayerAvatar.hpp"

#include <algorithm>
#include <cmath>
#include <optional>

#include <glm/geometric.hpp>
#include <glm/trigonometric.hpp>

#include "engine/physics/PhysicsWorld.hpp"
#include "engine/scene/World.hpp"

namespace game::gameplay
{
PlayerAvatar::PlayerAvatar(engine::scene::World& world, const engine::physics::PhysicsWorld& physics)
    : m_world(world)
    , m_physics(physics)
{
}

engine::scene::Entity PlayerAvatar::Spawn(const glm::vec3& position, const engine::scene::PlayerComponent& player)
{
    m_entity = m_world.CreateEntity();

    engine::scene::Transform transform;
    transform.position = position;
    const std::optional<float> ground = m_physics.SampleGroundHeight(position.x, position.z);
    if (ground.has_value())
    {
        transform.position.y = *ground;
    }

    m_world.Transforms()[m_entity] = transform;
    m_world.Players()[m_entity] = player;
    m_world.Players()[m_entity].inputEnabled = m_inputEnabled;
    m_world.Names()[m_entity] = engine::scene::NameComponent{"Player"};
    return m_entity;
}

void PlayerAvatar::Update(const glm::vec2& moveAxis, float deltaSeconds)
{
    if (!m_inputEnabled)
    {
        return;
    }

    auto transformIt = m_world.Transforms().find(m_entity);
    auto playerIt = m_world.Players().find(m_entity);
    if (transformIt == m_world.Transforms().end() || playerIt == m_world.Players().end())
    {
        return;
    }

    engine::scene::Transform& transform = transformIt->second;
    glm::vec3 wish{moveAxis.x, 0.0F, -moveAxis.y};
    const float wishLength = glm::length(wish);
    if (wishLength > 1.0e-4F)
    {
        wish /= std::max(1.0F, wishLength);
        transform.position += wish * playerIt->second.moveSpeed * deltaSeconds;

        const glm::vec3 facing = glm::normalize(wish);
        transform.forward = facing;
        transform.rotationEuler.y = glm::degrees(std::atan2(-facing.x, -facing.z));
    }

    const std::optional<float> ground = m_physics.SampleGroundHeight(transform.position.x, transform.position.z);
    if (ground.has_value())
    {
        transform.position.y = *ground;
    }
}

void PlayerAvatar::SetInputEnabled(bool enabled)
{
    m_inputEnabled = enabled;
    auto playerIt = m_world.Players().find(m_entity);
    if (playerIt != m_world.Players().end())
    {
        playerIt->second.inputEnabled = enabled;
    }
}

glm::vec3 PlayerAvatar::Position() const
{
    const auto transformIt = m_world.Transforms().find(m_entity);
    return transformIt != m_world.Transforms().end() ? transformIt->second.position : glm::vec3{0.0F};
}

glm::vec3 PlayerAvatar::CapsuleCenter() const
{
    const auto playerIt = m_world.Players().find(m_entity);
    const float halfHeight = playerIt != m_world.Players().end() ? playerIt->second.capsuleHeight * 0.5F : 0.9F;
    return Position() + glm::vec3{0.0F, halfHeight, 0.0F};
}
} // namespace game::gameplay
