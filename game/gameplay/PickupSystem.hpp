#pragma once

#include <cstddef>

#include <glm/vec3.hpp>

#include "engine/scene/Components.hpp"

namespace engine::scene
{
class World;
}

namespace engine::physics
{
class PhysicsWorld;
}

namespace game::gameplay
{
class SessionController;

/// Rotating collectibles. Each pickup is a world entity plus a trigger volume.
class PickupSystem
{
public:
    PickupSystem(engine::scene::World& world, engine::physics::PhysicsWorld& physics);

    engine::scene::Entity SpawnPickup(const glm::vec3& position, const engine::scene::PickupComponent& pickup);

    /// Visual spin only; yaw stays in [0, 360).
    void Update(float deltaSeconds);

    /// Reports the pickup's value and removes it. A pickup that is already gone
    /// reports nothing, so a pickup is never counted twice.
    bool HandleContact(engine::scene::Entity pickup, SessionController& session);

    [[nodiscard]] std::size_t ActiveCount() const;

private:
    engine::scene::World& m_world;
    engine::physics::PhysicsWorld& m_physics;
};
} // namespace game::gameplay
