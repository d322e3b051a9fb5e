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
class PlayerHealth;

/// Enemies that chase the player across the terrain and are consumed on contact.
class HostileSystem
{
public:
    static constexpr float kBodyHalfHeight = 0.9F;

    HostileSystem(engine::scene::World& world, engine::physics::PhysicsWorld& physics);

    /// Player to pursue. kInvalidEntity (or an entity without a transform) leaves
    /// hostiles idle; they keep anchoring to the ground.
    void SetTarget(engine::scene::Entity player);
    [[nodiscard]] engine::scene::Entity Target() const { return m_target; }

    engine::scene::Entity SpawnHostile(const glm::vec3& position, const engine::scene::HostileComponent& hostile);

    void Update(float deltaSeconds);

    /// Applies the hostile's damage, then removes it whether or not the player
    /// was still alive. Returns false if the hostile was already gone.
    bool HandleContact(engine::scene::Entity hostile, PlayerHealth& health);

    [[nodiscard]] std::size_t ActiveCount() const;

private:
    void UpdateOne(engine::scene::Entity entity, engine::scene::HostileComponent& hostile, float deltaSeconds, const glm::vec3* targetPosition);

    engine::scene::World& m_world;
    engine::physics::PhysicsWorld& m_physics;
    engine::scene::Entity m_target = engine::scene::kInvalidEntity;
    bool m_warnedMissingTarget = false;
};
} // namespace game::gameplay
