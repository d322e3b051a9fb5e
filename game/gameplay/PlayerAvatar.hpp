#pragma once

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

#include "engine/scene/Components.hpp"
#include "game/gameplay/SessionController.hpp"

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
/// Headless stand-in for the locomotion controller: walks on the terrain from a
/// WASD move intent while the session has input enabled.
class PlayerAvatar final : public PlayerInputGate
{
public:
    PlayerAvatar(engine::scene::World& world, const engine::physics::PhysicsWorld& physics);

    engine::scene::Entity Spawn(const glm::vec3& position, const engine::scene::PlayerComponent& player);

    /// moveAxis.x strafes right, moveAxis.y walks forward (-Z).
    void Update(const glm::vec2& moveAxis, float deltaSeconds);

    void SetInputEnabled(bool enabled) override;
    [[nodiscard]] bool IsInputEnabled() const override { return m_inputEnabled; }

    [[nodiscard]] engine::scene::Entity Entity() const { return m_entity; }
    [[nodiscard]] glm::vec3 Position() const;
    /// Center of the collision capsule, used for contact queries.
    [[nodiscard]] glm::vec3 CapsuleCenter() const;

private:
    engine::scene::World& m_world;
    const engine::physics::PhysicsWorld& m_physics;
    engine::scene::Entity m_entity = engine::scene::kInvalidEntity;
    bool m_inputEnabled = false;
};
} // namespace game::gameplay
