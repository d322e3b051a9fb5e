#pragma once

#include <cstdint>
#include <string>

#include <glm/vec3.hpp>

namespace engine::scene
{
using Entity = std::uint32_t;

constexpr Entity kInvalidEntity = 0;

struct Transform
{
    glm::vec3 position{0.0F, 0.0F, 0.0F};
    glm::vec3 rotationEuler{0.0F, 0.0F, 0.0F};
    glm::vec3 scale{1.0F, 1.0F, 1.0F};
    glm::vec3 forward{0.0F, 0.0F, -1.0F};
};

struct PlayerComponent
{
    float moveSpeed = 5.0F;
    float capsuleRadius = 0.45F;
    float capsuleHeight = 1.8F;
    bool inputEnabled = false;
};

struct PickupComponent
{
    int value = 1;
    float rotateSpeedDegrees = 90.0F;
    float radius = 0.5F;
};

struct HostileComponent
{
    float moveSpeed = 10.0F;
    float stopDistance = 1.0F;
    int damage = 20;
    float groundOffset = 0.1F;
    float contactRadius = 0.6F;

    // Read by the animation collaborator.
    bool moving = false;
    float animSpeed = 0.0F;
};

struct NameComponent
{
    std::string name;
};
} // namespace engine::scene
