#pragma once

#include <optional>

#include <glm/vec3.hpp>

#include "engine/physics/PhysicsWorld.hpp"

namespace game::gameplay
{
/// Terrain-anchored point, or nothing when the probe found no ground.
using PlacementResult = std::optional<glm::vec3>;

/// Finds spawn points on uneven ground with a single vertical probe.
class GroundPlacementService
{
public:
    static constexpr float kDefaultClearance = 0.1F;

    explicit GroundPlacementService(const engine::physics::PhysicsWorld& physics);

    /// Casts one ray from origin + up * searchHeight down to origin - up * searchHeight,
    /// considering only surfaces in groundFilter. The hit point is lifted by clearance.
    /// No retries: an empty result means this attempt should be skipped.
    [[nodiscard]] PlacementResult FindGroundPoint(
        const glm::vec3& origin,
        float searchHeight,
        engine::physics::LayerMask groundFilter = engine::physics::LayerBit(engine::physics::CollisionLayer::Ground),
        float clearance = kDefaultClearance
    ) const;

private:
    const engine::physics::PhysicsWorld& m_physics;
};
} // namespace game::gameplay
