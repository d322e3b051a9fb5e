#include "game/gameplay/GroundPlacement.hpp"

namespace game::gameplay
{
GroundPlacementService::GroundPlacementService(const engine::physics::PhysicsWorld& physics)
    : m_physics(physics)
{
}

PlacementResult GroundPlacementService::FindGroundPoint(
    const glm::vec3& origin,
    float searchHeight,
    engine::physics::LayerMask groundFilter,
    float clearance
) const
{
    if (searchHeight <= 0.0F)
    {
        return std::nullopt;
    }

    const glm::vec3 up{0.0F, 1.0F, 0.0F};
    const glm::vec3 from = origin + up * searchHeight;
    const glm::vec3 to = origin - up * searchHeight;

    const std::optional<engine::physics::RaycastHit> hit = m_physics.RaycastNearest(from, to, groundFilter);
    if (!hit.has_value())
    {
        return std::nullopt;
    }

    return hit->position + up * clearance;
}
} // namespace game::gameplay
