#include "engine/physics/PhysicsWorld.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include <glm/geometric.hpp>

namespace engine::physics
{
namespace
{
float ClampFloat(float value, float minValue, float maxValue)
{
    return std::max(minValue, std::min(value, maxValue));
}

glm::vec3 ClosestPointOnAabb(const glm::vec3& point, const glm::vec3& minBounds, const glm::vec3& maxBounds)
{
    return glm::vec3{
        ClampFloat(point.x, minBounds.x, maxBounds.x),
        ClampFloat(point.y, minBounds.y, maxBounds.y),
        ClampFloat(point.z, minBounds.z, maxBounds.z),
    };
}
} // namespace

void PhysicsWorld::Clear()
{
    m_solids.clear();
    m_triggers.clear();
    m_terrain = HeightField{};
    m_hasTerrain = false;
}

void PhysicsWorld::AddSolidBox(const SolidBox& box)
{
    m_solids.push_back(box);
}

void PhysicsWorld::SetTerrain(HeightField terrain)
{
    m_terrain = std::move(terrain);
    m_hasTerrain = !m_terrain.Empty();
}

void PhysicsWorld::AddTrigger(const TriggerVolume& trigger)
{
    m_triggers.push_back(trigger);
}

bool PhysicsWorld::UpdateTriggerCenter(engine::scene::Entity entity, const glm::vec3& newCenter)
{
    for (TriggerVolume& trigger : m_triggers)
    {
        if (trigger.entity == entity)
        {
            trigger.center = newCenter;
            return true;
        }
    }
    return false;
}

bool PhysicsWorld::RemoveTrigger(engine::scene::Entity entity)
{
    const auto it = std::remove_if(m_triggers.begin(), m_triggers.end(), [entity](const TriggerVolume& trigger) {
        return trigger.entity == entity;
    });
    const bool removed = it != m_triggers.end();
    m_triggers.erase(it, m_triggers.end());
    return removed;
}

void PhysicsWorld::ClearTriggers()
{
    m_triggers.clear();
}

std::optional<RaycastHit> PhysicsWorld::RaycastNearest(
    const glm::vec3& from,
    const glm::vec3& to,
    LayerMask layerMask
) const
{
    std::optional<RaycastHit> best;

    for (const SolidBox& box : m_solids)
    {
        if ((LayerBit(box.layer) & layerMask) == 0U)
        {
            continue;
        }

        const glm::vec3 minBounds = box.center - box.halfExtents;
        const glm::vec3 maxBounds = box.center + box.halfExtents;

        float hitT = 1.0F;
        glm::vec3 hitNormal{0.0F, 1.0F, 0.0F};
        if (!SegmentIntersectsAabb3D(from, to, minBounds, maxBounds, &hitT, &hitNormal))
        {
            continue;
        }

        if (!best.has_value() || hitT < best->t)
        {
            RaycastHit hit;
            hit.entity = box.entity;
            hit.t = hitT;
            hit.normal = hitNormal;
            hit.position = from + (to - from) * hitT;
            hit.layer = box.layer;
            best = hit;
        }
    }

    if (m_hasTerrain && (LayerBit(CollisionLayer::Ground) & layerMask) != 0U)
    {
        const std::optional<HeightFieldHit> terrainHit = m_terrain.Raycast(from, to);
        if (terrainHit.has_value() && (!best.has_value() || terrainHit->t < best->t))
        {
            RaycastHit hit;
            hit.entity = 0;
            hit.t = terrainHit->t;
            hit.position = terrainHit->position;
            hit.normal = terrainHit->normal;
            hit.layer = CollisionLayer::Ground;
            best = hit;
        }
    }

    return best;
}

std::optional<float> PhysicsWorld::SampleGroundHeight(float x, float z) const
{
    if (!m_hasTerrain)
    {
        return std::nullopt;
    }
    return m_terrain.SampleHeight(x, z);
}

void PhysicsWorld::QueryCapsuleTriggers(
    std::vector<TriggerHit>& result,
    const glm::vec3& position,
    float radius,
    float capsuleHeight,
    TriggerKind kind
) const
{
    result.clear();
    const float capsuleHalfSegment = std::max(0.0F, capsuleHeight * 0.5F - radius);

    for (const TriggerVolume& trigger : m_triggers)
    {
        if (trigger.kind != kind)
        {
            continue;
        }

        const glm::vec3 minBounds = trigger.center - trigger.halfExtents - glm::vec3{0.0F, capsuleHalfSegment, 0.0F};
        const glm::vec3 maxBounds = trigger.center + trigger.halfExtents + glm::vec3{0.0F, capsuleHalfSegment, 0.0F};

        const glm::vec3 closestPoint = ClosestPointOnAabb(position, minBounds, maxBounds);
        const glm::vec3 delta = position - closestPoint;
        if (glm::dot(delta, delta) <= radius * radius)
        {
            result.push_back(TriggerHit{trigger.entity, trigger.kind});
        }
    }
}

bool PhysicsWorld::SegmentIntersectsAabb3D(
    const glm::vec3& from,
    const glm::vec3& to,
    const glm::vec3& minBounds,
    const glm::vec3& maxBounds,
    float* outT,
    glm::vec3* outNormal
)
{
    const glm::vec3 direction = to - from;

    float tMin = 0.0F;
    float tMax = 1.0F;
    glm::vec3 bestNormal{0.0F, 1.0F, 0.0F};

    for (int axis = 0; axis < 3; ++axis)
    {
        const float start = from[axis];
        const float dir = direction[axis];
        const float minAxis = minBounds[axis];
        const float maxAxis = maxBounds[axis];

        if (std::abs(dir) < 1.0e-7F)
        {
            if (start < minAxis || start > maxAxis)
            {
                return false;
            }
            continue;
        }

        const float invDir = 1.0F / dir;
        float t1 = (minAxis - start) * invDir;
        float t2 = (maxAxis - start) * invDir;

        glm::vec3 nearNormal{0.0F};
        nearNormal[axis] = (invDir >= 0.0F) ? -1.0F : 1.0F;

        if (t1 > t2)
        {
            std::swap(t1, t2);
        }

        if (t1 > tMin)
        {
            tMin = t1;
            bestNormal = nearNormal;
        }

        tMax = std::min(tMax, t2);
        if (tMin > tMax)
        {
            return false;
        }
    }

    if (tMin < 0.0F || tMin > 1.0F)
    {
        return false;
    }

    if (outT != nullptr)
    {
        *outT = tMin;
    }
    if (outNormal != nullptr)
    {
        *outNormal = bestNormal;
    }

    return true;
}
} // namespace engine::physics
