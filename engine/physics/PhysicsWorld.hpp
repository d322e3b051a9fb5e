#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include <glm/vec3.hpp>

#include "engine/physics/HeightField.hpp"
#include "engine/scene/Components.hpp"

namespace engine::physics
{
enum class CollisionLayer : std::uint32_t
{
    Ground = 1U << 0U,
    Environment = 1U << 1U
};

using LayerMask = std::uint32_t;

constexpr LayerMask kAllLayers = 0xFFFFFFFFU;

[[nodiscard]] constexpr LayerMask LayerBit(CollisionLayer layer)
{
    return static_cast<LayerMask>(layer);
}

enum class TriggerKind
{
    Pickup,
    Hostile
};

struct SolidBox
{
    engine::scene::Entity entity = 0;
    glm::vec3 center{0.0F};
    glm::vec3 halfExtents{0.5F};
    CollisionLayer layer = CollisionLayer::Environment;
};

struct TriggerVolume
{
    engine::scene::Entity entity = 0;
    glm::vec3 center{0.0F};
    glm::vec3 halfExtents{0.5F};
    TriggerKind kind = TriggerKind::Pickup;
};

struct TriggerHit
{
    engine::scene::Entity entity = 0;
    TriggerKind kind = TriggerKind::Pickup;
};

struct RaycastHit
{
    engine::scene::Entity entity = 0;
    float t = 1.0F;
    glm::vec3 position{0.0F};
    glm::vec3 normal{0.0F, 1.0F, 0.0F};
    CollisionLayer layer = CollisionLayer::Environment;
};

class PhysicsWorld
{
public:
    void Clear();

    void AddSolidBox(const SolidBox& box);

    /// Terrain hits report entity 0 on CollisionLayer::Ground.
    void SetTerrain(HeightField terrain);

    void AddTrigger(const TriggerVolume& trigger);

    /// Update center of an existing trigger by entity. Returns true if found.
    bool UpdateTriggerCenter(engine::scene::Entity entity, const glm::vec3& newCenter);
    bool RemoveTrigger(engine::scene::Entity entity);
    void ClearTriggers();

    [[nodiscard]] const std::vector<TriggerVolume>& Triggers() const { return m_triggers; }

    /// Nearest hit along from->to among solids and terrain whose layer is in the mask.
    [[nodiscard]] std::optional<RaycastHit> RaycastNearest(
        const glm::vec3& from,
        const glm::vec3& to,
        LayerMask layerMask = kAllLayers
    ) const;

    /// Terrain height at (x, z), or nothing when there is no terrain underneath.
    [[nodiscard]] std::optional<float> SampleGroundHeight(float x, float z) const;

    /// Triggers of one kind overlapping an upright capsule centered at position. Reuses out.
    void QueryCapsuleTriggers(
        std::vector<TriggerHit>& out,
        const glm::vec3& position,
        float radius,
        float capsuleHeight,
        TriggerKind kind
    ) const;

private:
    static bool SegmentIntersectsAabb3D(
        const glm::vec3& from,
        const glm::vec3& to,
        const glm::vec3& minBounds,
        const glm::vec3& maxBounds,
        float* outT,
        glm::vec3* outNormal
    );

    std::vector<SolidBox> m_solids;
    std::vector<TriggerVolume> m_triggers;

    HeightField m_terrain;
    bool m_hasTerrain = false;

};
} // namespace engine::physics
