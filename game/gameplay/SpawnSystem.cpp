#include "game/gameplay/SpawnSystem.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

#include <glm/gtc/constants.hpp>

namespace game::gameplay
{
SpawnDirector::SpawnDirector(std::string name, const GroundPlacementService& placement, SpawnCallback spawn, unsigned int seed)
    : m_name(std::move(name))
    , m_placement(placement)
    , m_spawn(std::move(spawn))
    , m_rng(seed)
{
}

void SpawnDirector::Activate()
{
    if (m_active)
    {
        return;
    }
    m_active = true;
    OnActivated();
}

void SpawnDirector::Deactivate()
{
    m_active = false;
}

void SpawnDirector::Tick(float deltaSeconds)
{
    if (!m_active)
    {
        return;
    }
    OnTick(deltaSeconds);
}

std::optional<glm::vec3> SpawnDirector::TrySpawnAt(const glm::vec3& origin, float searchHeight, float clearance)
{
    ++m_stats.attempts;

    const PlacementResult point = m_placement.FindGroundPoint(
        origin,
        searchHeight,
        engine::physics::LayerBit(engine::physics::CollisionLayer::Ground),
        clearance
    );
    if (!point.has_value())
    {
        ++m_stats.skipped;
        return std::nullopt;
    }

    if (m_spawn)
    {
        m_spawn(*point);
    }
    ++m_stats.spawned;
    return point;
}

float SpawnDirector::RandomRange(float minValue, float maxValue)
{
    if (maxValue <= minValue)
    {
        return minValue;
    }
    std::uniform_real_distribution<float> distribution(minValue, maxValue);
    return distribution(m_rng);
}

BurstSpawnDirector::BurstSpawnDirector(
    std::string name,
    const GroundPlacementService& placement,
    SpawnCallback spawn,
    const glm::vec3& position,
    const BurstSpawnSettings& settings,
    unsigned int seed
)
    : SpawnDirector(std::move(name), placement, std::move(spawn), seed)
    , m_position(position)
    , m_settings(settings)
{
}

void BurstSpawnDirector::OnActivated()
{
    if (m_burstDone)
    {
        return;
    }
    SpawnBurst();
}

int BurstSpawnDirector::SpawnBurst()
{
    m_burstDone = true;

    const float halfWidth = m_settings.areaSize.x * 0.5F;
    const float halfDepth = m_settings.areaSize.y * 0.5F;

    int spawned = 0;
    int skipped = 0;
    for (int i = 0; i < m_settings.count; ++i)
    {
        const glm::vec3 offset{RandomRange(-halfWidth, halfWidth), 0.0F, RandomRange(-halfDepth, halfDepth)};
        if (TrySpawnAt(m_position + offset, m_settings.raycastHeight, m_settings.yOffset).has_value())
        {
            ++spawned;
        }
        else
        {
            ++skipped;
        }
    }

    if (skipped > 0)
    {
        std::cerr << "[" << Name() << "] Warning: " << skipped << " of " << m_settings.count
                  << " placements found no ground and were skipped\n";
    }
    std::cout << "[" << Name() << "] Spawned " << spawned << " entities\n";
    return spawned;
}

PeriodicSpawnDirector::PeriodicSpawnDirector(
    std::string name,
    const GroundPlacementService& placement,
    SpawnCallback spawn,
    TargetProvider target,
    const PeriodicSpawnSettings& settings,
    unsigned int seed
)
    : SpawnDirector(std::move(name), placement, std::move(spawn), seed)
    , m_target(std::move(target))
    , m_settings(settings)
{
}

void PeriodicSpawnDirector::OnActivated()
{
    const bool hasTarget = m_target && m_target().has_value();
    if (!hasTarget && !m_warnedMissingTarget)
    {
        std::cerr << "[" << Name() << "] Warning: no player target assigned; periodic spawning stays idle\n";
        m_warnedMissingTarget = true;
    }
}

void PeriodicSpawnDirector::OnTick(float deltaSeconds)
{
    if (!m_target)
    {
        return;
    }
    const std::optional<glm::vec3> center = m_target();
    if (!center.has_value())
    {
        return;
    }

    m_timer += std::max(0.0F, deltaSeconds);
    if (m_timer >= m_settings.interval)
    {
        m_timer = 0.0F;
        SpawnAround(*center);
    }
}

void PeriodicSpawnDirector::SpawnAround(const glm::vec3& center)
{
    const float angle = RandomRange(0.0F, glm::two_pi<float>());
    const glm::vec3 offset{std::cos(angle) * m_settings.radius, 0.0F, std::sin(angle) * m_settings.radius};

    if (!TrySpawnAt(center + offset, m_settings.raycastHeight, m_settings.yOffset).has_value())
    {
        std::cerr << "[" << Name() << "] Warning: no ground under spawn point, skipping this spawn\n";
    }
}
} // namespace game::gameplay
