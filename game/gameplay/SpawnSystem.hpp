#pragma once

#include <functional>
#include <optional>
#include <random>
#include <string>

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

#include "engine/scene/Components.hpp"
#include "game/gameplay/GroundPlacement.hpp"

namespace game::gameplay
{
/**
 * Spawn directors decide when and where pickups and hostiles enter the world.
 *
 * Every attempt draws a horizontal offset, asks the ground placement service for a
 * terrain-anchored point and either instantiates an entity there or skips the attempt.
 * A skipped attempt is never retried; the next scheduled attempt is independent.
 */

namespace SpawnConstants
{
    constexpr int DEFAULT_COIN_AMOUNT = 20;
    constexpr float DEFAULT_COIN_AREA_WIDTH = 20.0F;
    constexpr float DEFAULT_COIN_AREA_DEPTH = 50.0F;
    constexpr float DEFAULT_COIN_RAYCAST_HEIGHT = 20.0F;
    constexpr float DEFAULT_COIN_Y_OFFSET = 0.5F;

    constexpr float DEFAULT_ENEMY_SPAWN_RADIUS = 15.0F;
    constexpr float DEFAULT_ENEMY_SPAWN_INTERVAL = 5.0F;
    constexpr float DEFAULT_ENEMY_RAYCAST_HEIGHT = 30.0F;
    constexpr float DEFAULT_ENEMY_Y_OFFSET = 0.1F;
}

struct SpawnStats
{
    int attempts = 0;
    int spawned = 0;
    int skipped = 0;
};

class SpawnDirector
{
public:
    using SpawnCallback = std::function<engine::scene::Entity(const glm::vec3& position)>;

    SpawnDirector(std::string name, const GroundPlacementService& placement, SpawnCallback spawn, unsigned int seed);
    virtual ~SpawnDirector() = default;

    SpawnDirector(const SpawnDirector&) = delete;
    SpawnDirector& operator=(const SpawnDirector&) = delete;

    /// Inactive directors do no work at all; Tick() returns immediately.
    void Activate();
    void Deactivate();
    [[nodiscard]] bool IsActive() const { return m_active; }

    void Tick(float deltaSeconds);

    [[nodiscard]] const std::string& Name() const { return m_name; }
    [[nodiscard]] const SpawnStats& Stats() const { return m_stats; }

protected:
    virtual void OnActivated() {}
    virtual void OnTick(float deltaSeconds) { (void)deltaSeconds; }

    /// One placement attempt. Returns the spawned position, or nothing if skipped.
    std::optional<glm::vec3> TrySpawnAt(const glm::vec3& origin, float searchHeight, float clearance);

    float RandomRange(float minValue, float maxValue);

private:
    std::string m_name;
    const GroundPlacementService& m_placement;
    SpawnCallback m_spawn;
    std::mt19937 m_rng;
    SpawnStats m_stats;
    bool m_active = false;
};

struct BurstSpawnSettings
{
    int count = SpawnConstants::DEFAULT_COIN_AMOUNT;
    glm::vec2 areaSize{SpawnConstants::DEFAULT_COIN_AREA_WIDTH, SpawnConstants::DEFAULT_COIN_AREA_DEPTH};
    float raycastHeight = SpawnConstants::DEFAULT_COIN_RAYCAST_HEIGHT;
    float yOffset = SpawnConstants::DEFAULT_COIN_Y_OFFSET;
};

/// Spawns `count` entities once, the first time it is activated, inside a rectangle
/// centred on its own position.
class BurstSpawnDirector final : public SpawnDirector
{
public:
    BurstSpawnDirector(
        std::string name,
        const GroundPlacementService& placement,
        SpawnCallback spawn,
        const glm::vec3& position,
        const BurstSpawnSettings& settings,
        unsigned int seed
    );

    /// Runs every attempt of the burst and returns how many entities were created.
    int SpawnBurst();

    [[nodiscard]] bool HasSpawned() const { return m_burstDone; }
    [[nodiscard]] const BurstSpawnSettings& Settings() const { return m_settings; }

protected:
    void OnActivated() override;

private:
    glm::vec3 m_position;
    BurstSpawnSettings m_settings;
    bool m_burstDone = false;
};

struct PeriodicSpawnSettings
{
    float interval = SpawnConstants::DEFAULT_ENEMY_SPAWN_INTERVAL;
    float radius = SpawnConstants::DEFAULT_ENEMY_SPAWN_RADIUS;
    float raycastHeight = SpawnConstants::DEFAULT_ENEMY_RAYCAST_HEIGHT;
    float yOffset = SpawnConstants::DEFAULT_ENEMY_Y_OFFSET;
};

/// Spawns one entity every `interval` seconds of simulated time on a ring of fixed
/// radius around the target (the player).
class PeriodicSpawnDirector final : public SpawnDirector
{
public:
    using TargetProvider = std::function<std::optional<glm::vec3>()>;

    PeriodicSpawnDirector(
        std::string name,
        const GroundPlacementService& placement,
        SpawnCallback spawn,
        TargetProvider target,
        const PeriodicSpawnSettings& settings,
        unsigned int seed
    );

    [[nodiscard]] float Accumulator() const { return m_timer; }
    [[nodiscard]] const PeriodicSpawnSettings& Settings() const { return m_settings; }

protected:
    void OnActivated() override;
    void OnTick(float deltaSeconds) override;

private:
    void SpawnAround(const glm::vec3& center);

    TargetProvider m_target;
    PeriodicSpawnSettings m_settings;
    float m_timer = 0.0F;
    bool m_warnedMissingTarget = false;
};
} // namespace game::gameplay
