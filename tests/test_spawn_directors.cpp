#include <gtest/gtest.h>

#include <cmath>
#include <optional>
#include <utility>
#include <vector>

#include <glm/geometric.hpp>

#include "engine/physics/PhysicsWorld.hpp"
#include "game/gameplay/GroundPlacement.hpp"
#include "game/gameplay/SpawnSystem.hpp"
#include "TestFakes.hpp"

using namespace game::gameplay;

namespace
{
class SpawnDirectorTest : public ::testing::Test
{
protected:
    void UseTerrain(engine::physics::HeightField terrain) { physics.SetTerrain(std::move(terrain)); }

    SpawnDirector::SpawnCallback Recorder()
    {
        return [this](const glm::vec3& position) {
            spawned.push_back(position);
            return static_cast<engine::scene::Entity>(spawned.size());
        };
    }

    engine::physics::PhysicsWorld physics;
    GroundPlacementService placement{physics};
    std::vector<glm::vec3> spawned;
};

BurstSpawnSettings CoinBurst()
{
    BurstSpawnSettings settings;
    settings.count = 20;
    settings.areaSize = glm::vec2{20.0F, 50.0F};
    settings.raycastHeight = 20.0F;
    settings.yOffset = 0.5F;
    return settings;
}

PeriodicSpawnSettings EnemyWave()
{
    PeriodicSpawnSettings settings;
    settings.interval = 5.0F;
    settings.radius = 15.0F;
    settings.raycastHeight = 30.0F;
    settings.yOffset = 0.1F;
    return settings;
}
} // namespace

TEST_F(SpawnDirectorTest, BurstSpawnsInsideItsRectangleOnActivation)
{
    UseTerrain(coinrush_test::FlatTerrain(81));
    BurstSpawnDirector director("CoinSpawner", placement, Recorder(), glm::vec3{2.0F, 0.0F, 1.0F}, CoinBurst(), 42U);

    EXPECT_TRUE(spawned.empty());
    director.Activate();

    ASSERT_EQ(spawned.size(), 20U);
    for (const glm::vec3& position : spawned)
    {
        EXPECT_GE(position.x, 2.0F - 10.0F);
        EXPECT_LE(position.x, 2.0F + 10.0F);
        EXPECT_GE(position.z, 1.0F - 25.0F);
        EXPECT_LE(position.z, 1.0F + 25.0F);
        EXPECT_NEAR(position.y, 0.5F, 1e-5F);
    }
    EXPECT_EQ(director.Stats().spawned, 20);
    EXPECT_TRUE(director.HasSpawned());
}

TEST_F(SpawnDirectorTest, BurstHappensOnlyOnce)
{
    UseTerrain(coinrush_test::FlatTerrain(81));
    BurstSpawnDirector director("CoinSpawner", placement, Recorder(), glm::vec3{0.0F}, CoinBurst(), 1U);

    director.Activate();
    director.Tick(1.0F);
    director.Deactivate();
    director.Activate();
    director.Tick(1.0F);

    EXPECT_EQ(spawned.size(), 20U);
    EXPECT_EQ(director.Stats().attempts, 20);
}

TEST_F(SpawnDirectorTest, BurstOverGapSpawnsNothing)
{
    auto terrain = coinrush_test::FlatTerrain(81);
    terrain.CarveHole(-40.0F, -40.0F, 40.0F, 40.0F);
    UseTerrain(std::move(terrain));
    BurstSpawnDirector director("CoinSpawner", placement, Recorder(), glm::vec3{0.0F}, CoinBurst(), 7U);

    director.Activate();

    EXPECT_TRUE(spawned.empty());
    EXPECT_EQ(director.Stats().attempts, 20);
    EXPECT_EQ(director.Stats().skipped, 20);
    EXPECT_TRUE(director.IsActive());
}

TEST_F(SpawnDirectorTest, BurstSkipsOnlyFailedPlacements)
{
    auto terrain = coinrush_test::FlatTerrain(81);
    terrain.CarveHole(-10.0F, -30.0F, 0.0F, 30.0F);
    UseTerrain(std::move(terrain));
    BurstSpawnDirector director("CoinSpawner", placement, Recorder(), glm::vec3{0.0F}, CoinBurst(), 99U);

    const int created = director.SpawnBurst();

    EXPECT_LE(created, 20);
    EXPECT_EQ(static_cast<int>(spawned.size()), created);
    EXPECT_EQ(director.Stats().spawned + director.Stats().skipped, 20);
    for (const glm::vec3& position : spawned)
    {
        EXPECT_GE(position.x, 0.0F);
    }
}

TEST_F(SpawnDirectorTest, InactivePeriodicDirectorDoesNoWork)
{
    UseTerrain(coinrush_test::FlatTerrain(81));
    PeriodicSpawnDirector director(
        "EnemySpawner", placement, Recorder(), []() { return std::optional<glm::vec3>(glm::vec3{0.0F}); }, EnemyWave(), 3U
    );

    director.Tick(60.0F);

    EXPECT_TRUE(spawned.empty());
    EXPECT_EQ(director.Stats().attempts, 0);
    EXPECT_FLOAT_EQ(director.Accumulator(), 0.0F);
}

TEST_F(SpawnDirectorTest, PeriodicSpawnsOnRingAroundTarget)
{
    UseTerrain(coinrush_test::FlatTerrain(81));
    const glm::vec3 target{3.0F, 0.0F, -2.0F};
    PeriodicSpawnDirector director(
        "EnemySpawner", placement, Recorder(), [target]() { return std::optional<glm::vec3>(target); }, EnemyWave(), 5U
    );
    director.Activate();

    director.Tick(2.5F);
    EXPECT_TRUE(spawned.empty());
    director.Tick(2.5F);

    ASSERT_EQ(spawned.size(), 1U);
    const glm::vec2 offset{spawned[0].x - target.x, spawned[0].z - target.z};
    EXPECT_NEAR(glm::length(offset), 15.0F, 1e-3F);
    EXPECT_NEAR(spawned[0].y, 0.1F, 1e-5F);
    EXPECT_FLOAT_EQ(director.Accumulator(), 0.0F);
}

TEST_F(SpawnDirectorTest, PeriodicSpawnsAtMostOncePerTick)
{
    UseTerrain(coinrush_test::FlatTerrain(81));
    PeriodicSpawnDirector director(
        "EnemySpawner", placement, Recorder(), []() { return std::optional<glm::vec3>(glm::vec3{0.0F}); }, EnemyWave(), 5U
    );
    director.Activate();

    director.Tick(12.0F);

    EXPECT_EQ(spawned.size(), 1U);
    EXPECT_FLOAT_EQ(director.Accumulator(), 0.0F);
}

TEST_F(SpawnDirectorTest, DeactivationStopsAttemptsAndKeepsProgress)
{
    UseTerrain(coinrush_test::FlatTerrain(81));
    PeriodicSpawnDirector director(
        "EnemySpawner", placement, Recorder(), []() { return std::optional<glm::vec3>(glm::vec3{0.0F}); }, EnemyWave(), 5U
    );
    director.Activate();
    director.Tick(3.0F);

    director.Deactivate();
    director.Tick(10.0F);
    EXPECT_TRUE(spawned.empty());
    EXPECT_EQ(director.Stats().attempts, 0);
    EXPECT_FLOAT_EQ(director.Accumulator(), 3.0F);

    director.Activate();
    director.Tick(2.0F);
    EXPECT_EQ(spawned.size(), 1U);
}

TEST_F(SpawnDirectorTest, PeriodicWithoutTargetStaysIdle)
{
    UseTerrain(coinrush_test::FlatTerrain(81));
    PeriodicSpawnDirector director(
        "EnemySpawner", placement, Recorder(), []() { return std::optional<glm::vec3>{}; }, EnemyWave(), 5U
    );
    director.Activate();

    director.Tick(20.0F);

    EXPECT_TRUE(spawned.empty());
    EXPECT_EQ(director.Stats().attempts, 0);
}

TEST_F(SpawnDirectorTest, PeriodicOverGapSkipsAttempt)
{
    auto terrain = coinrush_test::FlatTerrain(81);
    terrain.CarveHole(-40.0F, -40.0F, 40.0F, 40.0F);
    UseTerrain(std::move(terrain));
    PeriodicSpawnDirector director(
        "EnemySpawner", placement, Recorder(), []() { return std::optional<glm::vec3>(glm::vec3{0.0F}); }, EnemyWave(), 5U
    );
    director.Activate();

    director.Tick(5.0F);
    director.Tick(5.0F);

    EXPECT_TRUE(spawned.empty());
    EXPECT_EQ(director.Stats().attempts, 2);
    EXPECT_EQ(director.Stats().skipped, 2);
    EXPECT_FLOAT_EQ(director.Accumulator(), 0.0F);
}
