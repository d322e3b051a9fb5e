#include <gtest/gtest.h>

#include <utility>

#include "engine/physics/PhysicsWorld.hpp"
#include "game/gameplay/GroundPlacement.hpp"
#include "TestFakes.hpp"

using engine::physics::CollisionLayer;
using engine::physics::LayerBit;
using engine::physics::PhysicsWorld;
using engine::physics::SolidBox;
using game::gameplay::GroundPlacementService;

TEST(GroundPlacement, HitIsLiftedByClearance)
{
    PhysicsWorld physics;
    physics.SetTerrain(coinrush_test::FlatTerrain(41, 1.0F, 1.0F));
    const GroundPlacementService placement(physics);

    const auto point = placement.FindGroundPoint(glm::vec3{2.0F, 0.0F, -3.0F}, 20.0F);
    ASSERT_TRUE(point.has_value());
    EXPECT_FLOAT_EQ(point->x, 2.0F);
    EXPECT_FLOAT_EQ(point->z, -3.0F);
    EXPECT_NEAR(point->y, 1.0F + GroundPlacementService::kDefaultClearance, 1e-5F);

    const auto custom = placement.FindGroundPoint(glm::vec3{2.0F, 0.0F, -3.0F}, 20.0F, LayerBit(CollisionLayer::Ground), 0.5F);
    ASSERT_TRUE(custom.has_value());
    EXPECT_NEAR(custom->y, 1.5F, 1e-5F);
}

TEST(GroundPlacement, GapYieldsNoGround)
{
    PhysicsWorld physics;
    auto terrain = coinrush_test::FlatTerrain();
    terrain.CarveHole(-5.0F, -5.0F, 5.0F, 5.0F);
    physics.SetTerrain(std::move(terrain));
    const GroundPlacementService placement(physics);

    EXPECT_FALSE(placement.FindGroundPoint(glm::vec3{0.0F}, 20.0F).has_value());
    EXPECT_FALSE(placement.FindGroundPoint(glm::vec3{4.5F, 0.0F, -4.5F}, 20.0F).has_value());
    EXPECT_TRUE(placement.FindGroundPoint(glm::vec3{8.0F, 0.0F, 0.0F}, 20.0F).has_value());
}

TEST(GroundPlacement, GroundOutsideSearchRangeIsNotFound)
{
    PhysicsWorld physics;
    physics.SetTerrain(coinrush_test::FlatTerrain(41, 1.0F, -30.0F));
    const GroundPlacementService placement(physics);

    EXPECT_FALSE(placement.FindGroundPoint(glm::vec3{0.0F}, 20.0F).has_value());
    EXPECT_TRUE(placement.FindGroundPoint(glm::vec3{0.0F}, 40.0F).has_value());
}

TEST(GroundPlacement, IgnoresSurfacesNotInFilter)
{
    PhysicsWorld physics;
    physics.SetTerrain(coinrush_test::FlatTerrain());
    SolidBox roof;
    roof.entity = 3;
    roof.center = glm::vec3{0.0F, 4.0F, 0.0F};
    roof.halfExtents = glm::vec3{2.0F, 0.25F, 2.0F};
    roof.layer = CollisionLayer::Environment;
    physics.AddSolidBox(roof);
    const GroundPlacementService placement(physics);

    const auto point = placement.FindGroundPoint(glm::vec3{0.0F}, 20.0F);
    ASSERT_TRUE(point.has_value());
    EXPECT_NEAR(point->y, GroundPlacementService::kDefaultClearance, 1e-5F);
}

TEST(GroundPlacement, NonPositiveSearchHeightFindsNothing)
{
    PhysicsWorld physics;
    physics.SetTerrain(coinrush_test::FlatTerrain());
    const GroundPlacementService placement(physics);

    EXPECT_FALSE(placement.FindGroundPoint(glm::vec3{0.0F, 0.5F, 0.0F}, 0.0F).has_value());
    EXPECT_FALSE(placement.FindGroundPoint(glm::vec3{0.0F, 0.5F, 0.0F}, -3.0F).has_value());
}
