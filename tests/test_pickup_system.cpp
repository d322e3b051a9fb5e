#include <gtest/gtest.h>

#include "engine/core/EventBus.hpp"
#include "engine/core/Time.hpp"
#include "engine/physics/PhysicsWorld.hpp"
#include "engine/scene/World.hpp"
#include "game/gameplay/PickupSystem.hpp"
#include "game/gameplay/SessionController.hpp"

using namespace game::gameplay;

namespace
{
class PickupSystemTest : public ::testing::Test
{
protected:
    engine::scene::World world;
    engine::physics::PhysicsWorld physics;
    engine::core::Time time;
    engine::core::EventBus bus;
    SessionController session{time, bus, 10};
    PickupSystem pickups{world, physics};
};
} // namespace

TEST_F(PickupSystemTest, SpawnRegistersTriggerAtPosition)
{
    engine::scene::PickupComponent coin;
    coin.radius = 0.5F;
    const auto entity = pickups.SpawnPickup(glm::vec3{1.0F, 0.5F, -2.0F}, coin);

    EXPECT_EQ(pickups.ActiveCount(), 1U);
    ASSERT_EQ(physics.Triggers().size(), 1U);
    EXPECT_EQ(physics.Triggers()[0].entity, entity);
    EXPECT_EQ(physics.Triggers()[0].kind, engine::physics::TriggerKind::Pickup);
    EXPECT_FLOAT_EQ(physics.Triggers()[0].center.z, -2.0F);
}

TEST_F(PickupSystemTest, RotationWrapsToFullTurn)
{
    engine::scene::PickupComponent coin;
    coin.rotateSpeedDegrees = 90.0F;
    const auto entity = pickups.SpawnPickup(glm::vec3{0.0F}, coin);

    pickups.Update(5.0F);
    EXPECT_NEAR(world.Transforms().at(entity).rotationEuler.y, 90.0F, 1e-4F);

    world.Pickups().at(entity).rotateSpeedDegrees = -90.0F;
    pickups.Update(2.0F);
    EXPECT_NEAR(world.Transforms().at(entity).rotationEuler.y, 270.0F, 1e-4F);
}

TEST_F(PickupSystemTest, FrozenTimeDoesNotRotate)
{
    const auto entity = pickups.SpawnPickup(glm::vec3{0.0F}, engine::scene::PickupComponent{});
    pickups.Update(0.0F);
    EXPECT_FLOAT_EQ(world.Transforms().at(entity).rotationEuler.y, 0.0F);
}

TEST_F(PickupSystemTest, ContactReportsValueAndRemovesPickup)
{
    engine::scene::PickupComponent coin;
    coin.value = 3;
    const auto entity = pickups.SpawnPickup(glm::vec3{0.0F}, coin);

    EXPECT_TRUE(pickups.HandleContact(entity, session));

    EXPECT_EQ(session.Score().coins, 3);
    EXPECT_EQ(session.Score().score, 10);
    EXPECT_FALSE(world.HasEntity(entity));
    EXPECT_TRUE(physics.Triggers().empty());
    EXPECT_EQ(pickups.ActiveCount(), 0U);
}

TEST_F(PickupSystemTest, SecondContactDoesNotReportAgain)
{
    const auto entity = pickups.SpawnPickup(glm::vec3{0.0F}, engine::scene::PickupComponent{});

    EXPECT_TRUE(pickups.HandleContact(entity, session));
    EXPECT_FALSE(pickups.HandleContact(entity, session));

    EXPECT_EQ(session.Score().coins, 1);
    EXPECT_EQ(session.Score().score, 10);
}

TEST_F(PickupSystemTest, DestroyedPickupIsNotReported)
{
    const auto entity = pickups.SpawnPickup(glm::vec3{0.0F}, engine::scene::PickupComponent{});
    world.DestroyEntity(entity);

    EXPECT_FALSE(pickups.HandleContact(entity, session));
    EXPECT_EQ(session.Score().coins, 0);
}
