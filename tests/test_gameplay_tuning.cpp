#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "game/gameplay/GameplayTuning.hpp"

using game::gameplay::GameplayTuning;

namespace
{
class GameplayTuningTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        path = std::filesystem::temp_directory_path() / (std::string("coinrush_") + info->name() + ".json");
        std::filesystem::remove(path);
    }

    void TearDown() override { std::filesystem::remove(path); }

    void WriteFile(const std::string& text) const
    {
        std::ofstream stream(path);
        stream << text;
    }

    std::filesystem::path path;
};
} // namespace

TEST_F(GameplayTuningTest, MissingFileIsCreatedWithDefaults)
{
    GameplayTuning tuning;
    std::string status;

    EXPECT_TRUE(game::gameplay::LoadGameplayTuning(path.string(), tuning, &status));
    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_EQ(tuning.maxHealth, 100);
    EXPECT_EQ(tuning.scorePerCoin, 10);
    EXPECT_EQ(tuning.coinAmount, 20);
    EXPECT_FLOAT_EQ(tuning.enemySpawnInterval, 5.0F);
    EXPECT_FALSE(status.empty());
}

TEST_F(GameplayTuningTest, OverridesPresentKeysOnly)
{
    WriteFile(R"({"max_health": 150, "coin_area_size": [10, 30], "auto_start": true, "enemy_damage": 35})");
    GameplayTuning tuning;

    ASSERT_TRUE(game::gameplay::LoadGameplayTuning(path.string(), tuning));
    EXPECT_EQ(tuning.maxHealth, 150);
    EXPECT_FLOAT_EQ(tuning.coinAreaSize.x, 10.0F);
    EXPECT_FLOAT_EQ(tuning.coinAreaSize.y, 30.0F);
    EXPECT_TRUE(tuning.autoStart);
    EXPECT_EQ(tuning.enemyDamage, 35);
    EXPECT_EQ(tuning.scorePerCoin, 10);
    EXPECT_FLOAT_EQ(tuning.enemySpawnRadius, 15.0F);
}

TEST_F(GameplayTuningTest, MistypedValuesAreIgnored)
{
    WriteFile(R"({"max_health": "lots", "coin_area_size": [1, 2, 3], "auto_start": 1})");
    GameplayTuning tuning;

    ASSERT_TRUE(game::gameplay::LoadGameplayTuning(path.string(), tuning));
    EXPECT_EQ(tuning.maxHealth, 100);
    EXPECT_FLOAT_EQ(tuning.coinAreaSize.x, 20.0F);
    EXPECT_FALSE(tuning.autoStart);
}

TEST_F(GameplayTuningTest, OutOfRangeIntegersKeepDefaults)
{
    WriteFile(R"({"coin_amount": 5000000000, "enemy_damage": -5000000000, "rng_seed": 8589934592, "max_health": 2147483647})");
    GameplayTuning tuning;

    ASSERT_TRUE(game::gameplay::LoadGameplayTuning(path.string(), tuning));
    EXPECT_EQ(tuning.coinAmount, 20);
    EXPECT_EQ(tuning.enemyDamage, 20);
    EXPECT_EQ(tuning.rngSeed, 0U);
    EXPECT_EQ(tuning.maxHealth, 2147483647);
}

TEST_F(GameplayTuningTest, InvalidJsonFailsAndKeepsDefaults)
{
    WriteFile("{ not json");
    GameplayTuning tuning;
    std::string status;

    EXPECT_FALSE(game::gameplay::LoadGameplayTuning(path.string(), tuning, &status));
    EXPECT_FALSE(status.empty());
    EXPECT_EQ(tuning.maxHealth, 100);
}

TEST_F(GameplayTuningTest, NonObjectRootFails)
{
    WriteFile("[1, 2, 3]");
    GameplayTuning tuning;
    EXPECT_FALSE(game::gameplay::LoadGameplayTuning(path.string(), tuning));
}

TEST_F(GameplayTuningTest, SavedValuesLoadBack)
{
    GameplayTuning saved;
    saved.maxHealth = 60;
    saved.rngSeed = 77U;
    saved.coinSpawnerPosition = glm::vec3{1.0F, 2.0F, 3.0F};
    ASSERT_TRUE(game::gameplay::SaveGameplayTuning(path.string(), saved));

    GameplayTuning loaded;
    ASSERT_TRUE(game::gameplay::LoadGameplayTuning(path.string(), loaded));
    EXPECT_EQ(loaded.maxHealth, 60);
    EXPECT_EQ(loaded.rngSeed, 77U);
    EXPECT_FLOAT_EQ(loaded.coinSpawnerPosition.z, 3.0F);
}

TEST(GameplayTuningSanitize, ClampsBrokenValues)
{
    GameplayTuning tuning;
    tuning.maxHealth = -5;
    tuning.coinAmount = -1;
    tuning.enemySpawnInterval = 0.0F;
    tuning.coinAreaSize = glm::vec2{-3.0F, 4.0F};

    game::gameplay::SanitizeGameplayTuning(tuning);

    EXPECT_EQ(tuning.maxHealth, 1);
    EXPECT_EQ(tuning.coinAmount, 0);
    EXPECT_GT(tuning.enemySpawnInterval, 0.0F);
    EXPECT_FLOAT_EQ(tuning.coinAreaSize.x, 0.0F);
    EXPECT_FLOAT_EQ(tuning.coinAreaSize.y, 4.0F);
}
