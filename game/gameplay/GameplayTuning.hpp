#pragma once

#include <string>

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

namespace game::gameplay
{
struct GameplayTuning
{
    int assetVersion = 1;

    // Session
    int maxHealth = 100;
    int scorePerCoin = 10;
    bool autoStart = false;
    unsigned int rngSeed = 0; // 0 picks a random seed per session

    // Player stand-in
    glm::vec3 playerSpawn{0.0F, 0.0F, 0.0F};
    float playerMoveSpeed = 5.0F;
    float playerCapsuleRadius = 0.45F;
    float playerCapsuleHeight = 1.8F;

    // Coin pickups and their burst spawner
    int coinValue = 1;
    float coinRotateSpeedDegrees = 90.0F;
    float coinPickupRadius = 0.5F;
    glm::vec3 coinSpawnerPosition{0.0F, 0.0F, 0.0F};
    int coinAmount = 20;
    float coinYOffset = 0.5F;
    glm::vec2 coinAreaSize{20.0F, 50.0F};
    float coinRaycastHeight = 20.0F;

    // Hostiles
    float enemyMoveSpeed = 10.0F;
    float enemyStopDistance = 1.0F;
    int enemyDamage = 20;
    float enemyGroundOffset = 0.1F;
    float enemyContactRadius = 0.6F;

    // Hostile periodic spawner
    float enemySpawnRadius = 15.0F;
    float enemySpawnInterval = 5.0F;
    float enemyRaycastHeight = 30.0F;
    float enemySpawnYOffset = 0.1F;
};

/// Reads tuning from a JSON file. Missing or mistyped keys keep their current values.
/// A missing file is created with the current values. Returns false (and fills
/// outStatus) when the file exists but cannot be opened or parsed.
[[nodiscard]] bool LoadGameplayTuning(const std::string& path, GameplayTuning& tuning, std::string* outStatus = nullptr);
[[nodiscard]] bool SaveGameplayTuning(const std::string& path, const GameplayTuning& tuning, std::string* outStatus = nullptr);

/// Clamps values that would break invariants (non-positive max health, negative speeds...).
void SanitizeGameplayTuning(GameplayTuning& tuning);
} // namespace game::gameplay
