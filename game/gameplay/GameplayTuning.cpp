#include "game/gameplay/GameplayTuning.hpp"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>

#include <glm/common.hpp>
#include <nlohmann/json.hpp>

namespace game::gameplay
{
namespace
{
using json = nlohmann::json;

void SetStatus(std::string* outStatus, const std::string& text)
{
    if (outStatus != nullptr)
    {
        *outStatus = text;
    }
}

json Vec3ToJson(const glm::vec3& value)
{
    return json::array({value.x, value.y, value.z});
}

json Vec2ToJson(const glm::vec2& value)
{
    return json::array({value.x, value.y});
}
} // namespace

bool SaveGameplayTuning(const std::string& path, const GameplayTuning& tuning, std::string* outStatus)
{
    json root;
    root["asset_version"] = tuning.assetVersion;
    root["max_health"] = tuning.maxHealth;
    root["score_per_coin"] = tuning.scorePerCoin;
    root["auto_start"] = tuning.autoStart;
    root["rng_seed"] = tuning.rngSeed;

    root["player_spawn"] = Vec3ToJson(tuning.playerSpawn);
    root["player_move_speed"] = tuning.playerMoveSpeed;
    root["player_capsule_radius"] = tuning.playerCapsuleRadius;
    root["player_capsule_height"] = tuning.playerCapsuleHeight;

    root["coin_value"] = tuning.coinValue;
    root["coin_rotate_speed_deg"] = tuning.coinRotateSpeedDegrees;
    root["coin_pickup_radius"] = tuning.coinPickupRadius;
    root["coin_spawner_position"] = Vec3ToJson(tuning.coinSpawnerPosition);
    root["coin_amount"] = tuning.coinAmount;
    root["coin_y_offset"] = tuning.coinYOffset;
    root["coin_area_size"] = Vec2ToJson(tuning.coinAreaSize);
    root["coin_raycast_height"] = tuning.coinRaycastHeight;

    root["enemy_move_speed"] = tuning.enemyMoveSpeed;
    root["enemy_stop_distance"] = tuning.enemyStopDistance;
    root["enemy_damage"] = tuning.enemyDamage;
    root["enemy_ground_offset"] = tuning.enemyGroundOffset;
    root["enemy_contact_radius"] = tuning.enemyContactRadius;

    root["enemy_spawn_radius"] = tuning.enemySpawnRadius;
    root["enemy_spawn_interval"] = tuning.enemySpawnInterval;
    root["enemy_raycast_height"] = tuning.enemyRaycastHeight;
    root["enemy_spawn_y_offset"] = tuning.enemySpawnYOffset;

    const std::filesystem::path filePath(path);
    if (filePath.has_parent_path())
    {
        std::error_code error;
        std::filesystem::create_directories(filePath.parent_path(), error);
    }

    std::ofstream stream(filePath);
    if (!stream.is_open())
    {
        SetStatus(outStatus, "Failed to write gameplay tuning config.");
        return false;
    }

    stream << root.dump(2) << "\n";
    SetStatus(outStatus, "Gameplay tuning saved.");
    return true;
}

bool LoadGameplayTuning(const std::string& path, GameplayTuning& tuning, std::string* outStatus)
{
    if (!std::filesystem::exists(path))
    {
        return SaveGameplayTuning(path, tuning, outStatus);
    }

    std::ifstream stream(path);
    if (!stream.is_open())
    {
        SetStatus(outStatus, "Failed to open gameplay tuning config.");
        std::cerr << "[Config] Warning: failed to open " << path << "\n";
        return false;
    }

    json root;
    try
    {
        stream >> root;
    }
    catch (const std::exception& ex)
    {
        SetStatus(outStatus, "Invalid gameplay tuning JSON. Using defaults.");
        std::cerr << "[Config] Warning: " << path << " is not valid JSON (" << ex.what() << ")\n";
        return false;
    }

    if (!root.is_object())
    {
        SetStatus(outStatus, "Gameplay tuning root must be an object. Using defaults.");
        std::cerr << "[Config] Warning: " << path << " root is not an object\n";
        return false;
    }

    auto readFloat = [&](const char* key, float& target) {
        if (root.contains(key) && root[key].is_number())
        {
            target = root[key].get<float>();
        }
    };
    // Integers outside the target type's range keep the current value.
    auto readInt = [&](const char* key, int& target) {
        if (!root.contains(key) || !root[key].is_number_integer())
        {
            return;
        }
        const json& value = root[key];
        const bool inRange = value.is_number_unsigned()
            ? value.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
            : value.get<std::int64_t>() >= std::numeric_limits<int>::min()
                && value.get<std::int64_t>() <= std::numeric_limits<int>::max();
        if (!inRange)
        {
            std::cerr << "[Config] Warning: " << key << " is out of range; keeping " << target << "\n";
            return;
        }
        target = static_cast<int>(value.get<std::int64_t>());
    };
    auto readBool = [&](const char* key, bool& target) {
        if (root.contains(key) && root[key].is_boolean())
        {
            target = root[key].get<bool>();
        }
    };
    auto readVec3 = [&](const char* key, glm::vec3& target) {
        if (!root.contains(key) || !root[key].is_array() || root[key].size() != 3)
        {
            return;
        }
        const json& values = root[key];
        if (values[0].is_number() && values[1].is_number() && values[2].is_number())
        {
            target = glm::vec3{values[0].get<float>(), values[1].get<float>(), values[2].get<float>()};
        }
    };
    auto readVec2 = [&](const char* key, glm::vec2& target) {
        if (!root.contains(key) || !root[key].is_array() || root[key].size() != 2)
        {
            return;
        }
        const json& values = root[key];
        if (values[0].is_number() && values[1].is_number())
        {
            target = glm::vec2{values[0].get<float>(), values[1].get<float>()};
        }
    };

    readInt("asset_version", tuning.assetVersion);
    readInt("max_health", tuning.maxHealth);
    readInt("score_per_coin", tuning.scorePerCoin);
    readBool("auto_start", tuning.autoStart);
    if (root.contains("rng_seed") && root["rng_seed"].is_number_unsigned())
    {
        const std::uint64_t seed = root["rng_seed"].get<std::uint64_t>();
        if (seed <= std::numeric_limits<unsigned int>::max())
        {
            tuning.rngSeed = static_cast<unsigned int>(seed);
        }
        else
        {
            std::cerr << "[Config] Warning: rng_seed is out of range; keeping " << tuning.rngSeed << "\n";
        }
    }

    readVec3("player_spawn", tuning.playerSpawn);
    readFloat("player_move_speed", tuning.playerMoveSpeed);
    readFloat("player_capsule_radius", tuning.playerCapsuleRadius);
    readFloat("player_capsule_height", tuning.playerCapsuleHeight);

    readInt("coin_value", tuning.coinValue);
    readFloat("coin_rotate_speed_deg", tuning.coinRotateSpeedDegrees);
    readFloat("coin_pickup_radius", tuning.coinPickupRadius);
    readVec3("coin_spawner_position", tuning.coinSpawnerPosition);
    readInt("coin_amount", tuning.coinAmount);
    readFloat("coin_y_offset", tuning.coinYOffset);
    readVec2("coin_area_size", tuning.coinAreaSize);
    readFloat("coin_raycast_height", tuning.coinRaycastHeight);

    readFloat("enemy_move_speed", tuning.enemyMoveSpeed);
    readFloat("enemy_stop_distance", tuning.enemyStopDistance);
    readInt("enemy_damage", tuning.enemyDamage);
    readFloat("enemy_ground_offset", tuning.enemyGroundOffset);
    readFloat("enemy_contact_radius", tuning.enemyContactRadius);

    readFloat("enemy_spawn_radius", tuning.enemySpawnRadius);
    readFloat("enemy_spawn_interval", tuning.enemySpawnInterval);
    readFloat("enemy_raycast_height", tuning.enemyRaycastHeight);
    readFloat("enemy_spawn_y_offset", tuning.enemySpawnYOffset);

    SanitizeGameplayTuning(tuning);
    SetStatus(outStatus, "Gameplay tuning loaded.");
    return true;
}

void SanitizeGameplayTuning(GameplayTuning& tuning)
{
    tuning.maxHealth = std::max(1, tuning.maxHealth);
    tuning.scorePerCoin = std::max(0, tuning.scorePerCoin);

    tuning.playerMoveSpeed = std::max(0.0F, tuning.playerMoveSpeed);
    tuning.playerCapsuleRadius = std::max(0.01F, tuning.playerCapsuleRadius);
    tuning.playerCapsuleHeight = std::max(tuning.playerCapsuleRadius * 2.0F, tuning.playerCapsuleHeight);

    tuning.coinValue = std::max(0, tuning.coinValue);
    tuning.coinPickupRadius = std::max(0.01F, tuning.coinPickupRadius);
    tuning.coinAmount = std::max(0, tuning.coinAmount);
    tuning.coinAreaSize = glm::max(tuning.coinAreaSize, glm::vec2{0.0F});
    tuning.coinRaycastHeight = std::max(0.0F, tuning.coinRaycastHeight);

    tuning.enemyMoveSpeed = std::max(0.0F, tuning.enemyMoveSpeed);
    tuning.enemyStopDistance = std::max(0.0F, tuning.enemyStopDistance);
    tuning.enemyDamage = std::max(0, tuning.enemyDamage);
    tuning.enemyContactRadius = std::max(0.01F, tuning.enemyContactRadius);

    tuning.enemySpawnRadius = std::max(0.0F, tuning.enemySpawnRadius);
    tuning.enemySpawnInterval = std::max(0.01F, tuning.enemySpawnInterval);
    tuning.enemyRaycastHeight = std::max(0.0F, tuning.enemyRaycastHeight);
}
} // namespace game::gameplay
