#pragma once

#include <optional>
#include <string>

#include <glm/vec2.hpp>

#include "engine/core/EventBus.hpp"
#include "engine/core/Time.hpp"
#include "engine/physics/PhysicsWorld.hpp"
#include "engine/platform/Input.hpp"
#include "game/gameplay/GameplaySystems.hpp"
#include "game/ui/ConsoleHud.hpp"

namespace engine::core
{
struct AppSettings
{
    std::string configPath = "config/gameplay.json";
    int maxFrames = 3600;
    std::optional<unsigned int> seed;
    double frameDeltaSeconds = 1.0 / 60.0;
    int pauseAtFrame = 300;
    int pauseFrames = 60;
};

/// Headless host: owns the frame loop, feeds scripted input and prints a summary.
class App
{
public:
    explicit App(AppSettings settings);

    bool Run();

private:
    void BuildTerrain();
    void SubscribeToSession();
    void FeedInput(int frame);
    [[nodiscard]] glm::vec2 AutopilotAxis();
    void PrintSummary() const;

    AppSettings m_settings;

    Time m_time;
    EventBus m_eventBus;
    physics::PhysicsWorld m_physics;
    platform::Input m_input;
    game::gameplay::GameplaySystems m_gameplay;

    game::ui::ConsolePanel m_mainMenu{"MainMenu"};
    game::ui::ConsolePanel m_settingsPanel{"Settings"};
    game::ui::ConsolePanel m_pausePanel{"Pause"};
    game::ui::ConsolePanel m_gameOverPanel{"GameOver"};
    game::ui::ConsoleTextLabel m_coinsText{"CoinsText"};
    game::ui::ConsoleTextLabel m_scoreText{"ScoreText"};
    game::ui::ConsoleValueBar m_healthBar{"HealthBar"};
    game::ui::ConsoleTextLabel m_healthText{"HealthText"};

    int m_framesRun = 0;
    int m_pickupsCollected = 0;
    int m_hitsTaken = 0;
    int m_entitiesSpawned = 0;
    bool m_playerDied = false;
    bool m_pauseScripted = false;
};
} // namespace engine::core
