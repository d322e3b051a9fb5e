#pragma once

#include <functional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace engine::core
{
class EventBus;
class Time;
}

namespace engine::platform
{
class CursorControl;
}

namespace game::ui
{
class Panel;
class TextLabel;
}

namespace game::gameplay
{
class SpawnDirector;

enum class SessionState
{
    Menu,
    Playing,
    Paused,
    GameOver
};

[[nodiscard]] const char* SessionStateName(SessionState state);

/// Locomotion/camera controller side of the "input enabled" toggle.
class PlayerInputGate
{
public:
    virtual ~PlayerInputGate() = default;

    virtual void SetInputEnabled(bool enabled) = 0;
    [[nodiscard]] virtual bool IsInputEnabled() const = 0;
};

struct SessionSurfaces
{
    ui::Panel* mainMenu = nullptr;
    ui::Panel* settings = nullptr;
    ui::Panel* pause = nullptr;
    ui::Panel* gameOver = nullptr;
    ui::TextLabel* coinsText = nullptr;
    ui::TextLabel* scoreText = nullptr;
};

struct ScoreState
{
    int coins = 0;
    int score = 0;
    int scorePerCoin = 10;
};

/**
 * Owns the session state machine:
 *
 *   Menu --StartSession--> Playing --Pause--> Paused --Resume--> Playing
 *                          Playing --ReportDeath--> GameOver
 *
 * Restart() leaves through a full reload, which re-enters Menu. Operations called
 * from a state where they are not defined return false and change nothing.
 */
class SessionController
{
public:
    using ReloadHandler = std::function<void()>;
    using QuitHandler = std::function<void()>;

    SessionController(engine::core::Time& time, engine::core::EventBus& eventBus, int scorePerCoin);

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    void BindSurfaces(const SessionSurfaces& surfaces) { m_surfaces = surfaces; }
    void BindPlayerInput(PlayerInputGate* playerInput) { m_playerInput = playerInput; }
    void BindCursor(engine::platform::CursorControl* cursor) { m_cursor = cursor; }
    void RegisterSpawnDirector(SpawnDirector* director);

    /// Called by Restart() to rebuild the session. Without one the controller
    /// only resets its own state.
    void SetReloadHandler(ReloadHandler handler) { m_reloadHandler = std::move(handler); }
    void SetQuitHandler(QuitHandler handler) { m_quitHandler = std::move(handler); }

    /// Puts collaborators into the Menu configuration.
    void Initialize();

    bool StartSession();
    void AddCollectible(int value);
    bool ReportDeath();
    bool Pause();
    bool Resume();
    /// Escape/cancel: Pause() while playing, Resume() while paused.
    bool TogglePause();
    void Restart();
    void Quit();

    bool OpenSettings();
    bool BackToMainMenu();

    [[nodiscard]] SessionState State() const { return m_state; }
    [[nodiscard]] const ScoreState& Score() const { return m_score; }
    [[nodiscard]] bool QuitRequested() const { return m_quitRequested; }
    [[nodiscard]] bool IsInputEnabled() const { return m_inputEnabled; }

private:
    void SetInputEnabled(bool enabled);
    void SetCursorLocked(bool locked);
    void SetDirectorsActive(bool active);
    void ShowPanel(ui::Panel* panel, const char* surfaceName, bool visible);
    void SetLabel(ui::TextLabel* label, const char* surfaceName, const std::string& text);
    void RefreshScoreUi();
    void Publish(const char* eventName, std::vector<std::string> args = {});
    void WarnMissing(const char* what);

    engine::core::Time& m_time;
    engine::core::EventBus& m_eventBus;

    SessionState m_state = SessionState::Menu;
    ScoreState m_score;

    SessionSurfaces m_surfaces;
    PlayerInputGate* m_playerInput = nullptr;
    engine::platform::CursorControl* m_cursor = nullptr;
    std::vector<SpawnDirector*> m_directors;

    ReloadHandler m_reloadHandler;
    QuitHandler m_quitHandler;

    bool m_inputEnabled = false;
    bool m_quitRequested = false;
    std::unordered_set<std::string> m_warned;
};
} // namespace game::gameplay
