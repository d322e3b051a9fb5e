#include "game/gameplay/SessionController.hpp"

#include <algorithm>
#include <iostream>
#include <limits>
#include <utility>

#include "engine/core/EventBus.hpp"
#include "engine/core/Time.hpp"
#include "engine/platform/Input.hpp"
#include "game/gameplay/GameEvents.hpp"
#include "game/gameplay/SpawnSystem.hpp"
#include "game/ui/HudSurfaces.hpp"

namespace game::gameplay
{
namespace
{
// Counters stop at INT_MAX instead of wrapping.
int SaturatingAdd(int total, int amount)
{
    const int gain = std::max(0, amount);
    return total + std::min(gain, std::numeric_limits<int>::max() - total);
}
} // namespace

const char* SessionStateName(SessionState state)
{
    switch (state)
    {
        case SessionState::Menu: return "Menu";
        case SessionState::Playing: return "Playing";
        case SessionState::Paused: return "Paused";
        case SessionState::GameOver: return "GameOver";
        default: return "Unknown";
    }
}

SessionController::SessionController(engine::core::Time& time, engine::core::EventBus& eventBus, int scorePerCoin)
    : m_time(time)
    , m_eventBus(eventBus)
{
    m_score.scorePerCoin = std::max(0, scorePerCoin);
}

void SessionController::RegisterSpawnDirector(SpawnDirector* director)
{
    if (director == nullptr)
    {
        return;
    }
    if (std::find(m_directors.begin(), m_directors.end(), director) == m_directors.end())
    {
        m_directors.push_back(director);
    }
    if (m_state != SessionState::Playing)
    {
        director->Deactivate();
    }
}

void SessionController::Initialize()
{
    m_state = SessionState::Menu;
    m_time.SetTimeScale(1.0);

    SetCursorLocked(false);
    SetInputEnabled(false);
    SetDirectorsActive(false);

    ShowPanel(m_surfaces.mainMenu, "main menu", true);
    ShowPanel(m_surfaces.settings, "settings", false);
    ShowPanel(m_surfaces.pause, "pause", false);
    ShowPanel(m_surfaces.gameOver, "game over", false);
    RefreshScoreUi();
}

bool SessionController::StartSession()
{
    if (m_state != SessionState::Menu)
    {
        return false;
    }

    m_state = SessionState::Playing;
    ShowPanel(m_surfaces.mainMenu, "main menu", false);
    ShowPanel(m_surfaces.settings, "settings", false);
    SetCursorLocked(true);
    SetInputEnabled(true);
    SetDirectorsActive(true);

    std::cout << "[Session] Started\n";
    Publish(events::kSessionStarted);
    return true;
}

void SessionController::AddCollectible(int value)
{
    m_score.coins = SaturatingAdd(m_score.coins, value);
    m_score.score = SaturatingAdd(m_score.score, m_score.scorePerCoin);

    std::cout << "[Session] Collected " << value << " (coins " << m_score.coins << ", score " << m_score.score << ")\n";
    RefreshScoreUi();
    Publish(events::kScoreChanged, {std::to_string(m_score.coins), std::to_string(m_score.score)});
}

bool SessionController::ReportDeath()
{
    if (m_state != SessionState::Playing)
    {
        return false;
    }

    m_state = SessionState::GameOver;
    m_time.SetTimeScale(0.0);
    SetInputEnabled(false);
    SetDirectorsActive(false);
    SetCursorLocked(false);
    ShowPanel(m_surfaces.pause, "pause", false);
    ShowPanel(m_surfaces.gameOver, "game over", true);

    std::cout << "[Session] Game over (coins " << m_score.coins << ", score " << m_score.score << ")\n";
    Publish(events::kSessionEnded);
    return true;
}

bool SessionController::Pause()
{
    if (m_state != SessionState::Playing)
    {
        return false;
    }

    m_state = SessionState::Paused;
    m_time.SetTimeScale(0.0);
    SetInputEnabled(false);
    SetCursorLocked(false);
    SetDirectorsActive(false);
    ShowPanel(m_surfaces.pause, "pause", true);

    std::cout << "[Session] Paused\n";
    Publish(events::kSessionPaused);
    return true;
}

bool SessionController::Resume()
{
    if (m_state != SessionState::Paused)
    {
        return false;
    }

    m_state = SessionState::Playing;
    m_time.SetTimeScale(1.0);
    SetInputEnabled(true);
    SetCursorLocked(true);
    SetDirectorsActive(true);
    ShowPanel(m_surfaces.pause, "pause", false);

    std::cout << "[Session] Resumed\n";
    Publish(events::kSessionResumed);
    return true;
}

bool SessionController::TogglePause()
{
    if (m_state == SessionState::Playing)
    {
        return Pause();
    }
    if (m_state == SessionState::Paused)
    {
        return Resume();
    }
    return false;
}

void SessionController::Restart()
{
    m_time.SetTimeScale(1.0);
    std::cout << "[Session] Restarting\n";
    Publish(events::kSessionRestarted);

    if (m_reloadHandler)
    {
        m_reloadHandler();
        return;
    }

    m_score.coins = 0;
    m_score.score = 0;
    Initialize();
}

void SessionController::Quit()
{
    if (m_quitRequested)
    {
        return;
    }
    m_quitRequested = true;
    SetDirectorsActive(false);
    SetInputEnabled(false);

    std::cout << "[Session] Quit requested\n";
    Publish(events::kQuitRequested);
    if (m_quitHandler)
    {
        m_quitHandler();
    }
}

bool SessionController::OpenSettings()
{
    if (m_state != SessionState::Menu)
    {
        return false;
    }
    ShowPanel(m_surfaces.mainMenu, "main menu", false);
    ShowPanel(m_surfaces.settings, "settings", true);
    return true;
}

bool SessionController::BackToMainMenu()
{
    if (m_state != SessionState::Menu)
    {
        return false;
    }
    ShowPanel(m_surfaces.settings, "settings", false);
    ShowPanel(m_surfaces.mainMenu, "main menu", true);
    return true;
}

void SessionController::SetInputEnabled(bool enabled)
{
    const bool changed = m_inputEnabled != enabled;
    m_inputEnabled = enabled;

    if (m_playerInput != nullptr)
    {
        m_playerInput->SetInputEnabled(enabled);
    }
    else
    {
        WarnMissing("player input gate");
    }

    if (changed)
    {
        Publish(events::kInputEnabled, {enabled ? "1" : "0"});
    }
}

void SessionController::SetCursorLocked(bool locked)
{
    if (m_cursor != nullptr)
    {
        m_cursor->SetCursorLocked(locked);
    }
    else
    {
        WarnMissing("cursor control");
    }
}

void SessionController::SetDirectorsActive(bool active)
{
    for (SpawnDirector* director : m_directors)
    {
        if (active)
        {
            director->Activate();
        }
        else
        {
            director->Deactivate();
        }
    }
}

void SessionController::ShowPanel(ui::Panel* panel, const char* surfaceName, bool visible)
{
    if (panel == nullptr)
    {
        WarnMissing(surfaceName);
        return;
    }
    panel->SetVisible(visible);
}

void SessionController::SetLabel(ui::TextLabel* label, const char* surfaceName, const std::string& text)
{
    if (label == nullptr)
    {
        WarnMissing(surfaceName);
        return;
    }
    label->SetText(text);
}

void SessionController::RefreshScoreUi()
{
    SetLabel(m_surfaces.coinsText, "coins text", "Coins: " + std::to_string(m_score.coins));
    SetLabel(m_surfaces.scoreText, "score text", "Score: " + std::to_string(m_score.score));
}

void SessionController::Publish(const char* eventName, std::vector<std::string> args)
{
    m_eventBus.Publish(engine::core::Event{eventName, std::move(args)});
}

void SessionController::WarnMissing(const char* what)
{
    if (m_warned.insert(what).second)
    {
        std::cerr << "[Session] Warning: " << what << " not assigned\n";
    }
}
} // namespace game::gameplay
