#pragma once

namespace game::gameplay::events
{
// Session lifecycle, consumed by menu / HUD / pause panel listeners.
constexpr const char* kSessionStarted = "session_started";
constexpr const char* kSessionPaused = "session_paused";
constexpr const char* kSessionResumed = "session_resumed";
constexpr const char* kSessionEnded = "session_ended";
constexpr const char* kSessionRestarted = "session_restarted";
constexpr const char* kQuitRequested = "quit_requested";

// args: coins, score
constexpr const char* kScoreChanged = "score_changed";
// args: current, max
constexpr const char* kHealthChanged = "health_changed";
constexpr const char* kPlayerDied = "player_died";
// args: "1" or "0"
constexpr const char* kInputEnabled = "input_enabled";
// args: director name, x, y, z
constexpr const char* kEntitySpawned = "entity_spawned";
} // namespace game::gameplay::events
