#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <random>
#include <utility>
#include <vector>

#include "engine/physics/PhysicsWorld.hpp"
#include "engine/scene/World.hpp"
#include "game/gameplay/GameplayTuning.hpp"
#include "game/gameplay/GroundPlacement.hpp"
#include "game/gameplay/HostileSystem.hpp"
#include "game/gameplay/PickupSystem.hpp"
#include "game/gameplay/PlayerAvatar.hpp"
#include "game/gameplay/PlayerHealth.hpp"
#include "game/gameplay/SessionController.hpp"
#include "game/gameplay/SpawnSystem.hpp"

namespace engine::core
{
class EventBus;
class Time;
}

namespace engine::platform
{
class Input;
}

namespace game::ui
{
class TextLabel;
class ValueBar;
}

namespace game::gameplay
{
struct HudBindings
{
    SessionSurfaces session;
    ui::ValueBar* healthBar = nullptr;
    ui::TextLabel* healthText = nullptr;
};

/**
 * Owns one play session and drives it frame by frame.
 *
 * A restart throws the whole session away (world, health, score, directors) and
 * builds a fresh one at the start of the next Tick(). References obtained from the
 * session accessors do not survive that rebuild.
 *
 * Tick order: pending rebuild, time, input, directors, player, pickups, hostiles,
 * contacts, event dispatch.
 */
class GameplaySystems
{
public:
    using QuitHandler = std::function<void()>;

    GameplaySystems(
        engine::core::Time& time,
        engine::core::EventBus& eventBus,
        engine::physics::PhysicsWorld& physics,
        engine::platform::Input& input
    );
    ~GameplaySystems();

    GameplaySystems(const GameplaySystems&) = delete;
    GameplaySystems& operator=(const GameplaySystems&) = delete;

    /// Takes effect on the next BuildSession() (or restart).
    void ApplyGameplayTuning(const GameplayTuning& tuning);
    [[nodiscard]] const GameplayTuning& Tuning() const { return m_tuning; }

    void BindHud(const HudBindings& hud);
    void SetQuitHandler(QuitHandler handler) { m_quitHandler = std::move(handler); }

    void BuildSession();
    void Tick(double rawDeltaSeconds);

    [[nodiscard]] bool HasSession() const { return m_session != nullptr; }
    [[nodiscard]] bool ReloadPending() const { return m_reloadPending; }
    [[nodiscard]] bool QuitRequested() const { return m_quitRequested; }
    [[nodiscard]] int SessionCount() const { return m_sessionCount; }

    [[nodiscard]] SessionController& Session();
    [[nodiscard]] PlayerHealth& Health();
    [[nodiscard]] PlayerAvatar& Avatar();
    [[nodiscard]] PickupSystem& Pickups();
    [[nodiscard]] HostileSystem& Hostiles();
    [[nodiscard]] BurstSpawnDirector& CoinDirector();
    [[nodiscard]] PeriodicSpawnDirector& EnemyDirector();
    [[nodiscard]] engine::scene::World& SessionWorld();

private:
    struct SessionData;

    void HandleInput();
    void ResolveContacts();
    unsigned int NextSeed();

    engine::core::Time& m_time;
    engine::core::EventBus& m_eventBus;
    engine::physics::PhysicsWorld& m_physics;
    engine::platform::Input& m_input;

    GameplayTuning m_tuning;
    HudBindings m_hud;
    QuitHandler m_quitHandler;

    std::unique_ptr<SessionData> m_session;
    std::mt19937 m_seedRng;
    std::vector<engine::physics::TriggerHit> m_contactScratch;

    bool m_reloadPending = false;
    bool m_quitRequested = false;
    int m_sessionCount = 0;
};
} // namespace game::gameplay
