#include "game/gameplay/GameplaySystems.hpp"

#include <iostream>
#include <optional>
#include <string>

#include "engine/core/EventBus.hpp"
#include "engine/core/Time.hpp"
#include "engine/platform/Input.hpp"
#include "game/gameplay/GameEvents.hpp"

namespace game::gameplay
{
namespace
{
engine::core::Event SpawnedEvent(const std::string& directorName, const glm::vec3& position)
{
    return engine::core::Event{
        events::kEntitySpawned,
        {directorName, std::to_string(position.x), std::to_string(position.y), std::to_string(position.z)},
    };
}
} // namespace

struct GameplaySystems::SessionData
{
    SessionData(
        engine::core::Time& time,
        engine::core::EventBus& eventBus,
        engine::physics::PhysicsWorld& physics,
        const GameplayTuning& tuning
    )
        : placement(physics)
        , health(tuning.maxHealth, &eventBus)
        , controller(time, eventBus, tuning.scorePerCoin)
        , avatar(world, physics)
        , pickups(world, physics)
        , hostiles(world, physics)
    {
    }

    engine::scene::World world;
    GroundPlacementService placement;
    PlayerHealth health;
    SessionController controller;
    PlayerAvatar avatar;
    PickupSystem pickups;
    HostileSystem hostiles;
    std::unique_ptr<BurstSpawnDirector> coinDirector;
    std::unique_ptr<PeriodicSpawnDirector> enemyDirector;
};

GameplaySystems::GameplaySystems(
    engine::core::Time& time,
    engine::core::EventBus& eventBus,
    engine::physics::PhysicsWorld& physics,
    engine::platform::Input& input
)
    : m_time(time)
    , m_eventBus(eventBus)
    , m_physics(physics)
    , m_input(input)
{
    ApplyGameplayTuning(m_tuning);
}

GameplaySystems::~GameplaySystems() = default;

void GameplaySystems::ApplyGameplayTuning(const GameplayTuning& tuning)
{
    m_tuning = tuning;
    SanitizeGameplayTuning(m_tuning);

    if (m_tuning.rngSeed != 0U)
    {
        m_seedRng.seed(m_tuning.rngSeed);
    }
    else
    {
        std::random_device device;
        m_seedRng.seed(device());
    }
}

void GameplaySystems::BindHud(const HudBindings& hud)
{
    m_hud = hud;
    if (m_session != nullptr)
    {
        m_session->controller.BindSurfaces(m_hud.session);
        m_session->health.BindSurfaces(m_hud.healthBar, m_hud.healthText);
    }
}

unsigned int GameplaySystems::NextSeed()
{
    return static_cast<unsigned int>(m_seedRng());
}

void GameplaySystems::BuildSession()
{
    m_reloadPending = false;
    m_session.reset();
    m_physics.ClearTriggers();

    m_session = std::make_unique<SessionData>(m_time, m_eventBus, m_physics, m_tuning);
    SessionData& session = *m_session;
    ++m_sessionCount;

    engine::scene::PlayerComponent player;
    player.moveSpeed = m_tuning.playerMoveSpeed;
    player.capsuleRadius = m_tuning.playerCapsuleRadius;
    player.capsuleHeight = m_tuning.playerCapsuleHeight;
    const engine::scene::Entity playerEntity = session.avatar.Spawn(m_tuning.playerSpawn, player);
    session.hostiles.SetTarget(playerEntity);

    engine::scene::PickupComponent coin;
    coin.value = m_tuning.coinValue;
    coin.rotateSpeedDegrees = m_tuning.coinRotateSpeedDegrees;
    coin.radius = m_tuning.coinPickupRadius;

    BurstSpawnSettings coinSettings;
    coinSettings.count = m_tuning.coinAmount;
    coinSettings.areaSize = m_tuning.coinAreaSize;
    coinSettings.raycastHeight = m_tuning.coinRaycastHeight;
    coinSettings.yOffset = m_tuning.coinYOffset;

    session.coinDirector = std::make_unique<BurstSpawnDirector>(
        "CoinSpawner",
        session.placement,
        [this, &session, coin](const glm::vec3& position) {
            const engine::scene::Entity entity = session.pickups.SpawnPickup(position, coin);
            m_eventBus.Publish(SpawnedEvent("CoinSpawner", position));
            return entity;
        },
        m_tuning.coinSpawnerPosition,
        coinSettings,
        NextSeed()
    );

    engine::scene::HostileComponent enemy;
    enemy.moveSpeed = m_tuning.enemyMoveSpeed;
    enemy.stopDistance = m_tuning.enemyStopDistance;
    enemy.damage = m_tuning.enemyDamage;
    enemy.groundOffset = m_tuning.enemyGroundOffset;
    enemy.contactRadius = m_tuning.enemyContactRadius;

    PeriodicSpawnSettings enemySettings;
    enemySettings.interval = m_tuning.enemySpawnInterval;
    enemySettings.radius = m_tuning.enemySpawnRadius;
    enemySettings.raycastHeight = m_tuning.enemyRaycastHeight;
    enemySettings.yOffset = m_tuning.enemySpawnYOffset;

    session.enemyDirector = std::make_unique<PeriodicSpawnDirector>(
        "EnemySpawner",
        session.placement,
        [this, &session, enemy](const glm::vec3& position) {
            const engine::scene::Entity entity = session.hostiles.SpawnHostile(position, enemy);
            m_eventBus.Publish(SpawnedEvent("EnemySpawner", position));
            return entity;
        },
        [&session]() -> std::optional<glm::vec3> {
            const auto it = session.world.Transforms().find(session.avatar.Entity());
            if (it == session.world.Transforms().end())
            {
                return std::nullopt;
            }
            return it->second.position;
        },
        enemySettings,
        NextSeed()
    );

    session.health.BindSurfaces(m_hud.healthBar, m_hud.healthText);
    session.health.SetDeathCallback([&session]() { session.controller.ReportDeath(); });

    session.controller.BindSurfaces(m_hud.session);
    session.controller.BindPlayerInput(&session.avatar);
    session.controller.BindCursor(&m_input);
    session.controller.RegisterSpawnDirector(session.coinDirector.get());
    session.controller.RegisterSpawnDirector(session.enemyDirector.get());
    session.controller.SetReloadHandler([this]() { m_reloadPending = true; });
    session.controller.SetQuitHandler([this]() {
        m_quitRequested = true;
        if (m_quitHandler)
        {
            m_quitHandler();
        }
    });

    session.controller.Initialize();
    std::cout << "[Gameplay] Session " << m_sessionCount << " ready\n";

    if (m_tuning.autoStart)
    {
        session.controller.StartSession();
    }
}

void GameplaySystems::Tick(double rawDeltaSeconds)
{
    if (m_session == nullptr || m_reloadPending)
    {
        BuildSession();
    }

    m_time.Advance(rawDeltaSeconds);
    const float dt = static_cast<float>(m_time.DeltaSeconds());

    HandleInput();

    // A quit stops the simulation for good; queued notifications still go out.
    SessionData& session = *m_session;
    if (!m_quitRequested && !m_reloadPending && session.controller.State() == SessionState::Playing)
    {
        session.coinDirector->Tick(dt);
        session.enemyDirector->Tick(dt);
        session.avatar.Update(m_input.MoveAxis(), dt);
        session.pickups.Update(dt);
        session.hostiles.Update(dt);
        ResolveContacts();
    }

    m_eventBus.DispatchQueued();
}

void GameplaySystems::HandleInput()
{
    using engine::platform::Key;
    SessionController& controller = m_session->controller;

    if (m_input.IsKeyPressed(Key::Q))
    {
        controller.Quit();
        return;
    }
    if (m_input.IsKeyPressed(Key::Escape))
    {
        controller.TogglePause();
    }
    if (m_input.IsKeyPressed(Key::Enter) && controller.State() == SessionState::Menu)
    {
        controller.StartSession();
    }
    if (m_input.IsKeyPressed(Key::R)
        && (controller.State() == SessionState::Paused || controller.State() == SessionState::GameOver))
    {
        controller.Restart();
    }
}

void GameplaySystems::ResolveContacts()
{
    SessionData& session = *m_session;
    const auto playerIt = session.world.Players().find(session.avatar.Entity());
    if (playerIt == session.world.Players().end())
    {
        return;
    }
    const engine::scene::PlayerComponent& player = playerIt->second;
    const glm::vec3 center = session.avatar.CapsuleCenter();

    m_physics.QueryCapsuleTriggers(m_contactScratch, center, player.capsuleRadius, player.capsuleHeight, engine::physics::TriggerKind::Pickup);
    for (const engine::physics::TriggerHit& hit : m_contactScratch)
    {
        session.pickups.HandleContact(hit.entity, session.controller);
    }

    m_physics.QueryCapsuleTriggers(m_contactScratch, center, player.capsuleRadius, player.capsuleHeight, engine::physics::TriggerKind::Hostile);
    for (const engine::physics::TriggerHit& hit : m_contactScratch)
    {
        session.hostiles.HandleContact(hit.entity, session.health);
    }
}

SessionController& GameplaySystems::Session()
{
    if (m_session == nullptr)
    {
        BuildSession();
    }
    return m_session->controller;
}

PlayerHealth& GameplaySystems::Health()
{
    if (m_session == nullptr)
    {
        BuildSession();
    }
    return m_session->health;
}

PlayerAvatar& GameplaySystems::Avatar()
{
    if (m_session == nullptr)
    {
        BuildSession();
    }
    return m_session->avatar;
}

PickupSystem& GameplaySystems::Pickups()
{
    if (m_session == nullptr)
    {
        BuildSession();
    }
    return m_session->pickups;
}

HostileSystem& GameplaySystems::Hostiles()
{
    if (m_session == nullptr)
    {
        BuildSession();
    }
    return m_session->hostiles;
}

BurstSpawnDirector& GameplaySystems::CoinDirector()
{
    if (m_session == nullptr)
    {
        BuildSession();
    }
    return *m_session->coinDirector;
}

PeriodicSpawnDirector& GameplaySystems::EnemyDirector()
{
    if (m_session == nullptr)
    {
        BuildSession();
    }
    return *m_session->enemyDirector;
}

engine::scene::World& GameplaySystems::SessionWorld()
{
    if (m_session == nullptr)
    {
        BuildSession();
    }
    return m_session->world;
}
} // namespace game::gameplay
