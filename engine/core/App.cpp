#include "engine/core/App.hpp"

#include <cmath>
#include <iostream>
#include <iterator>
#include <limits>
#include <string>
#include <utility>

#include <glm/geometric.hpp>

#include "game/gameplay/GameEvents.hpp"

namespace engine::core
{
namespace
{
constexpr int kTerrainVertices = 81;
constexpr float kTerrainSpacing = 1.0F;

float RollingHeight(float x, float z)
{
    return 0.6F * std::sin(x * 0.15F) + 0.4F * std::cos(z * 0.2F);
}
} // namespace

App::App(AppSettings settings)
    : m_settings(std::move(settings))
    , m_gameplay(m_time, m_eventBus, m_physics, m_input)
{
}

bool App::Run()
{
    std::cout << "CoinRush headless session\n";

    game::gameplay::GameplayTuning tuning;
    std::string status;
    if (!game::gameplay::LoadGameplayTuning(m_settings.configPath, tuning, &status))
    {
        std::cerr << "[App] Warning: " << status << "; using defaults\n";
    }
    else
    {
        std::cout << "[App] " << status << "\n";
    }
    if (m_settings.seed.has_value())
    {
        tuning.rngSeed = *m_settings.seed;
    }

    BuildTerrain();
    SubscribeToSession();

    m_gameplay.ApplyGameplayTuning(tuning);
    game::gameplay::HudBindings hud;
    hud.session.mainMenu = &m_mainMenu;
    hud.session.settings = &m_settingsPanel;
    hud.session.pause = &m_pausePanel;
    hud.session.gameOver = &m_gameOverPanel;
    hud.session.coinsText = &m_coinsText;
    hud.session.scoreText = &m_scoreText;
    hud.healthBar = &m_healthBar;
    hud.healthText = &m_healthText;
    m_gameplay.BindHud(hud);
    m_gameplay.BuildSession();

    for (int frame = 0; !m_gameplay.QuitRequested(); ++frame)
    {
        m_input.BeginFrame();
        FeedInput(frame);
        m_gameplay.Tick(m_settings.frameDeltaSeconds);
        ++m_framesRun;
    }

    PrintSummary();
    return true;
}

void App::BuildTerrain()
{
    const float halfExtent = 0.5F * kTerrainSpacing * static_cast<float>(kTerrainVertices - 1);
    physics::HeightField terrain(kTerrainVertices, kTerrainVertices, kTerrainSpacing, glm::vec3{-halfExtent, 0.0F, -halfExtent});

    for (int z = 0; z < kTerrainVertices; ++z)
    {
        for (int x = 0; x < kTerrainVertices; ++x)
        {
            const float worldX = -halfExtent + static_cast<float>(x) * kTerrainSpacing;
            const float worldZ = -halfExtent + static_cast<float>(z) * kTerrainSpacing;
            terrain.SetHeight(x, z, RollingHeight(worldX, worldZ));
        }
    }

    // A ravine across part of the coin field; placements over it find no ground.
    terrain.CarveHole(4.0F, -24.0F, 9.0F, -12.0F);

    m_physics.Clear();
    m_physics.SetTerrain(std::move(terrain));

    // Footbridge over the middle of the ravine; coins probing it land on the deck.
    physics::SolidBox bridge;
    bridge.center = glm::vec3{6.5F, 0.3F, -18.0F};
    bridge.halfExtents = glm::vec3{3.0F, 0.1F, 1.0F};
    bridge.layer = physics::CollisionLayer::Ground;
    m_physics.AddSolidBox(bridge);

    // Tree canopies over the field. Placement probes pass through them to the ground below.
    const glm::vec3 canopies[] = {
        glm::vec3{-5.0F, 4.0F, 6.0F},
        glm::vec3{2.0F, 4.5F, -4.0F},
        glm::vec3{-3.0F, 4.0F, 16.0F},
    };
    for (const glm::vec3& center : canopies)
    {
        physics::SolidBox canopy;
        canopy.center = center;
        canopy.halfExtents = glm::vec3{2.0F, 1.0F, 2.0F};
        canopy.layer = physics::CollisionLayer::Environment;
        m_physics.AddSolidBox(canopy);
    }

    std::cout << "[App] Terrain " << kTerrainVertices << "x" << kTerrainVertices << " with one ravine, a bridge and "
              << std::size(canopies) << " canopies\n";
}

void App::SubscribeToSession()
{
    namespace events = game::gameplay::events;

    m_eventBus.Subscribe(events::kScoreChanged, [this](const Event&) { ++m_pickupsCollected; });
    m_eventBus.Subscribe(events::kEntitySpawned, [this](const Event&) { ++m_entitiesSpawned; });
    m_eventBus.Subscribe(events::kPlayerDied, [this](const Event&) { m_playerDied = true; });
    m_eventBus.Subscribe(events::kHealthChanged, [this](const Event& event) {
        if (event.args.size() == 2 && event.args[0] != event.args[1])
        {
            ++m_hitsTaken;
        }
    });
}

void App::FeedInput(int frame)
{
    using platform::Key;
    using game::gameplay::SessionState;

    const SessionState state = m_gameplay.Session().State();
    const bool outOfFrames = frame >= m_settings.maxFrames;

    if (outOfFrames || state == SessionState::GameOver)
    {
        m_input.SetKeyDown(Key::Q, true);
        return;
    }

    m_input.SetKeyDown(Key::Enter, state == SessionState::Menu);

    const bool pauseEdge = frame == m_settings.pauseAtFrame || frame == m_settings.pauseAtFrame + m_settings.pauseFrames;
    m_input.SetKeyDown(Key::Escape, pauseEdge && (state == SessionState::Playing || state == SessionState::Paused));
    if (pauseEdge)
    {
        m_pauseScripted = true;
    }

    const glm::vec2 axis = state == SessionState::Playing ? AutopilotAxis() : glm::vec2{0.0F};
    m_input.SetKeyDown(Key::D, axis.x > 0.25F);
    m_input.SetKeyDown(Key::A, axis.x < -0.25F);
    m_input.SetKeyDown(Key::W, axis.y > 0.25F);
    m_input.SetKeyDown(Key::S, axis.y < -0.25F);
}

glm::vec2 App::AutopilotAxis()
{
    const glm::vec3 playerPosition = m_gameplay.Avatar().Position();
    const engine::scene::World& world = m_gameplay.SessionWorld();

    float bestDistance = std::numeric_limits<float>::max();
    glm::vec3 bestDelta{0.0F};
    for (const auto& [entity, pickup] : world.Pickups())
    {
        (void)pickup;
        const auto transformIt = world.Transforms().find(entity);
        if (transformIt == world.Transforms().end())
        {
            continue;
        }
        glm::vec3 delta = transformIt->second.position - playerPosition;
        delta.y = 0.0F;
        const float distance = glm::length(delta);
        if (distance < bestDistance)
        {
            bestDistance = distance;
            bestDelta = delta;
        }
    }

    if (bestDistance == std::numeric_limits<float>::max() || bestDistance < 1.0e-3F)
    {
        return glm::vec2{0.0F};
    }
    // Forward is -Z.
    const glm::vec3 direction = bestDelta / bestDistance;
    return glm::vec2{direction.x, -direction.z};
}

void App::PrintSummary() const
{
    std::cout << "\n== Session summary ==\n"
              << "Frames:         " << m_framesRun << "\n"
              << "Simulated time: " << m_time.TotalSeconds() << " s\n"
              << "Spawned:        " << m_entitiesSpawned << "\n"
              << "Pickups:        " << m_pickupsCollected << "\n"
              << "Hits taken:     " << m_hitsTaken << "\n"
              << "Player died:    " << (m_playerDied ? "yes" : "no") << "\n"
              << "Pause scripted: " << (m_pauseScripted ? "yes" : "no") << "\n";
}
} // namespace engine::core
