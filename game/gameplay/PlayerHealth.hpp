#pragma once

#include <functional>
#include <utility>

namespace engine::core
{
class EventBus;
}

namespace game::ui
{
class TextLabel;
class ValueBar;
}

namespace game::gameplay
{
/// Current/max hit points of the player. 0 <= current <= max holds after every call.
class PlayerHealth
{
public:
    using DeathCallback = std::function<void()>;

    explicit PlayerHealth(int maxHealth, engine::core::EventBus* eventBus = nullptr);

    /// Display collaborators are optional; a missing one is warned about once and skipped.
    void BindSurfaces(ui::ValueBar* healthBar, ui::TextLabel* healthText);
    void SetDeathCallback(DeathCallback callback) { m_onDeath = std::move(callback); }

    /// Negative amounts count as 0. Returns true if this call killed the player.
    bool ApplyDamage(int amount);
    /// No effect once dead.
    void Heal(int amount);

    [[nodiscard]] int Current() const { return m_current; }
    [[nodiscard]] int Max() const { return m_max; }
    [[nodiscard]] bool IsDead() const { return m_current == 0; }

private:
    void PushToSurfaces();

    int m_max = 1;
    int m_current = 1;
    engine::core::EventBus* m_eventBus = nullptr;
    ui::ValueBar* m_healthBar = nullptr;
    ui::TextLabel* m_healthText = nullptr;
    DeathCallback m_onDeath;
    bool m_warnedMissingBar = false;
    bool m_warnedMissingText = false;
};
} // namespace game::gameplay
