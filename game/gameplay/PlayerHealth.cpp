#include "game/gameplay/PlayerHealth.hpp"

#include <algorithm>
#include <iostream>
#include <string>

#include "engine/core/EventBus.hpp"
#include "game/gameplay/GameEvents.hpp"
#include "game/ui/HudSurfaces.hpp"

namespace game::gameplay
{
PlayerHealth::PlayerHealth(int maxHealth, engine::core::EventBus* eventBus)
    : m_max(std::max(1, maxHealth))
    , m_current(m_max)
    , m_eventBus(eventBus)
{
}

void PlayerHealth::BindSurfaces(ui::ValueBar* healthBar, ui::TextLabel* healthText)
{
    m_healthBar = healthBar;
    m_healthText = healthText;
    if (m_healthBar != nullptr)
    {
        m_healthBar->SetMaxValue(static_cast<float>(m_max));
    }
    PushToSurfaces();
}

bool PlayerHealth::ApplyDamage(int amount)
{
    if (m_current == 0)
    {
        return false;
    }

    const int damage = std::max(0, amount);
    const int before = m_current;
    m_current = std::max(0, m_current - damage);

    PushToSurfaces();
    if (m_current != before)
    {
        std::cout << "[PlayerHealth] Took " << (before - m_current) << " damage (" << m_current << "/" << m_max << ")\n";
    }

    if (before > 0 && m_current == 0)
    {
        std::cout << "[PlayerHealth] Player died\n";
        if (m_eventBus != nullptr)
        {
            m_eventBus->Publish(engine::core::Event{events::kPlayerDied, {}});
        }
        if (m_onDeath)
        {
            m_onDeath();
        }
        return true;
    }
    return false;
}

void PlayerHealth::Heal(int amount)
{
    // Death is final for this tracker; a new session builds a new one.
    if (IsDead())
    {
        return;
    }
    m_current += std::min(std::max(0, amount), m_max - m_current);
    PushToSurfaces();
}

void PlayerHealth::PushToSurfaces()
{
    if (m_healthBar != nullptr)
    {
        m_healthBar->SetValue(static_cast<float>(m_current));
    }
    else if (!m_warnedMissingBar)
    {
        std::cerr << "[PlayerHealth] Warning: health bar not assigned\n";
        m_warnedMissingBar = true;
    }

    if (m_healthText != nullptr)
    {
        m_healthText->SetText(std::to_string(m_current) + " / " + std::to_string(m_max));
    }
    else if (!m_warnedMissingText)
    {
        std::cerr << "[PlayerHealth] Warning: health text not assigned\n";
        m_warnedMissingText = true;
    }

    if (m_eventBus != nullptr)
    {
        m_eventBus->Publish(engine::core::Event{events::kHealthChanged, {std::to_string(m_current), std::to_string(m_max)}});
    }
}
} // namespace game::gameplay
