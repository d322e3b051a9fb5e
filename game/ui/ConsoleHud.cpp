#include "game/ui/ConsoleHud.hpp"

#include <cmath>
#include <iostream>
#include <utility>

namespace game::ui
{
ConsolePanel::ConsolePanel(std::string name)
    : m_name(std::move(name))
{
}

void ConsolePanel::SetVisible(bool visible)
{
    if (visible == m_visible)
    {
        return;
    }
    m_visible = visible;
    std::cout << "[HUD] " << m_name << (visible ? " shown" : " hidden") << "\n";
}

ConsoleTextLabel::ConsoleTextLabel(std::string name)
    : m_name(std::move(name))
{
}

void ConsoleTextLabel::SetText(const std::string& text)
{
    if (text == m_text)
    {
        return;
    }
    m_text = text;
    std::cout << "[HUD] " << m_name << ": " << m_text << "\n";
}

ConsoleValueBar::ConsoleValueBar(std::string name)
    : m_name(std::move(name))
{
}

void ConsoleValueBar::SetMaxValue(float maxValue)
{
    m_maxValue = maxValue;
}

void ConsoleValueBar::SetValue(float value)
{
    m_value = value;
    const float fraction = m_maxValue > 0.0F ? m_value / m_maxValue : 0.0F;
    std::cout << "[HUD] " << m_name << ": " << std::lround(fraction * 100.0F) << "%\n";
}
} // namespace game::ui
