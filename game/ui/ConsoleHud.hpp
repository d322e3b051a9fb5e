#pragma once

#include <string>

#include "game/ui/HudSurfaces.hpp"

namespace game::ui
{
/// Surfaces that echo every change to stdout. Used by the headless driver.
class ConsolePanel final : public Panel
{
public:
    explicit ConsolePanel(std::string name);

    void SetVisible(bool visible) override;
    [[nodiscard]] bool IsVisible() const override { return m_visible; }

private:
    std::string m_name;
    bool m_visible = false;
};

class ConsoleTextLabel final : public TextLabel
{
public:
    explicit ConsoleTextLabel(std::string name);

    void SetText(const std::string& text) override;
    [[nodiscard]] const std::string& Text() const { return m_text; }

private:
    std::string m_name;
    std::string m_text;
};

class ConsoleValueBar final : public ValueBar
{
public:
    explicit ConsoleValueBar(std::string name);

    void SetMaxValue(float maxValue) override;
    void SetValue(float value) override;

    [[nodiscard]] float Value() const { return m_value; }
    [[nodiscard]] float MaxValue() const { return m_maxValue; }

private:
    std::string m_name;
    float m_value = 0.0F;
    float m_maxValue = 1.0F;
};
} // namespace game::ui
