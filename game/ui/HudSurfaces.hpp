#pragma once

#include <string>

namespace game::ui
{
/// Display surfaces the gameplay core pushes state into. Widget rendering lives
/// outside the core; these are the seams it talks through.
class Panel
{
public:
    virtual ~Panel() = default;

    virtual void SetVisible(bool visible) = 0;
    [[nodiscard]] virtual bool IsVisible() const = 0;
};

class TextLabel
{
public:
    virtual ~TextLabel() = default;

    virtual void SetText(const std::string& text) = 0;
};

class ValueBar
{
public:
    virtual ~ValueBar() = default;

    virtual void SetMaxValue(float maxValue) = 0;
    virtual void SetValue(float value) = 0;
};
} // namespace game::ui
