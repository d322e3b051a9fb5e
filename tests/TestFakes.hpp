#pragma once

#include <string>
#include <vector>

#include <glm/vec3.hpp>

#include "engine/physics/HeightField.hpp"
#include "engine/platform/Input.hpp"
#include "game/gameplay/SessionController.hpp"
#include "game/ui/HudSurfaces.hpp"

namespace coinrush_test
{
class RecordingPanel final : public game::ui::Panel
{
public:
    void SetVisible(bool visible) override
    {
        visibleFlag = visible;
        ++setCalls;
    }
    [[nodiscard]] bool IsVisible() const override { return visibleFlag; }

    bool visibleFlag = false;
    int setCalls = 0;
};

class RecordingLabel final : public game::ui::TextLabel
{
public:
    void SetText(const std::string& value) override { texts.push_back(value); }
    [[nodiscard]] std::string Last() const { return texts.empty() ? std::string{} : texts.back(); }

    std::vector<std::string> texts;
};

class RecordingBar final : public game::ui::ValueBar
{
public:
    void SetMaxValue(float value) override { maxValue = value; }
    void SetValue(float value) override
    {
        this->value = value;
        ++setCalls;
    }

    float maxValue = 0.0F;
    float value = -1.0F;
    int setCalls = 0;
};

class RecordingInputGate final : public game::gameplay::PlayerInputGate
{
public:
    void SetInputEnabled(bool value) override
    {
        enabled = value;
        ++calls;
    }
    [[nodiscard]] bool IsInputEnabled() const override { return enabled; }

    bool enabled = false;
    int calls = 0;
};

class RecordingCursor final : public engine::platform::CursorControl
{
public:
    void SetCursorLocked(bool value) override
    {
        locked = value;
        ++calls;
    }
    [[nodiscard]] bool IsCursorLocked() const override { return locked; }

    bool locked = false;
    int calls = 0;
};

/// Square grid centred on the origin with every vertex at `height`.
inline engine::physics::HeightField FlatTerrain(int vertices = 41, float spacing = 1.0F, float height = 0.0F)
{
    const float half = 0.5F * spacing * static_cast<float>(vertices - 1);
    engine::physics::HeightField terrain(vertices, vertices, spacing, glm::vec3{-half, 0.0F, -half});
    for (int z = 0; z < vertices; ++z)
    {
        for (int x = 0; x < vertices; ++x)
        {
            terrain.SetHeight(x, z, height);
        }
    }
    return terrain;
}
} // namespace coinrush_test
