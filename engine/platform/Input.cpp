#include "engine/platform/Input.hpp"

namespace engine::platform
{
void Input::BeginFrame()
{
    m_previousKeys = m_currentKeys;
}

void Input::SetKeyDown(Key key, bool down)
{
    const auto index = static_cast<std::size_t>(key);
    if (index >= kKeyCount)
    {
        return;
    }
    m_currentKeys[index] = down ? 1U : 0U;
}

bool Input::IsKeyDown(Key key) const
{
    const auto index = static_cast<std::size_t>(key);
    return index < kKeyCount && m_currentKeys[index] != 0U;
}

bool Input::IsKeyPressed(Key key) const
{
    const auto index = static_cast<std::size_t>(key);
    return index < kKeyCount && m_currentKeys[index] != 0U && m_previousKeys[index] == 0U;
}

bool Input::IsKeyReleased(Key key) const
{
    const auto index = static_cast<std::size_t>(key);
    return index < kKeyCount && m_currentKeys[index] == 0U && m_previousKeys[index] != 0U;
}

glm::vec2 Input::MoveAxis() const
{
    glm::vec2 axis{0.0F, 0.0F};
    if (IsKeyDown(Key::D))
    {
        axis.x += 1.0F;
    }
    if (IsKeyDown(Key::A))
    {
        axis.x -= 1.0F;
    }
    if (IsKeyDown(Key::W))
    {
        axis.y += 1.0F;
    }
    if (IsKeyDown(Key::S))
    {
        axis.y -= 1.0F;
    }
    return axis;
}
} // namespace engine::platform
