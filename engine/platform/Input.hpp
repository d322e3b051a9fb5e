#pragma once

#include <array>
#include <cstddef>

#include <glm/vec2.hpp>

namespace engine::platform
{
enum class Key : std::size_t
{
    Escape = 0,
    Enter,
    R,
    Q,
    W,
    A,
    S,
    D,
    Count
};

/// Pointer lock seam. Locked means hidden and captured by the camera.
class CursorControl
{
public:
    virtual ~CursorControl() = default;

    virtual void SetCursorLocked(bool locked) = 0;
    [[nodiscard]] virtual bool IsCursorLocked() const = 0;
};

/// Key state for one frame. The host feeds raw key state between BeginFrame()
/// calls; edge queries compare against the previous frame.
class Input final : public CursorControl
{
public:
    void BeginFrame();

    void SetKeyDown(Key key, bool down);

    [[nodiscard]] bool IsKeyDown(Key key) const;
    [[nodiscard]] bool IsKeyPressed(Key key) const;
    [[nodiscard]] bool IsKeyReleased(Key key) const;

    /// WASD as a (right, forward) axis pair in [-1, 1].
    [[nodiscard]] glm::vec2 MoveAxis() const;

    void SetCursorLocked(bool locked) override { m_cursorLocked = locked; }
    [[nodiscard]] bool IsCursorLocked() const override { return m_cursorLocked; }

private:
    static constexpr std::size_t kKeyCount = static_cast<std::size_t>(Key::Count);

    std::array<unsigned char, kKeyCount> m_currentKeys{};
    std::array<unsigned char, kKeyCount> m_previousKeys{};
    bool m_cursorLocked = false;
};
} // namespace engine::platform
