#include "engine/core/Time.hpp"

#include <algorithm>

namespace engine::core
{
namespace
{
constexpr double kMaxFrameDelta = 0.25;
}

void Time::BeginFrame(double nowSeconds)
{
    if (m_firstFrame)
    {
        m_lastFrameSeconds = nowSeconds;
        m_firstFrame = false;
    }

    const double rawDelta = nowSeconds - m_lastFrameSeconds;
    m_lastFrameSeconds = nowSeconds;
    Advance(rawDelta);
}

void Time::Advance(double rawDeltaSeconds)
{
    m_unscaledDeltaSeconds = std::clamp(rawDeltaSeconds, 0.0, kMaxFrameDelta);
    m_deltaSeconds = m_unscaledDeltaSeconds * m_timeScale;
    m_unscaledTotalSeconds += m_unscaledDeltaSeconds;
    m_totalSeconds += m_deltaSeconds;
    ++m_frameIndex;
}

void Time::Reset()
{
    m_timeScale = 1.0;
    m_deltaSeconds = 0.0;
    m_unscaledDeltaSeconds = 0.0;
    m_totalSeconds = 0.0;
    m_unscaledTotalSeconds = 0.0;
    m_lastFrameSeconds = 0.0;
    m_frameIndex = 0;
    m_firstFrame = true;
}

void Time::SetTimeScale(double timeScale)
{
    m_timeScale = std::max(0.0, timeScale);
}
} // namespace engine::core
