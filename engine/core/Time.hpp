#pragma once

namespace engine::core
{
class Time
{
public:
    Time() = default;

    void BeginFrame(double nowSeconds);
    void Advance(double rawDeltaSeconds);
    void Reset();

    /// Scale applied to simulated time. 0 freezes gameplay, 1 is normal speed.
    void SetTimeScale(double timeScale);
    [[nodiscard]] double TimeScale() const { return m_timeScale; }
    [[nodiscard]] bool IsFrozen() const { return m_timeScale <= 0.0; }

    [[nodiscard]] double DeltaSeconds() const { return m_deltaSeconds; }
    [[nodiscard]] double UnscaledDeltaSeconds() const { return m_unscaledDeltaSeconds; }
    [[nodiscard]] double TotalSeconds() const { return m_totalSeconds; }
    [[nodiscard]] double UnscaledTotalSeconds() const { return m_unscaledTotalSeconds; }
    [[nodiscard]] unsigned long long FrameIndex() const { return m_frameIndex; }

private:
    double m_timeScale = 1.0;
    double m_deltaSeconds = 0.0;
    double m_unscaledDeltaSeconds = 0.0;
    double m_totalSeconds = 0.0;
    double m_unscaledTotalSeconds = 0.0;
    double m_lastFrameSeconds = 0.0;
    unsigned long long m_frameIndex = 0;
    bool m_firstFrame = true;
};
} // namespace engine::core
