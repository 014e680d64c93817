#pragma once

#include <cstdint>

namespace pinsim::core
{
/// Fixed-step clock for the physics loop. Host time is accumulated and consumed in
/// whole steps; the step index is the only notion of simulation time devices see.
class StepClock
{
public:
    explicit StepClock(double fixedStepSeconds = 1.0 / 1000.0);

    void SetFixedStepSeconds(double fixedStepSeconds);

    void Accumulate(double elapsedSeconds);
    [[nodiscard]] bool ShouldRunStep() const;
    void ConsumeStep();
    void Reset();

    [[nodiscard]] double FixedStepSeconds() const { return m_fixedStepSeconds; }
    [[nodiscard]] double SimulatedSeconds() const { return m_simulatedSeconds; }
    [[nodiscard]] double PendingSeconds() const { return m_accumulator; }
    [[nodiscard]] std::uint64_t StepIndex() const { return m_stepIndex; }

private:
    double m_fixedStepSeconds;
    double m_simulatedSeconds;
    double m_accumulator;
    std::uint64_t m_stepIndex;
};
} // namespace pinsim::core
