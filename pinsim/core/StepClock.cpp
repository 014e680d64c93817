#include "pinsim/core/StepClock.hpp"

#include <algorithm>

namespace pinsim::core
{
namespace
{
constexpr double kMinStepSeconds = 1.0 / 10000.0;
constexpr double kMaxStepSeconds = 1.0 / 60.0;
constexpr double kMaxAccumulatedSeconds = 0.25;
} // namespace

StepClock::StepClock(double fixedStepSeconds)
    : m_fixedStepSeconds(std::clamp(fixedStepSeconds, kMinStepSeconds, kMaxStepSeconds))
    , m_simulatedSeconds(0.0)
    , m_accumulator(0.0)
    , m_stepIndex(0)
{
}

void StepClock::SetFixedStepSeconds(double fixedStepSeconds)
{
    m_fixedStepSeconds = std::clamp(fixedStepSeconds, kMinStepSeconds, kMaxStepSeconds);
}

void StepClock::Accumulate(double elapsedSeconds)
{
    // a stalled host must not queue up an unbounded number of steps
    m_accumulator = std::min(m_accumulator + std::max(0.0, elapsedSeconds), kMaxAccumulatedSeconds);
}

bool StepClock::ShouldRunStep() const
{
    return m_accumulator >= m_fixedStepSeconds;
}

void StepClock::ConsumeStep()
{
    m_accumulator = std::max(0.0, m_accumulator - m_fixedStepSeconds);
    m_simulatedSeconds += m_fixedStepSeconds;
    ++m_stepIndex;
}

void StepClock::Reset()
{
    m_simulatedSeconds = 0.0;
    m_accumulator = 0.0;
    m_stepIndex = 0;
}
} // namespace pinsim::core
