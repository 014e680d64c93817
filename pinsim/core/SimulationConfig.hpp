#pragma once

#include <cstdint>
#include <optional>

namespace pinsim::core
{
/// Table-wide settings handed to every device responder.
struct SimulationConfig
{
    float globalDifficulty = 0.2F; ///< 0..1, scales kicker scatter and plunger scatter velocity
    float globalScatter = 0.0F;    ///< degrees, used by kickers whose own scatter is negative
    std::optional<std::uint32_t> seed; ///< fixed seed for reproducible runs, random when empty
    double fixedStepSeconds = 1.0 / 1000.0;
    float colliderMargin = 0.01F;
    float colliderCellSize = 64.0F;
};
} // namespace pinsim::core
