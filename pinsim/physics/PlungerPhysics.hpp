#pragma once

#include <cstdint>
#include <optional>
#include <random>

#include "pinsim/core/SimulationConfig.hpp"
#include "pinsim/physics/Ball.hpp"
#include "pinsim/physics/Collider.hpp"
#include "pinsim/scene/PlayfieldData.hpp"

namespace pinsim::physics
{
enum class PlungerStroke : std::uint8_t
{
    Resting,
    Retracting,
    RetractHold,
    Fired
};

/// Stroke limits and spring parameters. Positions are y coordinates; frameStart is the
/// fully retracted tip, frameEnd the fully forward one.
struct PlungerStaticData
{
    float frameStart = 0.0F;
    float frameEnd = 0.0F;
    float restPosition = 0.0F;
    float speedPull = 80.0F;
    float mechStrength = 85.0F;
    float mass = 0.1F;
    float momentumXfer = 1.0F;
    float scatterVelocity = 0.0F;
    float retractDistance = 8.0F;
    float retractWaitSeconds = 0.05F;
    bool isMechPlunger = false;
    bool isAutoPlunger = false;

    [[nodiscard]] float FrameLength() const { return frameStart - frameEnd; }
    /// Spring angular frequency of the released plunger.
    [[nodiscard]] float AngularFrequency() const;

    static PlungerStaticData FromData(const scene::PlungerData& data);
};

struct PlungerMovementData
{
    float position = 0.0F;
    float speed = 0.0F; ///< positive while moving towards frameStart
    float analogPosition = 0.0F; ///< 0 = resting, 1 = pulled back; stored as received
    PlungerStroke stroke = PlungerStroke::Resting;
    bool addRetractMotion = false;
    bool atRetractedLimit = false;
    float retractWaitRemaining = 0.0F;
    float fireAmplitude = 0.0F;
    float firePhase = 0.0F;
    float lastFireRatio = 0.0F;
};

/// Limit reached during an update. direction == true: retracted limit (end of stroke),
/// direction == false: back at the rest position (beginning of stroke).
struct StrokeLimit
{
    float speed = 0.0F;
    bool direction = false;
};

namespace PlungerCommands
{
void PullBack(PlungerMovementData& movement);
void PullBackAndRetract(PlungerMovementData& movement);

/// Release the plunger from the given stroke ratio (clamped to [0, 1]).
/// Returns the ratio actually used.
float Fire(float ratio, PlungerMovementData& movement, const PlungerStaticData& staticData);
} // namespace PlungerCommands

/// Fraction of the stroke the plunger is currently pulled back:
/// (position - frameEnd) / (frameStart - frameEnd).
[[nodiscard]] float StrokeRatio(const PlungerMovementData& movement, const PlungerStaticData& staticData);

/// Advance the plunger by one step. At most one limit is reported per step.
std::optional<StrokeLimit> UpdatePlunger(PlungerMovementData& movement, const PlungerStaticData& staticData, float deltaSeconds);

/// Resolve a ball touching the plunger face. Returns true when the ball was pushed.
bool CollidePlunger(
    BallState& ball,
    ContactEvent& contact,
    const PlungerMovementData& movement,
    const PlungerStaticData& staticData,
    const ColliderMaterial& material,
    const core::SimulationConfig& config,
    std::mt19937& rng
);
} // namespace pinsim::physics
