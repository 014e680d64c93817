#pragma once

#include <random>

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

#include "pinsim/core/SimulationConfig.hpp"
#include "pinsim/physics/Ball.hpp"

namespace pinsim::physics
{
/// Scatter shaping constant (3 * sqrt(3) / 2). Scales the peak of u * (1 - u^2) to 1 so
/// the perturbation never exceeds the scatter angle.
constexpr float kScatterShape = 2.59808F;

/// Ignore scatter angles below this (radians).
constexpr float kMinScatterAngle = 1.0e-5F;

struct KickParams
{
    float angle = 0.0F;       ///< degrees, 0 = along -Y
    float speed = 0.0F;
    float inclination = 0.0F; ///< radians, treated as degrees when |value| > pi/2
    glm::vec3 offset{0.0F};
};

/// Inclinations above pi/2 are taken to be degrees and converted to radians.
[[nodiscard]] float NormalizeInclination(float inclination);

/// Scatter angle in radians: device scatter in degrees, or the table-wide value when the
/// device scatter is negative, weighted by the global difficulty.
[[nodiscard]] float EffectiveScatterAngle(float deviceScatter, const core::SimulationConfig& config);

/// Quadratic-shaped, zero-mean perturbation for a uniform draw u in [-1, 1].
[[nodiscard]] float ShapeScatter(float u, float scatterAngle);

/// Launch the ball out of a kicker. Returns the yaw that was applied (radians).
float KickBall(
    BallState& ball,
    ContactEvent& contact,
    const KickParams& params,
    float scatterAngle,
    std::mt19937& rng
);

/// Bring a ball to rest inside a kicker. Legacy kickers snap the ball onto their
/// center; fall-through kickers let the ball keep falling.
void CaptureBall(BallState& ball, ContactEvent& contact, const glm::vec2& center, bool legacyMode, bool fallThrough);
} // namespace pinsim::physics
