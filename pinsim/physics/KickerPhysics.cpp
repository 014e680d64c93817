#include "pinsim/physics/KickerPhysics.hpp"

#include <algorithm>
#include <cmath>

#include <glm/gtc/constants.hpp>
#include <glm/trigonometric.hpp>

namespace pinsim::physics
{
float NormalizeInclination(float inclination)
{
    if (std::abs(inclination) > glm::half_pi<float>())
    {
        return glm::radians(inclination);
    }
    return inclination;
}

float EffectiveScatterAngle(float deviceScatter, const core::SimulationConfig& config)
{
    const float scatterDegrees = deviceScatter < 0.0F ? config.globalScatter : deviceScatter;
    const float difficulty = std::clamp(config.globalDifficulty, 0.0F, 1.0F);
    return glm::radians(scatterDegrees) * difficulty;
}

float ShapeScatter(float u, float scatterAngle)
{
    return u * (1.0F - u * u) * kScatterShape * scatterAngle;
}

float KickBall(
    BallState& ball,
    ContactEvent& contact,
    const KickParams& params,
    float scatterAngle,
    std::mt19937& rng)
{
    float yaw = glm::radians(params.angle);
    const float inclination = NormalizeInclination(params.inclination);

    if (scatterAngle > kMinScatterAngle)
    {
        std::uniform_real_distribution<float> distribution(-1.0F, 1.0F);
        yaw += ShapeScatter(distribution(rng), scatterAngle);
    }

    float speed = params.speed;
    const float speedZ = std::sin(inclination) * speed;
    if (speedZ > 0.0F)
    {
        speed *= std::cos(inclination);
    }

    ball.position += params.offset;
    ball.velocity = glm::vec3{std::sin(yaw) * speed, -std::cos(yaw) * speed, speedZ};
    ball.angularMomentum = glm::vec3{0.0F};
    ball.frozen = false;

    contact.Reset();
    return yaw;
}

void CaptureBall(BallState& ball, ContactEvent& contact, const glm::vec2& center, bool legacyMode, bool fallThrough)
{
    if (legacyMode)
    {
        ball.position.x = center.x;
        ball.position.y = center.y;
    }
    ball.velocity = glm::vec3{0.0F};
    ball.angularMomentum = glm::vec3{0.0F};
    ball.frozen = !fallThrough;
    contact.Reset();
}
} // namespace pinsim::physics
