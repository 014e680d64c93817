#include "pinsim/physics/PlungerPhysics.hpp"

#include <algorithm>
#include <cmath>

#include <glm/geometric.hpp>
#include <glm/gtc/constants.hpp>

#include "pinsim/physics/ColliderGenerator.hpp"

namespace pinsim::physics
{
namespace
{
float ClampToFrame(float position, const PlungerStaticData& staticData)
{
    return std::clamp(position, staticData.frameEnd, staticData.frameStart);
}

std::optional<StrokeLimit> ReachRetractedLimit(PlungerMovementData& movement, const PlungerStaticData& staticData, float speed)
{
    movement.position = staticData.frameStart;
    movement.speed = 0.0F;
    if (movement.atRetractedLimit)
    {
        return std::nullopt;
    }
    movement.atRetractedLimit = true;
    return StrokeLimit{std::abs(speed), true};
}

std::optional<StrokeLimit> UpdateRetracting(PlungerMovementData& movement, const PlungerStaticData& staticData, float deltaSeconds)
{
    const float next = movement.position + staticData.speedPull * deltaSeconds;
    if (next < staticData.frameStart)
    {
        movement.position = next;
        movement.speed = staticData.speedPull;
        return std::nullopt;
    }

    auto limit = ReachRetractedLimit(movement, staticData, staticData.speedPull);
    if (movement.addRetractMotion)
    {
        movement.stroke = PlungerStroke::RetractHold;
        movement.position = std::max(staticData.restPosition, staticData.frameStart - staticData.retractDistance);
        movement.retractWaitRemaining = staticData.retractWaitSeconds;
    }
    return limit;
}

std::optional<StrokeLimit> UpdateFired(PlungerMovementData& movement, const PlungerStaticData& staticData, float deltaSeconds)
{
    const float omega = staticData.AngularFrequency();
    movement.firePhase += omega * deltaSeconds;

    if (movement.firePhase >= glm::half_pi<float>())
    {
        const float speedAtRest = movement.fireAmplitude * omega;
        movement.position = staticData.restPosition;
        movement.speed = 0.0F;
        movement.stroke = PlungerStroke::Resting;
        movement.fireAmplitude = 0.0F;
        movement.firePhase = 0.0F;
        return StrokeLimit{std::abs(speedAtRest), false};
    }

    movement.position = ClampToFrame(staticData.restPosition + movement.fireAmplitude * std::cos(movement.firePhase), staticData);
    movement.speed = -movement.fireAmplitude * omega * std::sin(movement.firePhase);
    return std::nullopt;
}

std::optional<StrokeLimit> UpdateResting(PlungerMovementData& movement, const PlungerStaticData& staticData, float deltaSeconds)
{
    if (!staticData.isMechPlunger)
    {
        movement.position = staticData.restPosition;
        movement.speed = 0.0F;
        return std::nullopt;
    }

    // analog input is kept as received, saturate only for positioning
    const float analog = std::clamp(movement.analogPosition, 0.0F, 1.0F);
    const float target = staticData.restPosition + analog * (staticData.frameStart - staticData.restPosition);
    const float speed = deltaSeconds > 0.0F ? (target - movement.position) / deltaSeconds : 0.0F;
    movement.position = ClampToFrame(target, staticData);
    movement.speed = speed;

    if (analog >= 1.0F)
    {
        return ReachRetractedLimit(movement, staticData, speed);
    }
    movement.atRetractedLimit = false;
    return std::nullopt;
}
} // namespace

float PlungerStaticData::AngularFrequency() const
{
    return std::sqrt(std::max(0.0F, mechStrength) / std::max(0.0001F, mass));
}

PlungerStaticData PlungerStaticData::FromData(const scene::PlungerData& data)
{
    const PlungerShape shape = ColliderGenerator::PlungerGeometry(data);

    PlungerStaticData staticData;
    staticData.frameStart = shape.frameStart;
    staticData.frameEnd = shape.frameEnd;
    staticData.restPosition = shape.restPosition;
    staticData.speedPull = std::max(0.0F, data.speedPull);
    staticData.mechStrength = data.mechStrength;
    staticData.mass = data.mass;
    staticData.momentumXfer = data.momentumXfer;
    staticData.scatterVelocity = data.scatterVelocity;
    staticData.retractDistance = std::max(0.0F, data.retractDistance);
    staticData.retractWaitSeconds = std::max(0.0F, data.retractWaitSeconds);
    staticData.isMechPlunger = data.isMechPlunger;
    staticData.isAutoPlunger = data.isAutoPlunger;
    return staticData;
}

namespace PlungerCommands
{
void PullBack(PlungerMovementData& movement)
{
    movement.stroke = PlungerStroke::Retracting;
    movement.addRetractMotion = false;
}

void PullBackAndRetract(PlungerMovementData& movement)
{
    movement.stroke = PlungerStroke::Retracting;
    movement.addRetractMotion = true;
}

float Fire(float ratio, PlungerMovementData& movement, const PlungerStaticData& staticData)
{
    if (movement.stroke == PlungerStroke::Fired)
    {
        return movement.lastFireRatio;
    }

    const float clamped = std::clamp(ratio, 0.0F, 1.0F);
    movement.position = staticData.frameEnd + clamped * staticData.FrameLength();
    movement.fireAmplitude = movement.position - staticData.restPosition;
    movement.firePhase = 0.0F;
    movement.speed = 0.0F;
    movement.stroke = PlungerStroke::Fired;
    movement.addRetractMotion = false;
    movement.atRetractedLimit = false;
    movement.retractWaitRemaining = 0.0F;
    movement.lastFireRatio = clamped;
    return clamped;
}
} // namespace PlungerCommands

float StrokeRatio(const PlungerMovementData& movement, const PlungerStaticData& staticData)
{
    const float length = staticData.FrameLength();
    if (length <= 0.0F)
    {
        return 0.0F;
    }
    return std::clamp((movement.position - staticData.frameEnd) / length, 0.0F, 1.0F);
}

std::optional<StrokeLimit> UpdatePlunger(PlungerMovementData& movement, const PlungerStaticData& staticData, float deltaSeconds)
{
    std::optional<StrokeLimit> limit;
    switch (movement.stroke)
    {
        case PlungerStroke::Resting:
            limit = UpdateResting(movement, staticData, deltaSeconds);
            break;
        case PlungerStroke::Retracting:
            limit = UpdateRetracting(movement, staticData, deltaSeconds);
            break;
        case PlungerStroke::RetractHold:
            movement.speed = 0.0F;
            movement.retractWaitRemaining -= deltaSeconds;
            if (movement.retractWaitRemaining <= 0.0F)
            {
                movement.retractWaitRemaining = 0.0F;
                movement.stroke = PlungerStroke::Retracting;
            }
            break;
        case PlungerStroke::Fired:
            limit = UpdateFired(movement, staticData, deltaSeconds);
            break;
    }

    movement.position = ClampToFrame(movement.position, staticData);
    return limit;
}

bool CollidePlunger(
    BallState& ball,
    ContactEvent& contact,
    const PlungerMovementData& movement,
    const PlungerStaticData& staticData,
    const ColliderMaterial& material,
    const core::SimulationConfig& config,
    std::mt19937& rng)
{
    // face points up the playfield, towards -y
    const glm::vec3 normal{0.0F, -1.0F, 0.0F};
    const glm::vec3 faceVelocity{0.0F, movement.speed * staticData.momentumXfer, 0.0F};

    const float approach = glm::dot(ball.velocity - faceVelocity, normal);
    if (approach >= 0.0F)
    {
        return false;
    }

    ball.velocity -= (1.0F + material.elasticity) * approach * normal;

    if (movement.stroke == PlungerStroke::Fired && staticData.scatterVelocity > 0.0F)
    {
        std::uniform_real_distribution<float> distribution(-1.0F, 1.0F);
        const float difficulty = std::clamp(config.globalDifficulty, 0.0F, 1.0F);
        ball.velocity.x += distribution(rng) * staticData.scatterVelocity * difficulty;
    }

    ball.frozen = false;
    contact.hitNormal = normal;
    contact.isContact = true;
    return true;
}
} // namespace pinsim::physics
