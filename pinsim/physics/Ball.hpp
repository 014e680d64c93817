#pragma once

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

#include "pinsim/scene/PlayfieldData.hpp"

namespace pinsim::physics
{
struct BallState
{
    scene::BallId id = scene::kNoBall;
    glm::vec3 position{0.0F};
    glm::vec3 velocity{0.0F};
    glm::vec3 angularMomentum{0.0F};
    float radius = 25.0F;
    float mass = 1.0F;
    bool frozen = false;
};

/// Pending contact as reported by the ball integrator.
struct ContactEvent
{
    float hitDistance = 0.0F;
    float hitTime = -1.0F;
    glm::vec3 hitNormal{0.0F};
    glm::vec2 hitVelocity{0.0F};
    bool hitFlag = false;
    bool isContact = false;

    void Reset()
    {
        hitDistance = 0.0F;
        hitTime = -1.0F;
        hitNormal = glm::vec3{0.0F};
        hitVelocity = glm::vec2{0.0F};
        hitFlag = false;
        isContact = false;
    }
};
} // namespace pinsim::physics
