#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

namespace pinsim::scene
{
using DeviceId = std::uint32_t;
using BallId = std::uint32_t;

constexpr DeviceId kNoDevice = 0;
constexpr BallId kNoBall = 0;

enum class DeviceKind
{
    Kicker,
    Plunger,
    Ramp,
    Rubber
};

/// Anchor point produced by the drag-point editor.
struct DragPoint
{
    glm::vec3 center{0.0F};
    bool isSmooth = true;
    bool isSlingshot = false;
    bool isLocked = false;
};

struct KickerCoilData
{
    std::string id = "Coil";
    float angle = 0.0F;       // degrees, 0 = along -Y
    float speed = 3.0F;
    float inclination = 0.0F; // radians, or degrees when above pi/2
};

struct KickerData
{
    std::string name;
    glm::vec2 center{0.0F};
    float positionZ = 0.0F;
    float radius = 25.0F;
    float scatter = 0.0F; // degrees, negative = table-wide value
    float hitHeight = 35.0F;
    bool legacyMode = true;
    bool fallThrough = false;
    std::vector<KickerCoilData> coils;
};

struct PlungerData
{
    std::string name;
    glm::vec2 center{0.0F};  // y is the fully retracted tip position
    float width = 25.0F;
    float height = 20.0F;
    float zAdjust = 0.0F;
    float stroke = 80.0F;
    float parkPosition = 0.5F / 3.0F; // rest position as a fraction of the stroke
    float speedPull = 80.0F;          // units per second
    float mechStrength = 85.0F;
    float mass = 0.1F;
    float momentumXfer = 1.0F;
    float scatterVelocity = 0.0F;
    float retractDistance = 8.0F;
    float retractWaitSeconds = 0.05F;
    bool isMechPlunger = false;
    bool isAutoPlunger = false;
    bool doRetract = true;
};

struct RampData
{
    std::string name;
    std::vector<DragPoint> dragPoints;
    float heightBottom = 0.0F;
    float heightTop = 50.0F;
    float widthBottom = 75.0F;
    float widthTop = 60.0F;
    float leftWallHeight = 62.0F;
    float rightWallHeight = 62.0F;
    float playfieldHeight = 0.0F;
    float accuracy = 10.0F;
    bool hitEvent = false;
    float threshold = 2.0F;
    float elasticity = 0.3F;
    float friction = 0.3F;
    float scatter = 0.0F;
};

struct RubberData
{
    std::string name;
    std::vector<DragPoint> dragPoints;
    float height = 25.0F;
    float thickness = 8.0F;
    float accuracy = 10.0F;
    bool hitEvent = false;
    float threshold = 2.0F;
    bool overwritePhysics = false;
    float elasticity = 0.8F;
    float elasticityFalloff = 0.3F;
    float friction = 0.6F;
    float scatter = 5.0F;
};
} // namespace pinsim::scene
