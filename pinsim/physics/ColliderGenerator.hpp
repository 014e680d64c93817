#pragma once

#include <vector>

#include "pinsim/physics/Collider.hpp"
#include "pinsim/scene/PlayfieldData.hpp"

namespace pinsim::physics
{
/// Builds collision primitives from authored device data. Every function is pure:
/// the same data, owner and margin always produce the same colliders in the same order.
class ColliderGenerator
{
public:
    // Kicker hit circle radius multiplier:
    //   legacy + fall-through   -> 0.6
    //   legacy, no fall-through -> 0.75
    //   non-legacy              -> 1.0
    static float KickerRadiusFactor(bool legacyMode, bool fallThrough);

    static void GenerateKicker(
        const scene::KickerData& data,
        scene::DeviceId owner,
        float margin,
        std::vector<Collider>& outColliders
    );

    static void GeneratePlunger(
        const scene::PlungerData& data,
        scene::DeviceId owner,
        float margin,
        std::vector<Collider>& outColliders
    );

    // Floor triangles along the spline, wall segments for each wall with a height,
    // and vertical caps at the wall ends.
    static void GenerateRamp(
        const scene::RampData& data,
        scene::DeviceId owner,
        float margin,
        std::vector<Collider>& outColliders
    );

    // Closed ring: two edge segments per span and a circle per vertex.
    static void GenerateRubber(
        const scene::RubberData& data,
        scene::DeviceId owner,
        float margin,
        std::vector<Collider>& outColliders
    );

    /// Stroke geometry of a plunger; y grows towards the fully retracted position.
    static PlungerShape PlungerGeometry(const scene::PlungerData& data);

    static ColliderMaterial RampMaterial(const scene::RampData& data);
    static ColliderMaterial RubberMaterial(const scene::RubberData& data);
};
} // namespace pinsim::physics
