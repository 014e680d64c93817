#pragma once

#include <vector>

#include <glm/vec3.hpp>

#include "pinsim/scene/PlayfieldData.hpp"

namespace pinsim::physics
{
struct CurveVertex
{
    glm::vec3 position{0.0F};
    bool isSmooth = false;
    bool isSlingshot = false;
    bool isControlPoint = false;
};

class DragPointCurve
{
public:
    /// Interpolate drag points into a polyline.
    /// Spans between two smooth points follow a Catmull-Rom spline, every other span is
    /// straight. No sub-segment is longer than @p accuracy. Open curves end on the last
    /// drag point; loops do not repeat the first one.
    static std::vector<CurveVertex> Interpolate(
        const std::vector<scene::DragPoint>& points,
        bool loop,
        float accuracy
    );

    /// Cumulative xy path length at every vertex (first entry is 0).
    static std::vector<float> CumulativeLengths(const std::vector<CurveVertex>& vertices, bool loop);

private:
    static glm::vec3 CatmullRom(
        const glm::vec3& p0,
        const glm::vec3& p1,
        const glm::vec3& p2,
        const glm::vec3& p3,
        float t
    );
};
} // namespace pinsim::physics
