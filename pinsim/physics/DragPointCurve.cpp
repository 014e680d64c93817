#include "pinsim/physics/DragPointCurve.hpp"

#include <algorithm>
#include <cmath>

#include <glm/geometric.hpp>
#include <glm/vec2.hpp>

namespace pinsim::physics
{
namespace
{
constexpr int kMaxSubdivisions = 64;
constexpr float kMinAccuracy = 0.5F;

float HorizontalDistance(const glm::vec3& a, const glm::vec3& b)
{
    return glm::length(glm::vec2{a.x - b.x, a.y - b.y});
}
} // namespace

glm::vec3 DragPointCurve::CatmullRom(
    const glm::vec3& p0,
    const glm::vec3& p1,
    const glm::vec3& p2,
    const glm::vec3& p3,
    float t)
{
    const float t2 = t * t;
    const float t3 = t2 * t;
    return 0.5F * ((2.0F * p1) +
                   (p2 - p0) * t +
                   (2.0F * p0 - 5.0F * p1 + 4.0F * p2 - p3) * t2 +
                   (3.0F * p1 - p0 - 3.0F * p2 + p3) * t3);
}

std::vector<CurveVertex> DragPointCurve::Interpolate(
    const std::vector<scene::DragPoint>& points,
    bool loop,
    float accuracy)
{
    std::vector<CurveVertex> vertices;
    const int count = static_cast<int>(points.size());
    if (count == 0)
    {
        return vertices;
    }
    if (count == 1)
    {
        vertices.push_back(CurveVertex{points[0].center, points[0].isSmooth, points[0].isSlingshot, true});
        return vertices;
    }

    const float step = std::max(kMinAccuracy, accuracy);
    const int spanCount = loop ? count : count - 1;

    auto pointAt = [&](int index) -> const scene::DragPoint& {
        if (loop)
        {
            return points[static_cast<std::size_t>((index % count + count) % count)];
        }
        return points[static_cast<std::size_t>(std::clamp(index, 0, count - 1))];
    };

    for (int span = 0; span < spanCount; ++span)
    {
        const scene::DragPoint& p1 = pointAt(span);
        const scene::DragPoint& p2 = pointAt(span + 1);
        const glm::vec3& p0 = pointAt(span - 1).center;
        const glm::vec3& p3 = pointAt(span + 2).center;

        vertices.push_back(CurveVertex{p1.center, p1.isSmooth, p1.isSlingshot, true});

        const float chord = HorizontalDistance(p1.center, p2.center);
        const int subdivisions = std::clamp(static_cast<int>(std::ceil(chord / step)), 1, kMaxSubdivisions);
        const bool curved = p1.isSmooth && p2.isSmooth;

        for (int i = 1; i < subdivisions; ++i)
        {
            const float t = static_cast<float>(i) / static_cast<float>(subdivisions);
            const glm::vec3 position = curved
                ? CatmullRom(p0, p1.center, p2.center, p3, t)
                : p1.center + (p2.center - p1.center) * t;
            // a slingshot span keeps its flag on every sub-segment
            vertices.push_back(CurveVertex{position, curved, p1.isSlingshot, false});
        }
    }

    if (!loop)
    {
        const scene::DragPoint& last = points.back();
        vertices.push_back(CurveVertex{last.center, last.isSmooth, last.isSlingshot, true});
    }

    return vertices;
}

std::vector<float> DragPointCurve::CumulativeLengths(const std::vector<CurveVertex>& vertices, bool loop)
{
    std::vector<float> lengths;
    lengths.reserve(vertices.size() + 1);
    float total = 0.0F;
    for (std::size_t i = 0; i < vertices.size(); ++i)
    {
        if (i > 0)
        {
            total += HorizontalDistance(vertices[i - 1].position, vertices[i].position);
        }
        lengths.push_back(total);
    }
    if (loop && vertices.size() > 1)
    {
        total += HorizontalDistance(vertices.back().position, vertices.front().position);
        lengths.push_back(total);
    }
    return lengths;
}
} // namespace pinsim::physics
