#include "pinsim/physics/ColliderGenerator.hpp"

#include <algorithm>
#include <iostream>

#include <glm/geometric.hpp>
#include <glm/vec2.hpp>

#include "pinsim/physics/DragPointCurve.hpp"

namespace pinsim::physics
{
namespace
{
constexpr float kGeomEpsilon = 1.0e-5F;

// table default used by rubbers that do not override their physics
constexpr float kDefaultRubberElasticity = 0.8F;
constexpr float kDefaultRubberElasticityFalloff = 0.3F;
constexpr float kDefaultRubberFriction = 0.6F;
constexpr float kDefaultRubberScatter = 5.0F;

glm::vec2 Xy(const glm::vec3& v)
{
    return glm::vec2{v.x, v.y};
}

// Left-hand perpendicular of the path direction at a vertex, averaged over both
// neighbouring spans.
glm::vec2 PathPerpendicular(const std::vector<CurveVertex>& vertices, std::size_t index, bool loop)
{
    const std::size_t count = vertices.size();
    std::size_t prev = index;
    std::size_t next = index;
    if (loop)
    {
        prev = (index + count - 1) % count;
        next = (index + 1) % count;
    }
    else
    {
        prev = index > 0 ? index - 1 : index;
        next = index + 1 < count ? index + 1 : index;
    }

    glm::vec2 dir = Xy(vertices[next].position) - Xy(vertices[prev].position);
    const float length = glm::length(dir);
    if (length < kGeomEpsilon)
    {
        return glm::vec2{0.0F};
    }
    dir /= length;
    return glm::vec2{-dir.y, dir.x};
}
} // namespace

float ColliderGenerator::KickerRadiusFactor(bool legacyMode, bool fallThrough)
{
    if (!legacyMode)
    {
        return 1.0F;
    }
    return fallThrough ? 0.6F : 0.75F;
}

void ColliderGenerator::GenerateKicker(
    const scene::KickerData& data,
    scene::DeviceId owner,
    float margin,
    std::vector<Collider>& outColliders)
{
    // only the inner part of the kicker starts a hit
    const float radius = data.radius * KickerRadiusFactor(data.legacyMode, data.fallThrough);
    const float height = data.positionZ;

    ColliderMaterial material;
    material.fireHitEvents = true;
    material.hitThreshold = 0.0F;

    outColliders.push_back(Collider::KickerCircle(
        CircleShape{data.center, radius},
        height,
        height + data.hitHeight,
        owner,
        margin,
        material
    ));
}

PlungerShape ColliderGenerator::PlungerGeometry(const scene::PlungerData& data)
{
    PlungerShape shape;
    shape.centerX = data.center.x;
    shape.halfWidth = data.width * 0.5F;
    shape.frameStart = data.center.y;
    shape.frameEnd = data.center.y - data.stroke;
    shape.restPosition = shape.frameEnd + std::clamp(data.parkPosition, 0.0F, 1.0F) * data.stroke;
    return shape;
}

void ColliderGenerator::GeneratePlunger(
    const scene::PlungerData& data,
    scene::DeviceId owner,
    float margin,
    std::vector<Collider>& outColliders)
{
    ColliderMaterial material;
    material.elasticity = 0.0F;

    outColliders.push_back(Collider::Plunger(
        PlungerGeometry(data),
        data.zAdjust,
        data.zAdjust + data.height,
        owner,
        margin,
        material
    ));
}

ColliderMaterial ColliderGenerator::RampMaterial(const scene::RampData& data)
{
    ColliderMaterial material;
    material.elasticity = data.elasticity;
    material.friction = data.friction;
    material.scatter = data.scatter;
    material.hitThreshold = data.threshold;
    material.fireHitEvents = data.hitEvent;
    return material;
}

ColliderMaterial ColliderGenerator::RubberMaterial(const scene::RubberData& data)
{
    ColliderMaterial material;
    if (data.overwritePhysics)
    {
        material.elasticity = data.elasticity;
        material.elasticityFalloff = data.elasticityFalloff;
        material.friction = data.friction;
        material.scatter = data.scatter;
    }
    else
    {
        material.elasticity = kDefaultRubberElasticity;
        material.elasticityFalloff = kDefaultRubberElasticityFalloff;
        material.friction = kDefaultRubberFriction;
        material.scatter = kDefaultRubberScatter;
    }
    material.hitThreshold = data.threshold;
    material.fireHitEvents = data.hitEvent;
    return material;
}

void ColliderGenerator::GenerateRamp(
    const scene::RampData& data,
    scene::DeviceId owner,
    float margin,
    std::vector<Collider>& outColliders)
{
    const std::vector<CurveVertex> vertices = DragPointCurve::Interpolate(data.dragPoints, false, data.accuracy);
    if (vertices.size() < 2)
    {
        std::cout << "ColliderGenerator: WARNING - Ramp '" << data.name << "' needs at least two drag points\n";
        return;
    }

    const std::vector<float> lengths = DragPointCurve::CumulativeLengths(vertices, false);
    const float totalLength = lengths.back();
    const std::size_t count = vertices.size();

    std::vector<glm::vec3> left(count);
    std::vector<glm::vec3> right(count);
    std::vector<float> floorZ(count);

    for (std::size_t i = 0; i < count; ++i)
    {
        const float t = totalLength > kGeomEpsilon ? lengths[i] / totalLength : 0.0F;
        const float halfWidth = 0.5F * (data.widthBottom + (data.widthTop - data.widthBottom) * t);
        floorZ[i] = data.playfieldHeight + data.heightBottom + (data.heightTop - data.heightBottom) * t;

        const glm::vec2 center = Xy(vertices[i].position);
        const glm::vec2 perp = PathPerpendicular(vertices, i, false);
        left[i] = glm::vec3{center + perp * halfWidth, floorZ[i]};
        right[i] = glm::vec3{center - perp * halfWidth, floorZ[i]};
    }

    const ColliderMaterial material = RampMaterial(data);

    // floor
    for (std::size_t i = 0; i + 1 < count; ++i)
    {
        outColliders.push_back(Collider::Triangle(TriangleShape{{left[i], right[i], right[i + 1]}}, owner, margin, material));
        outColliders.push_back(Collider::Triangle(TriangleShape{{left[i], right[i + 1], left[i + 1]}}, owner, margin, material));
    }

    auto addWall = [&](const std::vector<glm::vec3>& edge, float wallHeight) {
        if (wallHeight <= 0.0F)
        {
            return;
        }
        for (std::size_t i = 0; i + 1 < count; ++i)
        {
            const float zLow = std::min(floorZ[i], floorZ[i + 1]);
            const float zHigh = std::max(floorZ[i], floorZ[i + 1]) + wallHeight;
            outColliders.push_back(Collider::LineSegment(
                LineSegmentShape{Xy(edge[i]), Xy(edge[i + 1])},
                zLow,
                zHigh,
                owner,
                margin,
                material
            ));
        }
        outColliders.push_back(Collider::LineZ(LineZShape{Xy(edge.front())}, floorZ.front(), floorZ.front() + wallHeight, owner, margin, material));
        outColliders.push_back(Collider::LineZ(LineZShape{Xy(edge.back())}, floorZ.back(), floorZ.back() + wallHeight, owner, margin, material));
    };

    addWall(left, data.leftWallHeight);
    addWall(right, data.rightWallHeight);
}

void ColliderGenerator::GenerateRubber(
    const scene::RubberData& data,
    scene::DeviceId owner,
    float margin,
    std::vector<Collider>& outColliders)
{
    const std::vector<CurveVertex> vertices = DragPointCurve::Interpolate(data.dragPoints, true, data.accuracy);
    if (vertices.size() < 2)
    {
        std::cout << "ColliderGenerator: WARNING - Rubber '" << data.name << "' needs at least two drag points\n";
        return;
    }

    const ColliderMaterial material = RubberMaterial(data);
    const float halfThickness = data.thickness * 0.5F;
    const float zLow = data.height;
    const float zHigh = data.height + data.thickness;
    const std::size_t count = vertices.size();

    for (std::size_t i = 0; i < count; ++i)
    {
        const glm::vec2 a = Xy(vertices[i].position);
        const glm::vec2 b = Xy(vertices[(i + 1) % count].position);
        const glm::vec2 dir = b - a;
        const float length = glm::length(dir);
        if (length < kGeomEpsilon)
        {
            continue;
        }
        const glm::vec2 perp = glm::vec2{-dir.y, dir.x} / length * halfThickness;

        outColliders.push_back(Collider::LineSegment(LineSegmentShape{a + perp, b + perp}, zLow, zHigh, owner, margin, material));
        outColliders.push_back(Collider::LineSegment(LineSegmentShape{b - perp, a - perp}, zLow, zHigh, owner, margin, material));
    }

    for (const CurveVertex& vertex : vertices)
    {
        outColliders.push_back(Collider::Circle(CircleShape{Xy(vertex.position), halfThickness}, zLow, zHigh, owner, margin, material));
    }
}
} // namespace pinsim::physics
