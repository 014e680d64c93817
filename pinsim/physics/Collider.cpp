#include "pinsim/physics/Collider.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include <glm/common.hpp>
#include <glm/geometric.hpp>

namespace pinsim::physics
{
namespace
{
constexpr float kDegenerateLength = 1.0e-6F;
} // namespace

float LineSegmentShape::Length() const
{
    return glm::length(end - start);
}

glm::vec2 LineSegmentShape::Normal() const
{
    const glm::vec2 dir = end - start;
    const float length = glm::length(dir);
    if (length < kDegenerateLength)
    {
        return glm::vec2{0.0F};
    }
    return glm::vec2{dir.y, -dir.x} / length;
}

glm::vec3 TriangleShape::Normal() const
{
    const glm::vec3 n = glm::cross(vertices[1] - vertices[0], vertices[2] - vertices[0]);
    const float length = glm::length(n);
    if (length < kDegenerateLength)
    {
        return glm::vec3{0.0F, 0.0F, 1.0F};
    }
    return n / length;
}

bool Aabb::Overlaps(const Aabb& other) const
{
    return min.x <= other.max.x && max.x >= other.min.x &&
           min.y <= other.max.y && max.y >= other.min.y &&
           min.z <= other.max.z && max.z >= other.min.z;
}

Collider::Collider(ColliderKind kind, ColliderShape shape, float zLow, float zHigh, scene::DeviceId owner, float margin, const ColliderMaterial& material)
    : m_kind(kind)
    , m_shape(std::move(shape))
    , m_zLow(std::min(zLow, zHigh))
    , m_zHigh(std::max(zLow, zHigh))
    , m_owner(owner)
    , m_margin(margin)
    , m_material(material)
{
}

Collider Collider::Circle(const CircleShape& shape, float zLow, float zHigh, scene::DeviceId owner, float margin, const ColliderMaterial& material)
{
    return Collider{ColliderKind::Circle, shape, zLow, zHigh, owner, margin, material};
}

Collider Collider::KickerCircle(const CircleShape& shape, float zLow, float zHigh, scene::DeviceId owner, float margin, const ColliderMaterial& material)
{
    return Collider{ColliderKind::KickerCircle, shape, zLow, zHigh, owner, margin, material};
}

Collider Collider::LineSegment(const LineSegmentShape& shape, float zLow, float zHigh, scene::DeviceId owner, float margin, const ColliderMaterial& material)
{
    return Collider{ColliderKind::LineSegment, shape, zLow, zHigh, owner, margin, material};
}

Collider Collider::LineZ(const LineZShape& shape, float zLow, float zHigh, scene::DeviceId owner, float margin, const ColliderMaterial& material)
{
    return Collider{ColliderKind::LineZ, shape, zLow, zHigh, owner, margin, material};
}

Collider Collider::Triangle(const TriangleShape& shape, scene::DeviceId owner, float margin, const ColliderMaterial& material)
{
    const float zLow = std::min({shape.vertices[0].z, shape.vertices[1].z, shape.vertices[2].z});
    const float zHigh = std::max({shape.vertices[0].z, shape.vertices[1].z, shape.vertices[2].z});
    return Collider{ColliderKind::Triangle, shape, zLow, zHigh, owner, margin, material};
}

Collider Collider::Plunger(const PlungerShape& shape, float zLow, float zHigh, scene::DeviceId owner, float margin, const ColliderMaterial& material)
{
    return Collider{ColliderKind::Plunger, shape, zLow, zHigh, owner, margin, material};
}

Aabb Collider::Bounds() const
{
    Aabb box;

    if (const auto* circle = As<CircleShape>())
    {
        box.min = glm::vec3{circle->center - glm::vec2{circle->radius}, m_zLow};
        box.max = glm::vec3{circle->center + glm::vec2{circle->radius}, m_zHigh};
    }
    else if (const auto* line = As<LineSegmentShape>())
    {
        box.min = glm::vec3{glm::min(line->start, line->end), m_zLow};
        box.max = glm::vec3{glm::max(line->start, line->end), m_zHigh};
    }
    else if (const auto* lineZ = As<LineZShape>())
    {
        box.min = glm::vec3{lineZ->xy, m_zLow};
        box.max = glm::vec3{lineZ->xy, m_zHigh};
    }
    else if (const auto* triangle = As<TriangleShape>())
    {
        box.min = glm::min(glm::min(triangle->vertices[0], triangle->vertices[1]), triangle->vertices[2]);
        box.max = glm::max(glm::max(triangle->vertices[0], triangle->vertices[1]), triangle->vertices[2]);
    }
    else if (const auto* plunger = As<PlungerShape>())
    {
        box.min = glm::vec3{plunger->centerX - plunger->halfWidth, std::min(plunger->frameEnd, plunger->frameStart), m_zLow};
        box.max = glm::vec3{plunger->centerX + plunger->halfWidth, std::max(plunger->frameEnd, plunger->frameStart), m_zHigh};
    }

    box.min -= glm::vec3{m_margin};
    box.max += glm::vec3{m_margin};
    return box;
}

const char* ColliderKindName(ColliderKind kind)
{
    switch (kind)
    {
        case ColliderKind::Circle: return "Circle";
        case ColliderKind::LineSegment: return "LineSegment";
        case ColliderKind::LineZ: return "LineZ";
        case ColliderKind::Triangle: return "Triangle";
        case ColliderKind::KickerCircle: return "KickerCircle";
        case ColliderKind::Plunger: return "Plunger";
        default: return "Unknown";
    }
}

bool ExceedsHitThreshold(const ColliderMaterial& material, const BallState& ball, const ContactEvent& contact)
{
    if (!material.fireHitEvents)
    {
        return false;
    }

    const float normalLength = glm::length(contact.hitNormal);
    const float impactSpeed = normalLength > kDegenerateLength
        ? std::abs(glm::dot(ball.velocity, contact.hitNormal / normalLength))
        : glm::length(ball.velocity);
    return impactSpeed >= material.hitThreshold;
}
} // namespace pinsim::physics
