#pragma once

#include <array>
#include <cstdint>
#include <variant>

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

#include "pinsim/physics/Ball.hpp"
#include "pinsim/scene/PlayfieldData.hpp"

namespace pinsim::physics
{
enum class ColliderKind : std::uint8_t
{
    Circle,
    LineSegment,
    LineZ,
    Triangle,
    KickerCircle,
    Plunger
};

/// Surface response and hit-event settings shared by every collider of a device.
struct ColliderMaterial
{
    float elasticity = 0.3F;
    float elasticityFalloff = 0.0F;
    float friction = 0.3F;
    float scatter = 0.0F; ///< degrees
    float hitThreshold = 2.0F;
    bool fireHitEvents = false;
};

struct CircleShape
{
    glm::vec2 center{0.0F};
    float radius = 0.0F;
};

struct LineSegmentShape
{
    glm::vec2 start{0.0F};
    glm::vec2 end{0.0F};

    [[nodiscard]] float Length() const;
    /// Unit normal pointing to the right of start -> end.
    [[nodiscard]] glm::vec2 Normal() const;
};

struct LineZShape
{
    glm::vec2 xy{0.0F};
};

struct TriangleShape
{
    std::array<glm::vec3, 3> vertices{};

    [[nodiscard]] glm::vec3 Normal() const;
};

struct PlungerShape
{
    float centerX = 0.0F;
    float halfWidth = 0.0F;
    float frameStart = 0.0F;
    float frameEnd = 0.0F;
    float restPosition = 0.0F;
};

using ColliderShape = std::variant<CircleShape, LineSegmentShape, LineZShape, TriangleShape, PlungerShape>;

struct Aabb
{
    glm::vec3 min{0.0F};
    glm::vec3 max{0.0F};

    [[nodiscard]] bool Overlaps(const Aabb& other) const;
};

/// Immutable collision primitive owned by exactly one device.
class Collider
{
public:
    static Collider Circle(const CircleShape& shape, float zLow, float zHigh, scene::DeviceId owner, float margin, const ColliderMaterial& material = {});
    static Collider KickerCircle(const CircleShape& shape, float zLow, float zHigh, scene::DeviceId owner, float margin, const ColliderMaterial& material = {});
    static Collider LineSegment(const LineSegmentShape& shape, float zLow, float zHigh, scene::DeviceId owner, float margin, const ColliderMaterial& material = {});
    static Collider LineZ(const LineZShape& shape, float zLow, float zHigh, scene::DeviceId owner, float margin, const ColliderMaterial& material = {});
    static Collider Triangle(const TriangleShape& shape, scene::DeviceId owner, float margin, const ColliderMaterial& material = {});
    static Collider Plunger(const PlungerShape& shape, float zLow, float zHigh, scene::DeviceId owner, float margin, const ColliderMaterial& material = {});

    [[nodiscard]] ColliderKind Kind() const { return m_kind; }
    [[nodiscard]] const ColliderShape& Shape() const { return m_shape; }
    [[nodiscard]] float ZLow() const { return m_zLow; }
    [[nodiscard]] float ZHigh() const { return m_zHigh; }
    [[nodiscard]] scene::DeviceId Owner() const { return m_owner; }
    [[nodiscard]] float Margin() const { return m_margin; }
    [[nodiscard]] const ColliderMaterial& Material() const { return m_material; }

    template <typename T>
    [[nodiscard]] const T* As() const
    {
        return std::get_if<T>(&m_shape);
    }

    /// Bounding box inflated by the margin.
    [[nodiscard]] Aabb Bounds() const;

private:
    Collider(ColliderKind kind, ColliderShape shape, float zLow, float zHigh, scene::DeviceId owner, float margin, const ColliderMaterial& material);

    ColliderKind m_kind;
    ColliderShape m_shape;
    float m_zLow;
    float m_zHigh;
    scene::DeviceId m_owner;
    float m_margin;
    ColliderMaterial m_material;
};

[[nodiscard]] const char* ColliderKindName(ColliderKind kind);

/// Impact speed of a ball against a contact normal, compared with the material threshold.
[[nodiscard]] bool ExceedsHitThreshold(const ColliderMaterial& material, const BallState& ball, const ContactEvent& contact);
} // namespace pinsim::physics
