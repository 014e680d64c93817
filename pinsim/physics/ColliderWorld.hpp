#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <unordered_map>
#include <vector>

#include <glm/vec3.hpp>

#include "pinsim/physics/Ball.hpp"
#include "pinsim/physics/Collider.hpp"

namespace pinsim::physics
{
/// Collider sets of all devices plus a uniform-grid index the ball integrator uses to
/// find candidate colliders near a ball.
class ColliderWorld
{
public:
    explicit ColliderWorld(float cellSize = 64.0F);

    void Clear();

    /// Replace every collider of a device. Colliders owned by another device are rejected.
    void SetDeviceColliders(scene::DeviceId device, std::vector<Collider> colliders);
    bool RemoveDevice(scene::DeviceId device);

    [[nodiscard]] const std::vector<Collider>& DeviceColliders(scene::DeviceId device) const;
    [[nodiscard]] std::size_t ColliderCount() const;
    [[nodiscard]] std::size_t DeviceCount() const { return m_deviceColliders.size(); }

    /// Colliders whose margin-inflated bounds overlap the box, in device then build order.
    void QueryCandidates(const glm::vec3& minBounds, const glm::vec3& maxBounds, std::vector<const Collider*>& outColliders) const;
    [[nodiscard]] std::vector<const Collider*> QueryBall(const BallState& ball) const;

private:
    struct CellKey
    {
        int x = 0;
        int y = 0;
        int z = 0;

        [[nodiscard]] bool operator==(const CellKey& other) const
        {
            return x == other.x && y == other.y && z == other.z;
        }
    };

    struct CellKeyHash
    {
        [[nodiscard]] std::size_t operator()(const CellKey& key) const
        {
            const std::size_t hx = static_cast<std::size_t>(key.x) * 73856093U;
            const std::size_t hy = static_cast<std::size_t>(key.y) * 19349663U;
            const std::size_t hz = static_cast<std::size_t>(key.z) * 83492791U;
            return hx ^ hy ^ hz;
        }
    };

    void RebuildSpatialIndex() const;

    std::map<scene::DeviceId, std::vector<Collider>> m_deviceColliders;

    mutable std::vector<const Collider*> m_flat;
    mutable std::vector<Aabb> m_flatBounds;
    mutable std::unordered_map<CellKey, std::vector<std::size_t>, CellKeyHash> m_spatialCells;
    mutable std::vector<std::uint32_t> m_visitStamp;
    mutable std::uint32_t m_currentStamp = 1;
    mutable bool m_spatialDirty = true;
    float m_cellSize;
};
} // namespace pinsim::physics
