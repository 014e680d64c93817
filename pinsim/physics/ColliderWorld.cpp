#include "pinsim/physics/ColliderWorld.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

namespace pinsim::physics
{
namespace
{
int CellCoord(float value, float cellSize)
{
    return static_cast<int>(std::floor(value / std::max(0.001F, cellSize)));
}

const std::vector<Collider>& EmptyColliders()
{
    static const std::vector<Collider> empty;
    return empty;
}
} // namespace

ColliderWorld::ColliderWorld(float cellSize)
    : m_cellSize(std::max(1.0F, cellSize))
{
}

void ColliderWorld::Clear()
{
    m_deviceColliders.clear();
    m_flat.clear();
    m_flatBounds.clear();
    m_spatialCells.clear();
    m_visitStamp.clear();
    m_currentStamp = 1;
    m_spatialDirty = true;
}

void ColliderWorld::SetDeviceColliders(scene::DeviceId device, std::vector<Collider> colliders)
{
    const auto foreign = std::find_if(colliders.begin(), colliders.end(), [device](const Collider& collider) {
        return collider.Owner() != device;
    });
    if (foreign != colliders.end())
    {
        std::cout << "ColliderWorld: ERROR - Device " << device << " submitted a collider owned by device "
                  << foreign->Owner() << ", ignoring the whole set\n";
        return;
    }

    m_deviceColliders[device] = std::move(colliders);
    m_spatialDirty = true;
}

bool ColliderWorld::RemoveDevice(scene::DeviceId device)
{
    if (m_deviceColliders.erase(device) == 0)
    {
        return false;
    }
    m_spatialDirty = true;
    return true;
}

const std::vector<Collider>& ColliderWorld::DeviceColliders(scene::DeviceId device) const
{
    const auto it = m_deviceColliders.find(device);
    return it != m_deviceColliders.end() ? it->second : EmptyColliders();
}

std::size_t ColliderWorld::ColliderCount() const
{
    std::size_t count = 0;
    for (const auto& [_, colliders] : m_deviceColliders)
    {
        count += colliders.size();
    }
    return count;
}

void ColliderWorld::RebuildSpatialIndex() const
{
    if (!m_spatialDirty)
    {
        return;
    }

    m_flat.clear();
    m_flatBounds.clear();
    m_spatialCells.clear();

    for (const auto& [_, colliders] : m_deviceColliders)
    {
        for (const Collider& collider : colliders)
        {
            m_flat.push_back(&collider);
            m_flatBounds.push_back(collider.Bounds());
        }
    }
    m_visitStamp.assign(m_flat.size(), 0U);

    for (std::size_t index = 0; index < m_flat.size(); ++index)
    {
        const Aabb& bounds = m_flatBounds[index];

        const int minX = CellCoord(bounds.min.x, m_cellSize);
        const int minY = CellCoord(bounds.min.y, m_cellSize);
        const int minZ = CellCoord(bounds.min.z, m_cellSize);
        const int maxX = CellCoord(bounds.max.x, m_cellSize);
        const int maxY = CellCoord(bounds.max.y, m_cellSize);
        const int maxZ = CellCoord(bounds.max.z, m_cellSize);

        for (int z = minZ; z <= maxZ; ++z)
        {
            for (int y = minY; y <= maxY; ++y)
            {
                for (int x = minX; x <= maxX; ++x)
                {
                    m_spatialCells[CellKey{x, y, z}].push_back(index);
                }
            }
        }
    }

    m_currentStamp = 1;
    m_spatialDirty = false;
}

void ColliderWorld::QueryCandidates(
    const glm::vec3& minBounds,
    const glm::vec3& maxBounds,
    std::vector<const Collider*>& outColliders) const
{
    RebuildSpatialIndex();
    outColliders.clear();

    if (m_flat.empty())
    {
        return;
    }

    ++m_currentStamp;
    if (m_currentStamp == 0)
    {
        std::fill(m_visitStamp.begin(), m_visitStamp.end(), 0U);
        m_currentStamp = 1;
    }

    const Aabb query{minBounds, maxBounds};
    std::vector<std::size_t> hits;

    const int minX = CellCoord(minBounds.x, m_cellSize);
    const int minY = CellCoord(minBounds.y, m_cellSize);
    const int minZ = CellCoord(minBounds.z, m_cellSize);
    const int maxX = CellCoord(maxBounds.x, m_cellSize);
    const int maxY = CellCoord(maxBounds.y, m_cellSize);
    const int maxZ = CellCoord(maxBounds.z, m_cellSize);

    for (int z = minZ; z <= maxZ; ++z)
    {
        for (int y = minY; y <= maxY; ++y)
        {
            for (int x = minX; x <= maxX; ++x)
            {
                const auto cellIt = m_spatialCells.find(CellKey{x, y, z});
                if (cellIt == m_spatialCells.end())
                {
                    continue;
                }

                for (const std::size_t index : cellIt->second)
                {
                    if (m_visitStamp[index] == m_currentStamp)
                    {
                        continue;
                    }
                    m_visitStamp[index] = m_currentStamp;
                    if (m_flatBounds[index].Overlaps(query))
                    {
                        hits.push_back(index);
                    }
                }
            }
        }
    }

    // cell iteration order is arbitrary, keep results deterministic
    std::sort(hits.begin(), hits.end());
    outColliders.reserve(hits.size());
    for (const std::size_t index : hits)
    {
        outColliders.push_back(m_flat[index]);
    }
}

std::vector<const Collider*> ColliderWorld::QueryBall(const BallState& ball) const
{
    std::vector<const Collider*> result;
    const glm::vec3 extent{ball.radius};
    QueryCandidates(ball.position - extent, ball.position + extent, result);
    return result;
}
} // namespace pinsim::physics
