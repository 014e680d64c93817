#include "pinsim/physics/BallManager.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace pinsim::physics
{
scene::BallId BallManager::CreateBall(scene::DeviceId owner, const glm::vec3& position, float radius, float mass)
{
    const scene::BallId id = m_nextBall++;

    BallRecord record;
    record.state.id = id;
    record.state.position = position;
    record.state.radius = radius;
    record.state.mass = mass;
    record.owner = owner;
    m_balls.emplace(id, record);

    m_ballCreated.Emit(id, owner);
    return id;
}

bool BallManager::DestroyBall(scene::BallId ball)
{
    const auto it = m_balls.find(ball);
    if (it == m_balls.end())
    {
        std::cout << "BallManager: WARNING - Cannot destroy unknown ball " << ball << "\n";
        return false;
    }
    if (it->second.pendingDestroy)
    {
        return false;
    }

    it->second.pendingDestroy = true;
    m_pendingDestroy.push_back(ball);
    return true;
}

void BallManager::DrainPendingDestruction()
{
    if (m_pendingDestroy.empty())
    {
        return;
    }

    // observers may queue more removals, those wait for the next drain
    std::vector<scene::BallId> pending;
    pending.swap(m_pendingDestroy);

    for (const scene::BallId ball : pending)
    {
        const auto it = m_balls.find(ball);
        if (it == m_balls.end())
        {
            continue;
        }
        const scene::DeviceId owner = it->second.owner;
        m_balls.erase(it);
        m_ballDestroyed.Emit(ball, owner);
    }
}

void BallManager::Clear()
{
    std::vector<std::pair<scene::BallId, scene::DeviceId>> removed;
    removed.reserve(m_balls.size());
    for (const auto& [id, record] : m_balls)
    {
        removed.emplace_back(id, record.owner);
    }
    std::sort(removed.begin(), removed.end());

    m_balls.clear();
    m_pendingDestroy.clear();
    m_nextBall = 1;

    // owners holding a reference (kicker occupancy) must see every removal
    for (const auto& [ball, owner] : removed)
    {
        m_ballDestroyed.Emit(ball, owner);
    }
}

bool BallManager::HasBall(scene::BallId ball) const
{
    return m_balls.contains(ball);
}

bool BallManager::IsPendingDestroy(scene::BallId ball) const
{
    const auto it = m_balls.find(ball);
    return it != m_balls.end() && it->second.pendingDestroy;
}

BallRecord* BallManager::Find(scene::BallId ball)
{
    const auto it = m_balls.find(ball);
    return it != m_balls.end() ? &it->second : nullptr;
}

const BallRecord* BallManager::Find(scene::BallId ball) const
{
    const auto it = m_balls.find(ball);
    return it != m_balls.end() ? &it->second : nullptr;
}

std::vector<scene::BallId> BallManager::BallIds() const
{
    std::vector<scene::BallId> ids;
    ids.reserve(m_balls.size());
    for (const auto& [id, _] : m_balls)
    {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}
} // namespace pinsim::physics
