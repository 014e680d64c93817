#pragma once

#include <cstddef>
#include <unordered_map>
#include <vector>

#include <glm/vec3.hpp>

#include "pinsim/core/Event.hpp"
#include "pinsim/physics/Ball.hpp"

namespace pinsim::physics
{
struct BallRecord
{
    BallState state;
    ContactEvent contact;
    scene::DeviceId owner = scene::kNoDevice;
    bool pendingDestroy = false;
};

/// Owns every ball on the playfield. Destruction requests are queued and only
/// carried out by DrainPendingDestruction(), which the simulation calls once at the
/// start of each step.
class BallManager
{
public:
    scene::BallId CreateBall(scene::DeviceId owner, const glm::vec3& position, float radius, float mass);

    /// Queue a ball for removal. Returns false for unknown balls and for balls that
    /// are already queued.
    bool DestroyBall(scene::BallId ball);

    void DrainPendingDestruction();
    /// Remove every ball at once, raising BallDestroyedEvent for each in id order.
    void Clear();

    [[nodiscard]] bool HasBall(scene::BallId ball) const;
    [[nodiscard]] bool IsPendingDestroy(scene::BallId ball) const;

    [[nodiscard]] BallRecord* Find(scene::BallId ball);
    [[nodiscard]] const BallRecord* Find(scene::BallId ball) const;

    [[nodiscard]] std::vector<scene::BallId> BallIds() const;
    [[nodiscard]] std::size_t BallCount() const { return m_balls.size(); }
    [[nodiscard]] std::size_t PendingDestroyCount() const { return m_pendingDestroy.size(); }

    core::EventSource<scene::BallId, scene::DeviceId>& BallCreatedEvent() { return m_ballCreated; }
    core::EventSource<scene::BallId, scene::DeviceId>& BallDestroyedEvent() { return m_ballDestroyed; }

private:
    std::unordered_map<scene::BallId, BallRecord> m_balls;
    std::vector<scene::BallId> m_pendingDestroy;
    scene::BallId m_nextBall = 1;

    core::EventSource<scene::BallId, scene::DeviceId> m_ballCreated;
    core::EventSource<scene::BallId, scene::DeviceId> m_ballDestroyed;
};
} // namespace pinsim::physics
