#pragma once

#include <vector>

#include "pinsim/devices/Device.hpp"

namespace pinsim::devices
{
/// Rubber band ring. Raises Hit when a ball strikes it above the hit threshold.
class RubberDevice final
    : public Device
    , public IColliderGenerator
    , public IContactResponder
{
public:
    RubberDevice(scene::DeviceId id, const scene::RubberData& data, DeviceContext context);

    [[nodiscard]] const scene::RubberData& Data() const { return m_data; }
    [[nodiscard]] const physics::ColliderMaterial& Material() const { return m_material; }

    core::EventSource<HitEventArgs>& HitEvent() { return m_hitEvent; }

    void GenerateColliders(float margin, std::vector<physics::Collider>& outColliders) const override;
    void OnContact(physics::BallState& ball, physics::ContactEvent& contact) override;

    IColliderGenerator* AsColliderGenerator() override { return this; }
    IContactResponder* AsContactResponder() override { return this; }

private:
    scene::RubberData m_data;
    physics::ColliderMaterial m_material;
    core::EventSource<HitEventArgs> m_hitEvent;
};
} // namespace pinsim::devices
