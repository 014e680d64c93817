#pragma once

#include <vector>

#include "pinsim/devices/Device.hpp"

namespace pinsim::devices
{
/// Ramp floor and walls. Raises Hit when a ball strikes it hard enough and hit events are on.
class RampDevice final
    : public Device
    , public IColliderGenerator
    , public IContactResponder
{
public:
    RampDevice(scene::DeviceId id, const scene::RampData& data, DeviceContext context);

    [[nodiscard]] const scene::RampData& Data() const { return m_data; }
    [[nodiscard]] const physics::ColliderMaterial& Material() const { return m_material; }

    core::EventSource<HitEventArgs>& HitEvent() { return m_hitEvent; }

    void GenerateColliders(float margin, std::vector<physics::Collider>& outColliders) const override;
    void OnContact(physics::BallState& ball, physics::ContactEvent& contact) override;

    IColliderGenerator* AsColliderGenerator() override { return this; }
    IContactResponder* AsContactResponder() override { return this; }

private:
    scene::RampData m_data;
    physics::ColliderMaterial m_material;
    core::EventSource<HitEventArgs> m_hitEvent;
};
} // namespace pinsim::devices
