#include "pinsim/devices/RampDevice.hpp"

#include "pinsim/physics/ColliderGenerator.hpp"

namespace pinsim::devices
{
RampDevice::RampDevice(scene::DeviceId id, const scene::RampData& data, DeviceContext context)
    : Device(id, data.name, scene::DeviceKind::Ramp, context)
    , m_data(data)
    , m_material(physics::ColliderGenerator::RampMaterial(data))
{
}

void RampDevice::GenerateColliders(float margin, std::vector<physics::Collider>& outColliders) const
{
    physics::ColliderGenerator::GenerateRamp(m_data, Id(), margin, outColliders);
}

void RampDevice::OnContact(physics::BallState& ball, physics::ContactEvent& contact)
{
    if (physics::ExceedsHitThreshold(m_material, ball, contact))
    {
        m_hitEvent.Emit(HitEventArgs{ball.id});
    }
}
} // namespace pinsim::devices
