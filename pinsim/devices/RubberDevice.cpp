#include "pinsim/devices/RubberDevice.hpp"

#include "pinsim/physics/ColliderGenerator.hpp"

namespace pinsim::devices
{
RubberDevice::RubberDevice(scene::DeviceId id, const scene::RubberData& data, DeviceContext context)
    : Device(id, data.name, scene::DeviceKind::Rubber, context)
    , m_data(data)
    , m_material(physics::ColliderGenerator::RubberMaterial(data))
{
}

void RubberDevice::GenerateColliders(float margin, std::vector<physics::Collider>& outColliders) const
{
    physics::ColliderGenerator::GenerateRubber(m_data, Id(), margin, outColliders);
}

void RubberDevice::OnContact(physics::BallState& ball, physics::ContactEvent& contact)
{
    if (physics::ExceedsHitThreshold(m_material, ball, contact))
    {
        m_hitEvent.Emit(HitEventArgs{ball.id});
    }
}
} // namespace pinsim::devices
