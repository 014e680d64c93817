#include "pinsim/devices/PlungerDevice.hpp"

#include "pinsim/physics/ColliderGenerator.hpp"

namespace pinsim::devices
{
namespace
{
physics::ColliderMaterial PlungerMaterial()
{
    physics::ColliderMaterial material;
    material.elasticity = 0.0F;
    material.friction = 0.0F;
    return material;
}
} // namespace

PlungerDevice::PlungerDevice(scene::DeviceId id, const scene::PlungerData& data, DeviceContext context)
    : Device(id, data.name, scene::DeviceKind::Plunger, context)
    , m_data(data)
    , m_static(physics::PlungerStaticData::FromData(data))
    , m_material(PlungerMaterial())
    , m_doRetract(data.doRetract)
    , m_pullCoil(kPullCoilName, [this]() { PullBack(); }, [this]() { Fire(); })
    , m_fireCoil(kFireCoilName, [this]() { Fire(); })
{
    m_movement.position = m_static.restPosition;
}

void PlungerDevice::PullBack()
{
    if (m_doRetract)
    {
        physics::PlungerCommands::PullBackAndRetract(m_movement);
    }
    else
    {
        physics::PlungerCommands::PullBack(m_movement);
    }
}

float PlungerDevice::Fire()
{
    const float ratio = m_static.isAutoPlunger ? 1.0F : physics::StrokeRatio(m_movement, m_static);
    return physics::PlungerCommands::Fire(ratio, m_movement, m_static);
}

void PlungerDevice::Update(float deltaSeconds)
{
    if (const auto limit = physics::UpdatePlunger(m_movement, m_static, deltaSeconds))
    {
        OnRotate(limit->speed, limit->direction);
    }
}

void PlungerDevice::GenerateColliders(float margin, std::vector<physics::Collider>& outColliders) const
{
    physics::ColliderGenerator::GeneratePlunger(m_data, Id(), margin, outColliders);
}

void PlungerDevice::OnContact(physics::BallState& ball, physics::ContactEvent& contact)
{
    physics::CollidePlunger(ball, contact, m_movement, m_static, m_material, m_context.config, m_context.rng);
}

void PlungerDevice::OnRotate(float speed, bool direction)
{
    if (direction)
    {
        m_limitEosEvent.Emit(StrokeEventArgs{speed});
    }
    else
    {
        m_limitBosEvent.Emit(StrokeEventArgs{speed});
    }
}

wiring::IWireDest* PlungerDevice::Coil(const std::string& name, wiring::InvalidReference* outError)
{
    if (name == kPullCoilName)
    {
        return &m_pullCoil;
    }
    if (name == kFireCoilName)
    {
        return &m_fireCoil;
    }
    wiring::ReportInvalidReference("PlungerDevice", "coil", name, CoilNames(), outError);
    return nullptr;
}

std::vector<std::string> PlungerDevice::CoilNames() const
{
    return {kPullCoilName, kFireCoilName};
}

wiring::IWireDest* PlungerDevice::Wire(const std::string& name, wiring::InvalidReference* outError)
{
    return Coil(name, outError);
}
} // namespace pinsim::devices
