#pragma once

#include <string>
#include <vector>

#include "pinsim/devices/Device.hpp"
#include "pinsim/physics/PlungerPhysics.hpp"
#include "pinsim/wiring/DeviceCoil.hpp"

namespace pinsim::devices
{
/// Spring plunger in the shooter lane.
/// Coils: "Pull" (enable pulls back, disable releases) and "Fire" (enable fires).
class PlungerDevice final
    : public Device
    , public IColliderGenerator
    , public IContactResponder
    , public IRotatable
    , public wiring::ICoilDevice
    , public wiring::IWireDeviceDest
{
public:
    static constexpr const char* kPullCoilName = "Pull";
    static constexpr const char* kFireCoilName = "Fire";

    PlungerDevice(scene::DeviceId id, const scene::PlungerData& data, DeviceContext context);

    void PullBack();
    /// Release. Auto plungers always fire at full strength, manual ones from the
    /// current stroke ratio. Returns the ratio used.
    float Fire();

    [[nodiscard]] bool DoRetract() const { return m_doRetract; }
    void SetDoRetract(bool doRetract) { m_doRetract = doRetract; }

    /// Analog input, 0 = resting, 1 = fully pulled. Stored as given.
    void SetAnalogPosition(float value) { m_movement.analogPosition = value; }
    [[nodiscard]] float AnalogPosition() const { return m_movement.analogPosition; }

    void Update(float deltaSeconds);

    [[nodiscard]] float Position() const { return m_movement.position; }
    [[nodiscard]] float Speed() const { return m_movement.speed; }
    [[nodiscard]] float StrokeRatio() const { return physics::StrokeRatio(m_movement, m_static); }
    [[nodiscard]] physics::PlungerStroke Stroke() const { return m_movement.stroke; }
    [[nodiscard]] const physics::PlungerStaticData& StaticData() const { return m_static; }
    [[nodiscard]] const scene::PlungerData& Data() const { return m_data; }

    core::EventSource<StrokeEventArgs>& LimitBosEvent() { return m_limitBosEvent; }
    core::EventSource<StrokeEventArgs>& LimitEosEvent() { return m_limitEosEvent; }

    void GenerateColliders(float margin, std::vector<physics::Collider>& outColliders) const override;
    void OnContact(physics::BallState& ball, physics::ContactEvent& contact) override;
    void OnRotate(float speed, bool direction) override;

    wiring::IWireDest* Coil(const std::string& name, wiring::InvalidReference* outError = nullptr) override;
    [[nodiscard]] std::vector<std::string> CoilNames() const override;
    wiring::IWireDest* Wire(const std::string& name, wiring::InvalidReference* outError = nullptr) override;

    IColliderGenerator* AsColliderGenerator() override { return this; }
    IContactResponder* AsContactResponder() override { return this; }
    IRotatable* AsRotatable() override { return this; }
    wiring::ICoilDevice* AsCoilDevice() override { return this; }
    wiring::IWireDeviceDest* AsWireDeviceDest() override { return this; }

private:
    scene::PlungerData m_data;
    physics::PlungerStaticData m_static;
    physics::PlungerMovementData m_movement;
    physics::ColliderMaterial m_material;
    bool m_doRetract;

    wiring::DeviceCoil m_pullCoil;
    wiring::DeviceCoil m_fireCoil;

    core::EventSource<StrokeEventArgs> m_limitBosEvent;
    core::EventSource<StrokeEventArgs> m_limitEosEvent;
};
} // namespace pinsim::devices
