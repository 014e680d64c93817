#pragma once

#include <random>
#include <string>
#include <vector>

#include "pinsim/core/Event.hpp"
#include "pinsim/core/SimulationConfig.hpp"
#include "pinsim/physics/BallManager.hpp"
#include "pinsim/physics/Collider.hpp"
#include "pinsim/scene/PlayfieldData.hpp"
#include "pinsim/wiring/WireDest.hpp"

namespace pinsim::devices
{
/// Simulation services a device may use. All references outlive the device.
struct DeviceContext
{
    physics::BallManager& balls;
    const core::SimulationConfig& config;
    std::mt19937& rng;
};

struct HitEventArgs
{
    scene::BallId ball = scene::kNoBall;
};

struct SwitchEventArgs
{
    bool isEnabled = false;
    scene::BallId ball = scene::kNoBall;
};

struct StrokeEventArgs
{
    float speed = 0.0F;
};

class IColliderGenerator
{
public:
    virtual ~IColliderGenerator() = default;
    virtual void GenerateColliders(float margin, std::vector<physics::Collider>& outColliders) const = 0;
};

/// Hit / unhit notifications from the ball integrator.
class IHittable
{
public:
    virtual ~IHittable() = default;
    virtual void OnHit(scene::BallId ball, bool isUnHit) = 0;
};

/// Resolution of a contact between a ball and one of the device's colliders.
class IContactResponder
{
public:
    virtual ~IContactResponder() = default;
    virtual void OnContact(physics::BallState& ball, physics::ContactEvent& contact) = 0;
};

/// Devices with a moving part that report its travel limits.
class IRotatable
{
public:
    virtual ~IRotatable() = default;
    virtual void OnRotate(float speed, bool direction) = 0;
};

/// Base of every playfield device. Capabilities are exposed through the As*()
/// accessors, which return nullptr for capabilities the device does not have.
class Device
{
public:
    Device(scene::DeviceId id, std::string name, scene::DeviceKind kind, DeviceContext context);
    virtual ~Device() = default;

    Device(const Device&) = delete;
    Device& operator=(const Device&) = delete;

    [[nodiscard]] scene::DeviceId Id() const { return m_id; }
    [[nodiscard]] const std::string& Name() const { return m_name; }
    [[nodiscard]] scene::DeviceKind Kind() const { return m_kind; }

    /// Called once when the simulation starts. Emits the Init event.
    virtual void OnInit();
    /// Called once at teardown, before the device is destroyed.
    virtual void OnDestroy() {}

    core::EventSource<scene::DeviceId>& InitEvent() { return m_initEvent; }

    virtual IColliderGenerator* AsColliderGenerator() { return nullptr; }
    virtual IHittable* AsHittable() { return nullptr; }
    virtual IContactResponder* AsContactResponder() { return nullptr; }
    virtual IRotatable* AsRotatable() { return nullptr; }
    virtual wiring::ICoilDevice* AsCoilDevice() { return nullptr; }
    virtual wiring::ISwitchDevice* AsSwitchDevice() { return nullptr; }
    virtual wiring::IWireDeviceDest* AsWireDeviceDest() { return nullptr; }

protected:
    DeviceContext m_context;

private:
    scene::DeviceId m_id;
    std::string m_name;
    scene::DeviceKind m_kind;
    core::EventSource<scene::DeviceId> m_initEvent;
};

[[nodiscard]] const char* DeviceKindName(scene::DeviceKind kind);
} // namespace pinsim::devices
