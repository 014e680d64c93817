#pragma once

#include <memory>
#include <string>
#include <vector>

#include "pinsim/devices/Device.hpp"
#include "pinsim/physics/KickerPhysics.hpp"
#include "pinsim/wiring/DeviceCoil.hpp"
#include "pinsim/wiring/SwitchHandler.hpp"

namespace pinsim::devices
{
/// Saucer / hole that holds a ball until one of its coils kicks it out.
///
/// Occupancy (the resident ball) is owned by the kicker. It is set by Capture() or one
/// of the Create*Ball() calls and cleared by a kick, by the ball falling through, or
/// when the ball manager destroys the resident ball at its drain point.
class KickerDevice final
    : public Device
    , public IColliderGenerator
    , public IHittable
    , public IContactResponder
    , public wiring::ICoilDevice
    , public wiring::ISwitchDevice
    , public wiring::IWireDeviceDest
{
public:
    static constexpr const char* kSwitchName = "Switch";
    static constexpr float kDefaultBallRadius = 25.0F;
    static constexpr float kDefaultBallMass = 1.0F;

    KickerDevice(scene::DeviceId id, const scene::KickerData& data, DeviceContext context);
    ~KickerDevice() override;

    /// Launch the resident ball. Angle in degrees, 0 = along -Y. No-op when empty.
    void Kick(float angle, float speed, float inclination = 0.0F);
    void KickXYZ(float angle, float speed, float inclination, float x, float y, float z);

    scene::BallId CreateBall();
    scene::BallId CreateSizedBall(float radius);
    scene::BallId CreateSizedBallWithMass(float radius, float mass);

    /// Queue the resident ball for destruction; occupancy clears when it is drained.
    bool DestroyBall();

    /// Take in a ball that entered the hit circle. Returns false when the kicker is
    /// occupied or the ball was just kicked out of it.
    bool Capture(scene::BallId ball);

    [[nodiscard]] bool HasBall() const { return m_ball != scene::kNoBall; }
    [[nodiscard]] scene::BallId BallId() const { return m_ball; }
    [[nodiscard]] const physics::BallState* GetBallData() const;

    [[nodiscard]] const scene::KickerData& Data() const { return m_data; }
    [[nodiscard]] const wiring::SwitchHandler& SwitchState() const { return *m_switch; }

    core::EventSource<HitEventArgs>& HitEvent() { return m_hitEvent; }
    core::EventSource<HitEventArgs>& UnHitEvent() { return m_unHitEvent; }
    core::EventSource<SwitchEventArgs>& SwitchEvent() { return m_switchEvent; }

    // IColliderGenerator
    void GenerateColliders(float margin, std::vector<physics::Collider>& outColliders) const override;
    // IHittable
    void OnHit(scene::BallId ball, bool isUnHit) override;
    // IContactResponder
    void OnContact(physics::BallState& ball, physics::ContactEvent& contact) override;
    // ICoilDevice
    wiring::IWireDest* Coil(const std::string& name, wiring::InvalidReference* outError = nullptr) override;
    [[nodiscard]] std::vector<std::string> CoilNames() const override;
    // ISwitchDevice
    wiring::SwitchHandler* Switch(const std::string& name, wiring::InvalidReference* outError = nullptr) override;
    [[nodiscard]] std::vector<std::string> SwitchNames() const override;
    // IWireDeviceDest
    wiring::IWireDest* Wire(const std::string& name, wiring::InvalidReference* outError = nullptr) override;

    IColliderGenerator* AsColliderGenerator() override { return this; }
    IHittable* AsHittable() override { return this; }
    IContactResponder* AsContactResponder() override { return this; }
    wiring::ICoilDevice* AsCoilDevice() override { return this; }
    wiring::ISwitchDevice* AsSwitchDevice() override { return this; }
    wiring::IWireDeviceDest* AsWireDeviceDest() override { return this; }

private:
    bool CaptureState(physics::BallState& ball, physics::ContactEvent& contact);
    void RaiseSwitch(bool enabled, scene::BallId ball);
    void HandleBallDestroyed(scene::BallId ball);

    scene::KickerData m_data;
    std::unique_ptr<wiring::SwitchHandler> m_switch;
    std::vector<std::unique_ptr<wiring::DeviceCoil>> m_coils;

    scene::BallId m_ball = scene::kNoBall;
    scene::BallId m_lastKickedBall = scene::kNoBall;
    core::SubscriptionId m_ballDestroyedSubscription = 0;

    core::EventSource<HitEventArgs> m_hitEvent;
    core::EventSource<HitEventArgs> m_unHitEvent;
    core::EventSource<SwitchEventArgs> m_switchEvent;
};
} // namespace pinsim::devices
