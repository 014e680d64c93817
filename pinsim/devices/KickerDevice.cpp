#include "pinsim/devices/KickerDevice.hpp"

#include <algorithm>
#include <iostream>

#include "pinsim/physics/ColliderGenerator.hpp"

namespace pinsim::devices
{
KickerDevice::KickerDevice(scene::DeviceId id, const scene::KickerData& data, DeviceContext context)
    : Device(id, data.name, scene::DeviceKind::Kicker, context)
    , m_data(data)
    , m_switch(std::make_unique<wiring::SwitchHandler>(kSwitchName, false))
{
    if (m_data.coils.empty())
    {
        m_data.coils.push_back(scene::KickerCoilData{});
    }

    // the kick runs synchronously inside the coil's enable transition
    for (const scene::KickerCoilData& coil : m_data.coils)
    {
        m_coils.push_back(std::make_unique<wiring::DeviceCoil>(coil.id, [this, coil]() {
            Kick(coil.angle, coil.speed, coil.inclination);
        }));
    }

    m_ballDestroyedSubscription = m_context.balls.BallDestroyedEvent().Subscribe(
        [this](const scene::BallId& ball, const scene::DeviceId&) { HandleBallDestroyed(ball); });
}

KickerDevice::~KickerDevice()
{
    m_context.balls.BallDestroyedEvent().Unsubscribe(m_ballDestroyedSubscription);
}

void KickerDevice::Kick(float angle, float speed, float inclination)
{
    KickXYZ(angle, speed, inclination, 0.0F, 0.0F, 0.0F);
}

void KickerDevice::KickXYZ(float angle, float speed, float inclination, float x, float y, float z)
{
    if (m_ball == scene::kNoBall)
    {
        return;
    }

    physics::BallRecord* record = m_context.balls.Find(m_ball);
    if (record == nullptr || record->pendingDestroy)
    {
        std::cout << "KickerDevice: WARNING - " << Name() << " cannot kick ball " << m_ball << ", it is being destroyed\n";
        return;
    }

    const physics::KickParams params{angle, speed, inclination, glm::vec3{x, y, z}};
    const float scatter = physics::EffectiveScatterAngle(m_data.scatter, m_context.config);
    physics::KickBall(record->state, record->contact, params, scatter, m_context.rng);

    m_lastKickedBall = m_ball;
    m_ball = scene::kNoBall;
}

scene::BallId KickerDevice::CreateBall()
{
    return CreateSizedBallWithMass(kDefaultBallRadius, kDefaultBallMass);
}

scene::BallId KickerDevice::CreateSizedBall(float radius)
{
    return CreateSizedBallWithMass(radius, kDefaultBallMass);
}

scene::BallId KickerDevice::CreateSizedBallWithMass(float radius, float mass)
{
    if (m_ball != scene::kNoBall)
    {
        std::cout << "KickerDevice: WARNING - " << Name() << " already holds ball " << m_ball << "\n";
        return scene::kNoBall;
    }
    if (radius <= 0.0F || mass <= 0.0F)
    {
        std::cout << "KickerDevice: WARNING - Invalid ball size " << radius << " / mass " << mass << "\n";
        return scene::kNoBall;
    }

    const glm::vec3 position{m_data.center.x, m_data.center.y, m_data.positionZ + radius};
    const scene::BallId ball = m_context.balls.CreateBall(Id(), position, radius, mass);
    if (physics::BallRecord* record = m_context.balls.Find(ball))
    {
        CaptureState(record->state, record->contact);
    }
    return ball;
}

bool KickerDevice::DestroyBall()
{
    if (m_ball == scene::kNoBall)
    {
        return false;
    }
    return m_context.balls.DestroyBall(m_ball);
}

bool KickerDevice::Capture(scene::BallId ball)
{
    physics::BallRecord* record = m_context.balls.Find(ball);
    if (record == nullptr)
    {
        std::cout << "KickerDevice: WARNING - " << Name() << " asked to capture unknown ball " << ball << "\n";
        return false;
    }
    return CaptureState(record->state, record->contact);
}

const physics::BallState* KickerDevice::GetBallData() const
{
    if (m_ball == scene::kNoBall)
    {
        return nullptr;
    }
    const physics::BallRecord* record = m_context.balls.Find(m_ball);
    return record != nullptr ? &record->state : nullptr;
}

void KickerDevice::GenerateColliders(float margin, std::vector<physics::Collider>& outColliders) const
{
    physics::ColliderGenerator::GenerateKicker(m_data, Id(), margin, outColliders);
}

void KickerDevice::OnHit(scene::BallId ball, bool isUnHit)
{
    if (isUnHit)
    {
        if (ball == m_lastKickedBall)
        {
            m_lastKickedBall = scene::kNoBall;
        }
        // fall-through: the resident ball dropped out
        if (ball == m_ball)
        {
            m_ball = scene::kNoBall;
        }
        m_unHitEvent.Emit(HitEventArgs{ball});
        RaiseSwitch(false, ball);
        return;
    }

    m_hitEvent.Emit(HitEventArgs{ball});
    RaiseSwitch(true, ball);
}

void KickerDevice::OnContact(physics::BallState& ball, physics::ContactEvent& contact)
{
    CaptureState(ball, contact);
}

wiring::IWireDest* KickerDevice::Coil(const std::string& name, wiring::InvalidReference* outError)
{
    const auto it = std::find_if(m_coils.begin(), m_coils.end(), [&name](const std::unique_ptr<wiring::DeviceCoil>& coil) {
        return coil->Id() == name;
    });
    if (it == m_coils.end())
    {
        wiring::ReportInvalidReference("KickerDevice", "coil", name, CoilNames(), outError);
        return nullptr;
    }
    return it->get();
}

std::vector<std::string> KickerDevice::CoilNames() const
{
    std::vector<std::string> names;
    names.reserve(m_coils.size());
    for (const auto& coil : m_coils)
    {
        names.push_back(coil->Id());
    }
    return names;
}

wiring::SwitchHandler* KickerDevice::Switch(const std::string& name, wiring::InvalidReference* outError)
{
    if (name.empty() || name == kSwitchName)
    {
        return m_switch.get();
    }
    wiring::ReportInvalidReference("KickerDevice", "switch", name, SwitchNames(), outError);
    return nullptr;
}

std::vector<std::string> KickerDevice::SwitchNames() const
{
    return {kSwitchName};
}

wiring::IWireDest* KickerDevice::Wire(const std::string& name, wiring::InvalidReference* outError)
{
    return Coil(name, outError);
}

bool KickerDevice::CaptureState(physics::BallState& ball, physics::ContactEvent& contact)
{
    if (m_ball != scene::kNoBall || ball.id == m_lastKickedBall)
    {
        return false;
    }
    if (m_context.balls.IsPendingDestroy(ball.id))
    {
        return false;
    }

    physics::CaptureBall(ball, contact, m_data.center, m_data.legacyMode, m_data.fallThrough);
    m_ball = ball.id;
    OnHit(ball.id, false);
    return true;
}

void KickerDevice::RaiseSwitch(bool enabled, scene::BallId ball)
{
    m_switchEvent.Emit(SwitchEventArgs{enabled, ball});
    m_switch->OnSwitch(enabled);
}

void KickerDevice::HandleBallDestroyed(scene::BallId ball)
{
    if (ball == m_lastKickedBall)
    {
        m_lastKickedBall = scene::kNoBall;
    }
    if (ball == m_ball)
    {
        m_ball = scene::kNoBall;
        RaiseSwitch(false, ball);
    }
}
} // namespace pinsim::devices
