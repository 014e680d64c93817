#include "pinsim/sim/Simulation.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace pinsim::sim
{
Simulation::Simulation(const core::SimulationConfig& config)
    : m_config(config)
    , m_colliders(config.colliderCellSize)
    , m_clock(config.fixedStepSeconds)
    , m_context{m_balls, m_config, m_rng}
{
    Reseed();
}

Simulation::~Simulation()
{
    Stop();
    Clear();
}

void Simulation::Reseed()
{
    if (m_config.seed.has_value())
    {
        m_rng.seed(*m_config.seed);
    }
    else
    {
        std::random_device device;
        m_rng.seed(device());
    }
}

template <typename T, typename Data>
T* Simulation::AddDevice(const Data& data)
{
    auto device = std::make_unique<T>(m_nextDeviceId++, data, m_context);
    T* raw = device.get();

    wiring::SignalNetwork::Endpoint endpoint;
    endpoint.coils = raw->AsCoilDevice();
    endpoint.switches = raw->AsSwitchDevice();
    endpoint.wireDest = raw->AsWireDeviceDest();
    if (!data.name.empty())
    {
        m_signals.RegisterDevice(data.name, endpoint);
    }

    m_devices.push_back(std::move(device));

    if (m_started)
    {
        RebuildColliders(raw->Id());
        raw->OnInit();
    }
    return raw;
}

devices::KickerDevice* Simulation::AddKicker(const scene::KickerData& data)
{
    return AddDevice<devices::KickerDevice>(data);
}

devices::PlungerDevice* Simulation::AddPlunger(const scene::PlungerData& data)
{
    devices::PlungerDevice* plunger = AddDevice<devices::PlungerDevice>(data);
    m_plungers.push_back(plunger);
    return plunger;
}

devices::RampDevice* Simulation::AddRamp(const scene::RampData& data)
{
    return AddDevice<devices::RampDevice>(data);
}

devices::RubberDevice* Simulation::AddRubber(const scene::RubberData& data)
{
    return AddDevice<devices::RubberDevice>(data);
}

bool Simulation::Build(const config::TableDefinition& table, std::string* outError)
{
    Stop();
    Clear();

    m_config = table.simulation;
    m_clock.SetFixedStepSeconds(m_config.fixedStepSeconds);
    m_clock.Reset();
    m_colliders = physics::ColliderWorld(m_config.colliderCellSize);
    Reseed();

    for (const scene::KickerData& data : table.kickers)
    {
        AddKicker(data);
    }
    for (const scene::PlungerData& data : table.plungers)
    {
        AddPlunger(data);
    }
    for (const scene::RampData& data : table.ramps)
    {
        AddRamp(data);
    }
    for (const scene::RubberData& data : table.rubbers)
    {
        AddRubber(data);
    }

    for (const wiring::WireMapping& wire : table.wires)
    {
        wiring::InvalidReference error;
        if (!m_signals.Connect(wire, &error))
        {
            if (outError != nullptr)
            {
                *outError = "Wire " + wire.id + ": " + (error.requested.empty() ? "could not be connected" : error.Message());
            }
            // no partially wired table is left behind
            Clear();
            return false;
        }
    }

    std::cout << "Simulation: Built table with " << m_devices.size() << " devices and " << m_signals.WireCount() << " wires\n";
    return true;
}

void Simulation::Start()
{
    if (m_started)
    {
        return;
    }

    RebuildAllColliders();
    m_started = true;
    for (const auto& device : m_devices)
    {
        device->OnInit();
    }
}

void Simulation::Stop()
{
    if (!m_started)
    {
        return;
    }

    for (const auto& device : m_devices)
    {
        device->OnDestroy();
    }
    m_started = false;
}

void Simulation::Clear()
{
    // wires point into the devices, disconnect them before the devices go away
    m_signals.Clear();
    m_colliders.Clear();
    m_plungers.clear();
    m_devices.clear();
    m_balls.Clear();
    m_nextDeviceId = 1;
}

void Simulation::Step()
{
    m_balls.DrainPendingDestruction();

    const auto deltaSeconds = static_cast<float>(m_clock.FixedStepSeconds());
    for (devices::PlungerDevice* plunger : m_plungers)
    {
        plunger->Update(deltaSeconds);
    }

    m_clock.ConsumeStep();
}

int Simulation::Advance(double elapsedSeconds)
{
    m_clock.Accumulate(elapsedSeconds);

    int steps = 0;
    while (m_clock.ShouldRunStep())
    {
        Step();
        ++steps;
    }
    return steps;
}

bool Simulation::ReportContact(scene::DeviceId device, scene::BallId ball)
{
    devices::Device* target = FindDevice(device);
    if (target == nullptr || target->AsContactResponder() == nullptr)
    {
        return false;
    }

    physics::BallRecord* record = m_balls.Find(ball);
    if (record == nullptr || record->pendingDestroy)
    {
        return false;
    }

    target->AsContactResponder()->OnContact(record->state, record->contact);
    return true;
}

bool Simulation::ReportHit(scene::DeviceId device, scene::BallId ball, bool isUnHit)
{
    devices::Device* target = FindDevice(device);
    if (target == nullptr || target->AsHittable() == nullptr)
    {
        return false;
    }

    target->AsHittable()->OnHit(ball, isUnHit);
    return true;
}

bool Simulation::RebuildColliders(scene::DeviceId device)
{
    devices::Device* target = FindDevice(device);
    if (target == nullptr || target->AsColliderGenerator() == nullptr)
    {
        return false;
    }

    std::vector<physics::Collider> colliders;
    target->AsColliderGenerator()->GenerateColliders(m_config.colliderMargin, colliders);
    m_colliders.SetDeviceColliders(device, std::move(colliders));
    return true;
}

void Simulation::RebuildAllColliders()
{
    for (const auto& device : m_devices)
    {
        RebuildColliders(device->Id());
    }
}

devices::Device* Simulation::FindDevice(scene::DeviceId id)
{
    const auto it = std::find_if(m_devices.begin(), m_devices.end(), [id](const std::unique_ptr<devices::Device>& device) {
        return device->Id() == id;
    });
    return it != m_devices.end() ? it->get() : nullptr;
}

devices::Device* Simulation::FindDevice(const std::string& name, wiring::InvalidReference* outError)
{
    const auto it = std::find_if(m_devices.begin(), m_devices.end(), [&name](const std::unique_ptr<devices::Device>& device) {
        return device->Name() == name;
    });
    if (it == m_devices.end())
    {
        std::vector<std::string> names;
        for (const auto& device : m_devices)
        {
            names.push_back(device->Name());
        }
        wiring::ReportInvalidReference("Simulation", "device", name, std::move(names), outError);
        return nullptr;
    }
    return it->get();
}
} // namespace pinsim::sim
