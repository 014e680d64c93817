#pragma once

#include <cstddef>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "pinsim/config/TableLoader.hpp"
#include "pinsim/core/SimulationConfig.hpp"
#include "pinsim/core/StepClock.hpp"
#include "pinsim/devices/Device.hpp"
#include "pinsim/devices/KickerDevice.hpp"
#include "pinsim/devices/PlungerDevice.hpp"
#include "pinsim/devices/RampDevice.hpp"
#include "pinsim/devices/RubberDevice.hpp"
#include "pinsim/physics/BallManager.hpp"
#include "pinsim/physics/ColliderWorld.hpp"
#include "pinsim/wiring/SignalNetwork.hpp"

namespace pinsim::sim
{
/// Owns the playfield devices and the services they share, and runs the fixed step.
///
/// The ball integrator is external: it advances balls between steps, queries
/// Colliders() and reports contacts and hits back through ReportContact() and
/// ReportHit().
class Simulation
{
public:
    explicit Simulation(const core::SimulationConfig& config = {});
    ~Simulation();

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    devices::KickerDevice* AddKicker(const scene::KickerData& data);
    devices::PlungerDevice* AddPlunger(const scene::PlungerData& data);
    devices::RampDevice* AddRamp(const scene::RampData& data);
    devices::RubberDevice* AddRubber(const scene::RubberData& data);

    /// Replace everything with the devices and wires of a table.
    bool Build(const config::TableDefinition& table, std::string* outError = nullptr);

    /// Generate colliders and fire the Init events.
    void Start();
    void Stop();

    /// One fixed step: drain ball destruction, move plungers, advance the clock.
    void Step();
    /// Run as many fixed steps as fit into the elapsed time. Returns the step count.
    int Advance(double elapsedSeconds);

    bool ReportContact(scene::DeviceId device, scene::BallId ball);
    bool ReportHit(scene::DeviceId device, scene::BallId ball, bool isUnHit);

    bool RebuildColliders(scene::DeviceId device);
    void RebuildAllColliders();

    [[nodiscard]] devices::Device* FindDevice(scene::DeviceId id);
    [[nodiscard]] devices::Device* FindDevice(const std::string& name, wiring::InvalidReference* outError = nullptr);

    template <typename T>
    [[nodiscard]] T* Find(const std::string& name)
    {
        return dynamic_cast<T*>(FindDevice(name));
    }

    [[nodiscard]] bool IsStarted() const { return m_started; }
    [[nodiscard]] std::size_t DeviceCount() const { return m_devices.size(); }
    [[nodiscard]] const core::SimulationConfig& Config() const { return m_config; }
    [[nodiscard]] physics::BallManager& Balls() { return m_balls; }
    [[nodiscard]] const physics::ColliderWorld& Colliders() const { return m_colliders; }
    [[nodiscard]] wiring::SignalNetwork& Signals() { return m_signals; }
    [[nodiscard]] const core::StepClock& Clock() const { return m_clock; }

private:
    template <typename T, typename Data>
    T* AddDevice(const Data& data);

    void Clear();
    void Reseed();

    core::SimulationConfig m_config;
    std::mt19937 m_rng;
    physics::BallManager m_balls;
    physics::ColliderWorld m_colliders;
    wiring::SignalNetwork m_signals;
    core::StepClock m_clock;
    devices::DeviceContext m_context;

    // devices go first on destruction, they hold references to the members above
    std::vector<std::unique_ptr<devices::Device>> m_devices;
    std::vector<devices::PlungerDevice*> m_plungers;
    scene::DeviceId m_nextDeviceId = 1;
    bool m_started = false;
};
} // namespace pinsim::sim
