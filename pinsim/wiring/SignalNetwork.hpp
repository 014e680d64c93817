#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "pinsim/wiring/SwitchHandler.hpp"
#include "pinsim/wiring/WireDest.hpp"

namespace pinsim::wiring
{
/// Wire as authored: source device switch -> destination device item.
struct WireMapping
{
    std::string id;
    std::string sourceDevice;
    std::string sourceSwitch;
    std::string destDevice;
    std::string destItem;
    bool pulse = false;
};

/// Registry of the logical ports of every device, by device name, and the wires
/// connected between them. Does not own the devices.
class SignalNetwork
{
public:
    struct Endpoint
    {
        ICoilDevice* coils = nullptr;
        ISwitchDevice* switches = nullptr;
        IWireDeviceDest* wireDest = nullptr;
    };

    bool RegisterDevice(const std::string& name, const Endpoint& endpoint);
    bool UnregisterDevice(const std::string& name);

    [[nodiscard]] const Endpoint* FindDevice(const std::string& name, InvalidReference* outError = nullptr) const;
    [[nodiscard]] std::vector<std::string> DeviceNames() const;

    IWireDest* ResolveCoil(const std::string& device, const std::string& coil, InvalidReference* outError = nullptr);
    SwitchHandler* ResolveSwitch(const std::string& device, const std::string& switchName, InvalidReference* outError = nullptr);

    bool Connect(const WireMapping& wire, InvalidReference* outError = nullptr);
    bool Disconnect(const std::string& wireId);

    bool AddSwitchListener(
        const std::string& device,
        const SwitchConfig& config,
        SwitchListener listener,
        InvalidReference* outError = nullptr
    );

    [[nodiscard]] std::vector<std::string> WireIds() const;
    [[nodiscard]] const WireMapping* FindWire(const std::string& wireId) const;
    [[nodiscard]] std::size_t WireCount() const { return m_wires.size(); }

    /// Disconnect every wire and forget every device.
    void Clear();

private:
    std::map<std::string, Endpoint> m_devices;
    std::map<std::string, WireMapping> m_wires;
};
} // namespace pinsim::wiring
