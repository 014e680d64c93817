#include "pinsim/wiring/SignalNetwork.hpp"

#include <iostream>
#include <utility>

namespace pinsim::wiring
{
bool SignalNetwork::RegisterDevice(const std::string& name, const Endpoint& endpoint)
{
    if (name.empty())
    {
        std::cout << "SignalNetwork: WARNING - Device without a name cannot be wired\n";
        return false;
    }
    if (!m_devices.emplace(name, endpoint).second)
    {
        std::cout << "SignalNetwork: WARNING - Device name " << name << " already registered\n";
        return false;
    }
    return true;
}

bool SignalNetwork::UnregisterDevice(const std::string& name)
{
    if (m_devices.find(name) == m_devices.end())
    {
        return false;
    }

    std::vector<std::string> attached;
    for (const auto& [id, wire] : m_wires)
    {
        if (wire.sourceDevice == name || wire.destDevice == name)
        {
            attached.push_back(id);
        }
    }
    for (const std::string& id : attached)
    {
        Disconnect(id);
    }

    m_devices.erase(name);
    return true;
}

const SignalNetwork::Endpoint* SignalNetwork::FindDevice(const std::string& name, InvalidReference* outError) const
{
    const auto it = m_devices.find(name);
    if (it == m_devices.end())
    {
        ReportInvalidReference("SignalNetwork", "device", name, DeviceNames(), outError);
        return nullptr;
    }
    return &it->second;
}

std::vector<std::string> SignalNetwork::DeviceNames() const
{
    std::vector<std::string> names;
    names.reserve(m_devices.size());
    for (const auto& [name, _] : m_devices)
    {
        names.push_back(name);
    }
    return names;
}

IWireDest* SignalNetwork::ResolveCoil(const std::string& device, const std::string& coil, InvalidReference* outError)
{
    const Endpoint* endpoint = FindDevice(device, outError);
    if (endpoint == nullptr)
    {
        return nullptr;
    }
    if (endpoint->coils == nullptr)
    {
        ReportInvalidReference("SignalNetwork", "coil", device + "/" + coil, {}, outError);
        return nullptr;
    }
    return endpoint->coils->Coil(coil, outError);
}

SwitchHandler* SignalNetwork::ResolveSwitch(const std::string& device, const std::string& switchName, InvalidReference* outError)
{
    const Endpoint* endpoint = FindDevice(device, outError);
    if (endpoint == nullptr)
    {
        return nullptr;
    }
    if (endpoint->switches == nullptr)
    {
        ReportInvalidReference("SignalNetwork", "switch", device + "/" + switchName, {}, outError);
        return nullptr;
    }
    return endpoint->switches->Switch(switchName, outError);
}

bool SignalNetwork::Connect(const WireMapping& wire, InvalidReference* outError)
{
    if (m_wires.find(wire.id) != m_wires.end())
    {
        std::cout << "SignalNetwork: WARNING - Wire " << wire.id << " already connected\n";
        return false;
    }

    SwitchHandler* source = ResolveSwitch(wire.sourceDevice, wire.sourceSwitch, outError);
    if (source == nullptr)
    {
        return false;
    }

    const Endpoint* dest = FindDevice(wire.destDevice, outError);
    if (dest == nullptr)
    {
        return false;
    }
    if (dest->wireDest == nullptr)
    {
        ReportInvalidReference("SignalNetwork", "wire destination", wire.destDevice + "/" + wire.destItem, {}, outError);
        return false;
    }

    if (!source->AddWireDest(WireDestConfig{wire.id, dest->wireDest, wire.destItem, wire.pulse}, outError))
    {
        return false;
    }

    m_wires.emplace(wire.id, wire);
    return true;
}

bool SignalNetwork::Disconnect(const std::string& wireId)
{
    const auto it = m_wires.find(wireId);
    if (it == m_wires.end())
    {
        return false;
    }

    SwitchHandler* source = ResolveSwitch(it->second.sourceDevice, it->second.sourceSwitch);
    if (source != nullptr)
    {
        source->RemoveWireDest(wireId);
    }
    m_wires.erase(it);
    return true;
}

bool SignalNetwork::AddSwitchListener(
    const std::string& device,
    const SwitchConfig& config,
    SwitchListener listener,
    InvalidReference* outError)
{
    SwitchHandler* handler = ResolveSwitch(device, config.switchId, outError);
    if (handler == nullptr)
    {
        return false;
    }
    handler->AddSwitchDest(config, std::move(listener));
    return true;
}

std::vector<std::string> SignalNetwork::WireIds() const
{
    std::vector<std::string> ids;
    ids.reserve(m_wires.size());
    for (const auto& [id, _] : m_wires)
    {
        ids.push_back(id);
    }
    return ids;
}

const WireMapping* SignalNetwork::FindWire(const std::string& wireId) const
{
    const auto it = m_wires.find(wireId);
    return it != m_wires.end() ? &it->second : nullptr;
}

void SignalNetwork::Clear()
{
    std::vector<std::string> ids = WireIds();
    for (const std::string& id : ids)
    {
        Disconnect(id);
    }
    m_devices.clear();
}
} // namespace pinsim::wiring
