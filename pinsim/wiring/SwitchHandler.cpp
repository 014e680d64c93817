#include "pinsim/wiring/SwitchHandler.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace pinsim::wiring
{
SwitchHandler::SwitchHandler(std::string name, std::optional<bool> pulseOverride)
    : m_name(std::move(name))
    , m_pulseOverride(pulseOverride)
{
}

void SwitchHandler::AddSwitchDest(const SwitchConfig& config, SwitchListener listener)
{
    if (!listener)
    {
        std::cout << "SwitchHandler: WARNING - Empty listener for switch " << config.switchId << " ignored\n";
        return;
    }
    m_switchDests.push_back(SwitchDest{config.switchId, ResolvePulse(config.isPulse), std::move(listener)});
}

bool SwitchHandler::AddWireDest(const WireDestConfig& config, InvalidReference* outError)
{
    if (config.device == nullptr)
    {
        std::cout << "SwitchHandler: ERROR - Wire " << config.wireId << " has no destination device\n";
        return false;
    }

    const bool duplicate = std::any_of(m_wireDests.begin(), m_wireDests.end(), [&config](const WireDest& dest) {
        return dest.wireId == config.wireId;
    });
    if (duplicate)
    {
        std::cout << "SwitchHandler: WARNING - Wire " << config.wireId << " already connected to " << m_name << "\n";
        return false;
    }

    IWireDest* target = config.device->Wire(config.deviceItem, outError);
    if (target == nullptr)
    {
        return false;
    }

    m_wireDests.push_back(WireDest{config.wireId, ResolvePulse(config.isPulse), target});
    return true;
}

bool SwitchHandler::RemoveWireDest(const std::string& wireId)
{
    const auto it = std::find_if(m_wireDests.begin(), m_wireDests.end(), [&wireId](const WireDest& dest) {
        return dest.wireId == wireId;
    });
    if (it == m_wireDests.end())
    {
        return false;
    }
    m_wireDests.erase(it);
    return true;
}

void SwitchHandler::OnSwitch(bool enabled)
{
    const bool previous = m_enabled;
    m_enabled = enabled;

    // destinations may be added or removed by the actions they trigger
    const std::vector<SwitchDest> switchDests = m_switchDests;
    for (const SwitchDest& dest : switchDests)
    {
        dest.listener(dest.switchId, enabled);
        // a pulsed destination never keeps the new value
        if (dest.isPulse && previous != enabled)
        {
            dest.listener(dest.switchId, previous);
        }
    }

    const std::vector<WireDest> wireDests = m_wireDests;
    for (const WireDest& dest : wireDests)
    {
        const bool targetWasEnabled = dest.target->IsEnabled();
        dest.target->OnChange(enabled);
        if (dest.isPulse && targetWasEnabled != enabled)
        {
            dest.target->OnChange(targetWasEnabled);
        }
    }
}

std::vector<std::string> SwitchHandler::WireDestIds() const
{
    std::vector<std::string> ids;
    ids.reserve(m_wireDests.size());
    for (const WireDest& dest : m_wireDests)
    {
        ids.push_back(dest.wireId);
    }
    return ids;
}
} // namespace pinsim::wiring
