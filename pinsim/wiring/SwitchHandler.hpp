#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "pinsim/wiring/WireDest.hpp"

namespace pinsim::wiring
{
using SwitchListener = std::function<void(const std::string& switchId, bool enabled)>;

/// Game-logic listener registration.
struct SwitchConfig
{
    std::string switchId;
    bool isPulse = false;
};

/// Wire from this switch to an item (usually a coil) of another device.
struct WireDestConfig
{
    std::string wireId;
    IWireDeviceDest* device = nullptr;
    std::string deviceItem;
    bool isPulse = false;
};

/// Logical state of one device switch and everything it drives.
/// OnSwitch() propagates synchronously: switch destinations first, then wire
/// destinations, each in registration order.
class SwitchHandler
{
public:
    /// pulseOverride, when set, replaces the pulse flag of every destination.
    explicit SwitchHandler(std::string name, std::optional<bool> pulseOverride = std::nullopt);

    void AddSwitchDest(const SwitchConfig& config, SwitchListener listener);

    /// Resolve config.deviceItem on config.device and register it. Fails on an unknown
    /// item and on a wire id that is already registered.
    bool AddWireDest(const WireDestConfig& config, InvalidReference* outError = nullptr);
    bool RemoveWireDest(const std::string& wireId);

    void OnSwitch(bool enabled);

    [[nodiscard]] bool IsEnabled() const { return m_enabled; }
    [[nodiscard]] const std::string& Name() const { return m_name; }
    [[nodiscard]] std::vector<std::string> WireDestIds() const;
    [[nodiscard]] std::size_t SwitchDestCount() const { return m_switchDests.size(); }
    [[nodiscard]] std::size_t WireDestCount() const { return m_wireDests.size(); }

private:
    struct SwitchDest
    {
        std::string switchId;
        bool isPulse = false;
        SwitchListener listener;
    };

    struct WireDest
    {
        std::string wireId;
        bool isPulse = false;
        IWireDest* target = nullptr;
    };

    bool ResolvePulse(bool isPulse) const { return m_pulseOverride.value_or(isPulse); }

    std::string m_name;
    std::optional<bool> m_pulseOverride;
    bool m_enabled = false;
    std::vector<SwitchDest> m_switchDests;
    std::vector<WireDest> m_wireDests;
};
} // namespace pinsim::wiring
