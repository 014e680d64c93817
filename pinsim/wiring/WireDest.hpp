#pragma once

#include <string>
#include <vector>

#include "pinsim/wiring/InvalidReference.hpp"

namespace pinsim::wiring
{
class SwitchHandler;

/// Anything a wire can drive: a coil, or another device's input.
class IWireDest
{
public:
    virtual ~IWireDest() = default;

    virtual void OnChange(bool enabled) = 0;
    [[nodiscard]] virtual bool IsEnabled() const = 0;
};

class ICoilDevice
{
public:
    virtual ~ICoilDevice() = default;

    virtual IWireDest* Coil(const std::string& name, InvalidReference* outError = nullptr) = 0;
    [[nodiscard]] virtual std::vector<std::string> CoilNames() const = 0;
};

class ISwitchDevice
{
public:
    virtual ~ISwitchDevice() = default;

    virtual SwitchHandler* Switch(const std::string& name, InvalidReference* outError = nullptr) = 0;
    [[nodiscard]] virtual std::vector<std::string> SwitchNames() const = 0;
};

class IWireDeviceDest
{
public:
    virtual ~IWireDeviceDest() = default;

    virtual IWireDest* Wire(const std::string& name, InvalidReference* outError = nullptr) = 0;
};
} // namespace pinsim::wiring
