#pragma once

#include <functional>
#include <string>

#include "pinsim/wiring/WireDest.hpp"

namespace pinsim::wiring
{
/// Named boolean actuator. The bound action runs once per false -> true or
/// true -> false transition; repeated values are ignored.
class DeviceCoil final : public IWireDest
{
public:
    using Action = std::function<void()>;

    explicit DeviceCoil(std::string id, Action onEnable = {}, Action onDisable = {});

    void OnCoil(bool enabled);

    void OnChange(bool enabled) override { OnCoil(enabled); }
    [[nodiscard]] bool IsEnabled() const override { return m_enabled; }

    [[nodiscard]] const std::string& Id() const { return m_id; }

private:
    std::string m_id;
    bool m_enabled = false;
    Action m_onEnable;
    Action m_onDisable;
};
} // namespace pinsim::wiring
