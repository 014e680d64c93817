#include "pinsim/wiring/DeviceCoil.hpp"

#include <utility>

namespace pinsim::wiring
{
DeviceCoil::DeviceCoil(std::string id, Action onEnable, Action onDisable)
    : m_id(std::move(id))
    , m_onEnable(std::move(onEnable))
    , m_onDisable(std::move(onDisable))
{
}

void DeviceCoil::OnCoil(bool enabled)
{
    if (enabled == m_enabled)
    {
        return;
    }

    // state is updated first so the action sees the new value and a re-entrant
    // OnCoil with the same value is a no-op
    m_enabled = enabled;
    const Action& action = enabled ? m_onEnable : m_onDisable;
    if (action)
    {
        action();
    }
}
} // namespace pinsim::wiring
