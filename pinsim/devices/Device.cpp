#include "pinsim/devices/Device.hpp"

#include <utility>

namespace pinsim::devices
{
Device::Device(scene::DeviceId id, std::string name, scene::DeviceKind kind, DeviceContext context)
    : m_context(context)
    , m_id(id)
    , m_name(std::move(name))
    , m_kind(kind)
{
}

void Device::OnInit()
{
    m_initEvent.Emit(m_id);
}

const char* DeviceKindName(scene::DeviceKind kind)
{
    switch (kind)
    {
        case scene::DeviceKind::Kicker: return "Kicker";
        case scene::DeviceKind::Plunger: return "Plunger";
        case scene::DeviceKind::Ramp: return "Ramp";
        case scene::DeviceKind::Rubber: return "Rubber";
    }
    return "Unknown";
}
} // namespace pinsim::devices
