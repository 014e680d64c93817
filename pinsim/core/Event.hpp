#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace pinsim::core
{
using SubscriptionId = std::uint32_t;

/// Ordered observer list for one event kind.
/// Handlers run synchronously in registration order. Emit() iterates over a snapshot,
/// so handlers may subscribe or unsubscribe while an event is being dispatched.
template <typename... Args>
class EventSource
{
public:
    using Handler = std::function<void(const Args&...)>;

    SubscriptionId Subscribe(Handler handler)
    {
        const SubscriptionId id = m_nextId++;
        m_handlers.push_back(Entry{id, std::move(handler)});
        return id;
    }

    bool Unsubscribe(SubscriptionId id)
    {
        const auto it = std::find_if(m_handlers.begin(), m_handlers.end(), [id](const Entry& entry) {
            return entry.id == id;
        });
        if (it == m_handlers.end())
        {
            return false;
        }
        m_handlers.erase(it);
        return true;
    }

    void Emit(const Args&... args) const
    {
        const std::vector<Entry> snapshot = m_handlers;
        for (const Entry& entry : snapshot)
        {
            if (entry.handler)
            {
                entry.handler(args...);
            }
        }
    }

    void Clear() { m_handlers.clear(); }

    [[nodiscard]] std::size_t HandlerCount() const { return m_handlers.size(); }

private:
    struct Entry
    {
        SubscriptionId id = 0;
        Handler handler;
    };

    std::vector<Entry> m_handlers;
    SubscriptionId m_nextId = 1;
};
} // namespace pinsim::core
