#include "engine/core/EventBus.hpp"

#include <algorithm>
#include <utility>

namespace engine::core
{
EventBus::SubscriptionId EventBus::Subscribe(const std::string& eventName, Handler handler)
{
    if (!handler)
    {
        return 0;
    }

    const SubscriptionId id = m_nextId++;
    m_handlers[eventName].push_back(HandlerEntry{id, std::move(handler)});
    return id;
}

void EventBus::Unsubscribe(SubscriptionId id)
{
    if (id == 0)
    {
        return;
    }

    for (auto it = m_handlers.begin(); it != m_handlers.end();)
    {
        auto& entries = it->second;
        entries.erase(
            std::remove_if(entries.begin(), entries.end(), [id](const HandlerEntry& entry) { return entry.id == id; }),
            entries.end()
        );
        if (entries.empty())
        {
            it = m_handlers.erase(it);
        }
        else
        {
            ++it;
        }
    }
}

void EventBus::Publish(Event event)
{
    m_queue.push(std::move(event));
}

void EventBus::DispatchQueued()
{
    while (!m_queue.empty())
    {
        Event event = std::move(m_queue.front());
        m_queue.pop();

        const auto it = m_handlers.find(event.name);
        if (it == m_handlers.end())
        {
            continue;
        }

        // Handlers may subscribe or unsubscribe while we iterate.
        const std::vector<HandlerEntry> entries = it->second;
        for (const HandlerEntry& entry : entries)
        {
            entry.handler(event);
        }
    }
}

void EventBus::ClearQueued()
{
    std::queue<Event> empty;
    m_queue.swap(empty);
}

std::size_t EventBus::HandlerCount(const std::string& eventName) const
{
    const auto it = m_handlers.find(eventName);
    return it == m_handlers.end() ? 0 : it->second.size();
}
} // namespace engine::core
