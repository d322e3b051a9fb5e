#pragma once

#include <cstddef>
#include <functional>
#include <queue>
#include <string>
#include <unordered_map>
#include <vector>

namespace engine::core
{
struct Event
{
    std::string name;
    std::vector<std::string> args;
};

class EventBus
{
public:
    using Handler = std::function<void(const Event&)>;
    using SubscriptionId = std::size_t;

    SubscriptionId Subscribe(const std::string& eventName, Handler handler);
    void Unsubscribe(SubscriptionId id);

    /// Queue an event; handlers run on the next DispatchQueued().
    void Publish(Event event);
    void DispatchQueued();
    void ClearQueued();

    [[nodiscard]] std::size_t PendingCount() const { return m_queue.size(); }
    [[nodiscard]] std::size_t HandlerCount(const std::string& eventName) const;

private:
    struct HandlerEntry
    {
        SubscriptionId id = 0;
        Handler handler;
    };

    std::unordered_map<std::string, std::vector<HandlerEntry>> m_handlers;
    std::queue<Event> m_queue;
    SubscriptionId m_nextId = 1;
};
} // namespace engine::core
