#include "daemon/event_mirror.hpp"

#include <algorithm>

namespace killfeed {

EventMirror::EventMirror(KillfeedStore &store, int capacity)
    : m_store(store)
    , m_capacity(std::max(1, capacity))
{
    m_subscription = m_store.subscribe([this](const StoreNotification &notification) {
        apply(notification);
    });
}

EventMirror::~EventMirror()
{
    m_store.unsubscribe(m_subscription);
}

void EventMirror::apply(const StoreNotification &notification)
{
    if (notification.change == StoreChange::Cleared) {
        m_entries.clear();
        return;
    }
    if (!notification.event) {
        return;
    }

    const KillEvent &event = *notification.event;
    auto existing = std::find_if(m_entries.begin(), m_entries.end(),
                                 [&event](const Entry &entry) { return entry.event.id == event.id; });
    if (existing != m_entries.end()) {
        existing->event = event;
        existing->source = notification.source;
        existing->persisted = notification.persisted;
    } else {
        Entry entry{event, notification.source, notification.persisted};
        auto position = std::find_if(m_entries.begin(), m_entries.end(),
                                     [&event](const Entry &current) {
                                         return current.event.timestamp <= event.timestamp;
                                     });
        m_entries.insert(position, std::move(entry));
    }

    while (static_cast<int>(m_entries.size()) > m_capacity) {
        m_entries.pop_back();
    }
}

std::vector<KillEvent> EventMirror::events() const
{
    std::vector<KillEvent> result;
    result.reserve(m_entries.size());
    for (const auto &entry : m_entries) {
        result.push_back(entry.event);
    }
    return result;
}

std::optional<KillEvent> EventMirror::find(const std::string &id) const
{
    for (const auto &entry : m_entries) {
        if (entry.event.id == id) {
            return entry.event;
        }
    }
    return std::nullopt;
}

int EventMirror::size() const
{
    return static_cast<int>(m_entries.size());
}

int EventMirror::capacity() const
{
    return m_capacity;
}

int EventMirror::unpersistedCount() const
{
    return static_cast<int>(std::count_if(m_entries.begin(), m_entries.end(),
                                          [](const Entry &entry) { return !entry.persisted; }));
}

} // namespace killfeed
