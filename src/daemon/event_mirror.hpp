#pragma once

#include <deque>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "daemon/killfeed_store.hpp"

namespace killfeed {

// In-memory view of the newest events, kept in sync purely from store
// notifications. Newest first.
class EventMirror {
public:
    EventMirror(KillfeedStore &store, int capacity = 100);
    ~EventMirror();

    EventMirror(const EventMirror &) = delete;
    EventMirror &operator=(const EventMirror &) = delete;

    void apply(const StoreNotification &notification);

    std::vector<KillEvent> events() const;
    std::optional<KillEvent> find(const std::string &id) const;
    int size() const;
    int capacity() const;

    // Events that never reached the database.
    int unpersistedCount() const;

private:
    struct Entry {
        KillEvent event;
        EventSource source = EventSource::Local;
        bool persisted = true;
    };

    KillfeedStore &m_store;
    int m_subscription = 0;
    int m_capacity = 100;
    std::deque<Entry> m_entries;
};

} // namespace killfeed
