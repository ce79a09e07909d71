#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace killfeed {

enum class StoreChange {
    Added,
    Updated,
    Cleared
};

// Delivered to subscribers after every write. `event` is empty for Cleared.
// `persisted` is false when the write failed twice and the event only lives
// in memory (source is then Legacy).
struct StoreNotification {
    StoreChange change = StoreChange::Added;
    std::optional<KillEvent> event;
    EventSource source = EventSource::Local;
    bool persisted = true;
};

using StoreSubscriber = std::function<void(const StoreNotification &)>;
using PlayerProvider = std::function<std::string()>;

struct AddEventResult {
    bool isNew = true;
    KillEvent event;
};

struct EventQuery {
    int limit = 50;
    int offset = 0;
    bool playerOnly = false;
    std::string searchQuery;
};

struct EventPage {
    std::vector<KillEvent> events;
    int total = 0;
    bool hasMore = false;
};

struct StoreStats {
    int totalEvents = 0;
    int playerEvents = 0;
    std::map<std::string, int> bySource;
    std::optional<std::chrono::system_clock::time_point> oldest;
    std::optional<std::chrono::system_clock::time_point> newest;
};

// Content fingerprint used to collapse the same kill reported twice.
std::string eventFingerprint(const KillEvent &event);

// Text indexed by events_fts.
std::string buildSearchText(const KillEvent &event);

// `"t1"* OR "t2"*`, or empty when the query has no usable terms.
std::string buildFtsMatchExpression(const std::string &query);

int completenessScore(const KillEvent &event);

// KillfeedStore is the SQLite access layer for kill events and meta values.
// Writes never throw; storage failures degrade to notification-only events.
class KillfeedStore {
public:
    // Empty path means defaultDatabasePath(); ":memory:" is accepted.
    explicit KillfeedStore(const std::string &dbPath = std::string(),
                           int maxStoredEvents = 1000,
                           int fingerprintWindowMs = 10000);
    ~KillfeedStore();

    KillfeedStore(const KillfeedStore &) = delete;
    KillfeedStore &operator=(const KillfeedStore &) = delete;

    AddEventResult addEvent(const KillEvent &event, EventSource source = EventSource::Local);

    EventPage query(const EventQuery &query) const;
    std::optional<KillEvent> getEventById(const std::string &id) const;
    std::optional<EventSource> getEventSource(const std::string &id) const;
    void clearAllEvents();
    StoreStats stats() const;

    int subscribe(StoreSubscriber subscriber);
    void unsubscribe(int id);

    // Current player, used to recompute isPlayerInvolved on every add.
    // Without a provider, or with an empty name, no event involves the player.
    void setPlayerProvider(PlayerProvider provider);

    std::optional<std::string> getMeta(const std::string &key) const;
    void setMeta(const std::string &key, const std::string &value);

    const std::string &databasePath() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;

    void notify(const StoreNotification &notification);
};

} // namespace killfeed
