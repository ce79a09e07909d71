#include "daemon/killfeed_store.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <sstream>
#include <stdexcept>

#include <sqlite3.h>

#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace killfeed {

namespace {

constexpr int kSchemaVersion = 2;

constexpr const char *kCreateEventsTable =
    "CREATE TABLE IF NOT EXISTS events ("
    "    id TEXT PRIMARY KEY,"
    "    timestamp INTEGER NOT NULL,"
    "    event_data TEXT NOT NULL,"
    "    is_player_involved INTEGER NOT NULL DEFAULT 0,"
    "    source TEXT NOT NULL DEFAULT 'local',"
    "    created_at INTEGER NOT NULL,"
    "    fingerprint TEXT NOT NULL,"
    "    search_text TEXT"
    ");";

constexpr const char *kCreateEventIndexes =
    "CREATE INDEX IF NOT EXISTS idx_events_timestamp ON events(timestamp);"
    "CREATE INDEX IF NOT EXISTS idx_events_player ON events(is_player_involved, timestamp);"
    "CREATE INDEX IF NOT EXISTS idx_events_source ON events(source, timestamp);"
    "CREATE INDEX IF NOT EXISTS idx_events_fingerprint ON events(fingerprint);"
    "CREATE INDEX IF NOT EXISTS idx_events_created ON events(created_at);";

constexpr const char *kCreateFtsTable =
    "CREATE VIRTUAL TABLE IF NOT EXISTS events_fts USING fts5(id UNINDEXED, content);";

// Plain INSERT/UPDATE only: REPLACE deletes without firing the delete trigger.
constexpr const char *kCreateFtsTriggers =
    "CREATE TRIGGER IF NOT EXISTS events_fts_insert AFTER INSERT ON events BEGIN"
    "    INSERT INTO events_fts(rowid, id, content)"
    "    VALUES (new.rowid, new.id, COALESCE(new.search_text, ''));"
    "END;"
    "CREATE TRIGGER IF NOT EXISTS events_fts_delete AFTER DELETE ON events BEGIN"
    "    DELETE FROM events_fts WHERE rowid = old.rowid;"
    "END;"
    "CREATE TRIGGER IF NOT EXISTS events_fts_update AFTER UPDATE ON events BEGIN"
    "    UPDATE events_fts SET id = new.id, content = COALESCE(new.search_text, '')"
    "    WHERE rowid = old.rowid;"
    "END;";

constexpr const char *kCreateVersionTable =
    "CREATE TABLE IF NOT EXISTS db_version ("
    "    version INTEGER NOT NULL"
    ");";

constexpr const char *kCreateMetaTable =
    "CREATE TABLE IF NOT EXISTS meta ("
    "    key TEXT PRIMARY KEY,"
    "    value TEXT NOT NULL"
    ");";

class Statement {
public:
    Statement(sqlite3 *db, const char *sql)
    {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db));
        }
    }

    ~Statement()
    {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    sqlite3_stmt *get() const
    {
        return stmt;
    }

private:
    sqlite3_stmt *stmt = nullptr;
};

void execOrThrow(sqlite3 *db, const char *sql)
{
    char *error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw std::runtime_error(message);
    }
}

bool columnExists(sqlite3 *db, const std::string &table, const std::string &column)
{
    const std::string sql = "PRAGMA table_info(" + table + ");";
    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }

    bool found = false;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const char *name = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 1));
        if (name && column == name) {
            found = true;
            break;
        }
    }
    sqlite3_finalize(stmt);
    return found;
}

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void bindJson(sqlite3_stmt *stmt, int index, const nlohmann::json &value)
{
    const std::string dumped = value.dump();
    sqlite3_bind_text(stmt, index, dumped.c_str(), -1, SQLITE_TRANSIENT);
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return {};
    }
    return reinterpret_cast<const char *>(text);
}

// Rows whose JSON no longer parses come back with only the id filled in.
KillEvent columnEvent(sqlite3_stmt *stmt, int index, const std::string &fallbackId)
{
    KillEvent event;
    try {
        event = nlohmann::json::parse(columnText(stmt, index)).get<KillEvent>();
    } catch (const nlohmann::json::exception &) {
        event.id = fallbackId;
    }
    return event;
}

void stepOrThrow(sqlite3_stmt *stmt, const char *what)
{
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        throw std::runtime_error(what);
    }
}

void rollbackIfOpen(sqlite3 *db)
{
    if (sqlite3_get_autocommit(db) == 0) {
        char *error = nullptr;
        if (sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, &error) != SQLITE_OK) {
            KFLOG_WARN(QStringLiteral("KillfeedStore"),
                       QStringLiteral("rollbackIfOpen"),
                       QStringLiteral("rollback_failed"),
                       QString::fromUtf8(error ? error : "unknown"),
                       QStringLiteral("continue"),
                       logging::defaultWho(),
                       QString(),
                       nlohmann::json::object());
        }
        sqlite3_free(error);
    }
}

std::string joinWithBar(const std::vector<std::string> &names)
{
    std::string joined;
    for (const auto &name : names) {
        if (!joined.empty()) {
            joined += '|';
        }
        joined += name;
    }
    return joined;
}

std::vector<std::string> sortedNames(std::vector<std::string> names)
{
    std::sort(names.begin(), names.end());
    return names;
}

void appendUnique(std::vector<std::string> &target, const std::vector<std::string> &names)
{
    for (const auto &name : names) {
        if (std::find(target.begin(), target.end(), name) == target.end()) {
            target.push_back(name);
        }
    }
}

bool containsName(const std::vector<std::string> &names, const std::string &name)
{
    return std::find(names.begin(), names.end(), name) != names.end();
}

// No player means nobody is involved.
bool involvesPlayer(const KillEvent &event, const std::string &player)
{
    return !player.empty() && (containsName(event.killers, player) || containsName(event.victims, player));
}

void fillIfEmpty(std::string &target, const std::string &other)
{
    if (target.empty()) {
        target = other;
    }
}

void fillIfDash(std::string &target, const std::string &other)
{
    if (target == "-" && !other.empty()) {
        target = other;
    }
}

void keepEnrichment(KillEvent &target, const KillEvent &other)
{
    fillIfDash(target.victimEnlisted, other.victimEnlisted);
    fillIfDash(target.victimRecord, other.victimRecord);
    fillIfDash(target.victimOrg, other.victimOrg);
    fillIfDash(target.attackerEnlisted, other.attackerEnlisted);
    fillIfDash(target.attackerRecord, other.attackerRecord);
    fillIfDash(target.attackerOrg, other.attackerOrg);
}

EventSource combineSources(EventSource existing, EventSource incoming)
{
    if (existing == incoming || incoming == EventSource::Legacy) {
        return existing;
    }
    if (existing == EventSource::Legacy) {
        return incoming;
    }
    return EventSource::Merged;
}

// Server data wins over local; otherwise the more complete event, ties
// keeping what is already stored.
KillEvent mergeEvents(const KillEvent &existing,
                      EventSource existingSource,
                      const KillEvent &incoming,
                      EventSource incomingSource)
{
    bool incomingPrimary = false;
    const bool existingServer = existingSource == EventSource::Server || existingSource == EventSource::Merged;
    const bool incomingServer = incomingSource == EventSource::Server;
    if (incomingServer && !existingServer) {
        incomingPrimary = true;
    } else if (existingServer == incomingServer) {
        incomingPrimary = completenessScore(incoming) > completenessScore(existing);
    }

    const KillEvent &primary = incomingPrimary ? incoming : existing;
    const KillEvent &secondary = incomingPrimary ? existing : incoming;

    KillEvent merged = primary;
    merged.id = existing.id;
    appendUnique(merged.killers, secondary.killers);
    appendUnique(merged.victims, secondary.victims);
    fillIfEmpty(merged.vehicleType, secondary.vehicleType);
    fillIfEmpty(merged.vehicleModel, secondary.vehicleModel);
    fillIfEmpty(merged.location, secondary.location);
    fillIfEmpty(merged.locationId, secondary.locationId);
    fillIfEmpty(merged.weapon, secondary.weapon);
    if (!merged.coordinates) {
        merged.coordinates = secondary.coordinates;
    }
    keepEnrichment(merged, secondary);
    return merged;
}

} // namespace

std::string eventFingerprint(const KillEvent &event)
{
    const long long epochMinute = toEpochMillis(event.timestamp) / 60000;

    std::string vehicle = event.vehicleModel;
    if (vehicle.empty()) {
        vehicle = event.vehicleType;
    }
    if (vehicle.empty()) {
        vehicle = "unknown";
    }

    std::ostringstream out;
    out << joinWithBar(sortedNames(event.killers)) << ':'
        << joinWithBar(sortedNames(event.victims)) << ':'
        << epochMinute << ':'
        << (event.location.empty() ? std::string("unknown") : event.location) << ':'
        << vehicle << ':'
        << toDeathTypeString(event.deathType);
    return out.str();
}

std::string buildSearchText(const KillEvent &event)
{
    std::vector<std::string> parts;
    parts.push_back(event.eventDescription);
    parts.insert(parts.end(), event.killers.begin(), event.killers.end());
    parts.insert(parts.end(), event.victims.begin(), event.victims.end());
    parts.push_back(event.location);
    parts.push_back(event.weapon);
    parts.push_back(event.vehicleType);

    std::string text;
    for (const auto &part : parts) {
        if (part.empty()) {
            continue;
        }
        if (!text.empty()) {
            text += ' ';
        }
        text += part;
    }
    return text;
}

std::string buildFtsMatchExpression(const std::string &query)
{
    std::istringstream in(query);
    std::string term;
    std::string expression;
    while (in >> term) {
        term.erase(std::remove_if(term.begin(), term.end(),
                                  [](char c) { return c == ':' || c == '"' || c == '*'; }),
                   term.end());
        if (term.empty()) {
            continue;
        }
        if (!expression.empty()) {
            expression += " OR ";
        }
        expression += "\"" + term + "\"*";
    }
    return expression;
}

int completenessScore(const KillEvent &event)
{
    int score = 0;
    if (!event.id.empty()) {
        score += 1;
    }
    if (event.timestamp.time_since_epoch().count() != 0) {
        score += 1;
    }
    if (!event.killers.empty()) {
        score += 1;
    }
    if (!event.victims.empty()) {
        score += 1;
    }
    if (!event.location.empty()) {
        score += 2;
    }
    if (!event.weapon.empty()) {
        score += 2;
    }
    if (!event.vehicleModel.empty() && event.vehicleModel != "Player") {
        score += 2;
    }
    if (event.coordinates) {
        score += 2;
    }
    if (!event.victimRecord.empty() && event.victimRecord != "-") {
        score += 3;
    }
    if (!event.attackerRecord.empty() && event.attackerRecord != "-") {
        score += 3;
    }
    return score;
}

struct KillfeedStore::Impl {
    sqlite3 *db = nullptr;
    std::string path;
    int maxStoredEvents = 1000;
    int fingerprintWindowMs = 10000;
    PlayerProvider playerProvider;
    std::map<int, StoreSubscriber> subscribers;
    int nextSubscriberId = 1;

    struct StoredRow {
        KillEvent event;
        EventSource source = EventSource::Local;
    };

    struct WriteOutcome {
        bool isNew = true;
        KillEvent event;
        EventSource source = EventSource::Local;
    };

    std::optional<StoredRow> findById(const std::string &id) const
    {
        Statement stmt(db, "SELECT event_data, source FROM events WHERE id = ? LIMIT 1;");
        bindText(stmt.get(), 1, id);
        if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
            return std::nullopt;
        }
        StoredRow row;
        row.event = columnEvent(stmt.get(), 0, id);
        row.source = parseSourceString(columnText(stmt.get(), 1));
        return row;
    }

    std::optional<StoredRow> findByFingerprint(const std::string &fingerprint,
                                               long long timestampMs) const
    {
        Statement stmt(db,
                       "SELECT id, event_data, source FROM events "
                       "WHERE fingerprint = ? AND ABS(timestamp - ?) <= ? "
                       "ORDER BY ABS(timestamp - ?) ASC LIMIT 1;");
        bindText(stmt.get(), 1, fingerprint);
        sqlite3_bind_int64(stmt.get(), 2, timestampMs);
        sqlite3_bind_int64(stmt.get(), 3, fingerprintWindowMs);
        sqlite3_bind_int64(stmt.get(), 4, timestampMs);
        if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
            return std::nullopt;
        }
        StoredRow row;
        const std::string id = columnText(stmt.get(), 0);
        row.event = columnEvent(stmt.get(), 1, id);
        row.event.id = id;
        row.source = parseSourceString(columnText(stmt.get(), 2));
        return row;
    }

    void insertRow(const KillEvent &event, EventSource source)
    {
        Statement stmt(db,
                       "INSERT INTO events (id, timestamp, event_data, is_player_involved, "
                       "source, created_at, fingerprint, search_text) "
                       "VALUES (?, ?, ?, ?, ?, ?, ?, ?);");
        bindText(stmt.get(), 1, event.id);
        sqlite3_bind_int64(stmt.get(), 2, toEpochMillis(event.timestamp));
        bindJson(stmt.get(), 3, nlohmann::json(event));
        sqlite3_bind_int(stmt.get(), 4, event.isPlayerInvolved ? 1 : 0);
        bindText(stmt.get(), 5, toSourceString(source));
        sqlite3_bind_int64(stmt.get(), 6, toEpochMillis(std::chrono::system_clock::now()));
        bindText(stmt.get(), 7, eventFingerprint(event));
        bindText(stmt.get(), 8, buildSearchText(event));
        stepOrThrow(stmt.get(), "failed to insert event");
    }

    void updateRow(const KillEvent &event, EventSource source)
    {
        Statement stmt(db,
                       "UPDATE events SET timestamp = ?, event_data = ?, is_player_involved = ?, "
                       "source = ?, fingerprint = ?, search_text = ? WHERE id = ?;");
        sqlite3_bind_int64(stmt.get(), 1, toEpochMillis(event.timestamp));
        bindJson(stmt.get(), 2, nlohmann::json(event));
        sqlite3_bind_int(stmt.get(), 3, event.isPlayerInvolved ? 1 : 0);
        bindText(stmt.get(), 4, toSourceString(source));
        bindText(stmt.get(), 5, eventFingerprint(event));
        bindText(stmt.get(), 6, buildSearchText(event));
        bindText(stmt.get(), 7, event.id);
        stepOrThrow(stmt.get(), "failed to update event");
    }

    int applyRetention()
    {
        if (maxStoredEvents <= 0) {
            return 0;
        }
        Statement stmt(db,
                       "DELETE FROM events WHERE id IN ("
                       "SELECT id FROM events ORDER BY timestamp DESC, rowid DESC "
                       "LIMIT -1 OFFSET ?);");
        sqlite3_bind_int(stmt.get(), 1, maxStoredEvents);
        stepOrThrow(stmt.get(), "failed to apply retention");
        return sqlite3_changes(db);
    }

    // One transactional attempt; throws on any SQLite failure.
    WriteOutcome writeEvent(const KillEvent &event, EventSource source, const std::string &player)
    {
        execOrThrow(db, "BEGIN IMMEDIATE;");
        WriteOutcome outcome;

        if (auto existing = findById(event.id)) {
            outcome.isNew = false;
            outcome.event = event;
            keepEnrichment(outcome.event, existing->event);
            outcome.source = combineSources(existing->source, source);
            updateRow(outcome.event, outcome.source);
        } else if (auto similar = findByFingerprint(eventFingerprint(event),
                                                    toEpochMillis(event.timestamp))) {
            outcome.isNew = false;
            outcome.event = mergeEvents(similar->event, similar->source, event, source);
            outcome.event.isPlayerInvolved = involvesPlayer(outcome.event, player);
            outcome.source = combineSources(similar->source, source);
            updateRow(outcome.event, outcome.source);
            KFLOG_INFO(QStringLiteral("KillfeedStore"),
                       QStringLiteral("writeEvent"),
                       QStringLiteral("event_merged"),
                       QStringLiteral("fingerprint_match"),
                       QStringLiteral("merge_into_existing"),
                       logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"incoming", event.id},
                                       {"existing", similar->event.id},
                                       {"source", toSourceString(outcome.source)}}));
        } else {
            outcome.isNew = true;
            outcome.event = event;
            outcome.source = source;
            insertRow(outcome.event, outcome.source);
            const int evicted = applyRetention();
            if (evicted > 0) {
                KFLOG_DEBUG(QStringLiteral("KillfeedStore"),
                            QStringLiteral("writeEvent"),
                            QStringLiteral("retention_applied"),
                            QStringLiteral("max_events_exceeded"),
                            QStringLiteral("delete_oldest"),
                            logging::defaultWho(),
                            QString(),
                            (nlohmann::json{{"evicted", evicted},
                                            {"maxStoredEvents", maxStoredEvents}}));
            }
        }

        execOrThrow(db, "COMMIT;");
        return outcome;
    }
};

KillfeedStore::KillfeedStore(const std::string &dbPath,
                             int maxStoredEvents,
                             int fingerprintWindowMs)
    : impl(std::make_unique<Impl>())
{
    impl->path = dbPath.empty() ? defaultDatabasePath() : dbPath;
    impl->maxStoredEvents = maxStoredEvents;
    impl->fingerprintWindowMs = fingerprintWindowMs;

    if (impl->path != ":memory:") {
        const std::filesystem::path parent = std::filesystem::path(impl->path).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
        }
    }

    if (sqlite3_open(impl->path.c_str(), &impl->db) != SQLITE_OK) {
        const std::string message = impl->db ? sqlite3_errmsg(impl->db) : "out of memory";
        sqlite3_close(impl->db);
        impl->db = nullptr;
        throw std::runtime_error("failed to open sqlite database " + impl->path + ": " + message);
    }

    execOrThrow(impl->db, kCreateEventsTable);
    // Databases from before full-text search lack the search column.
    if (!columnExists(impl->db, "events", "search_text")) {
        execOrThrow(impl->db, "ALTER TABLE events ADD COLUMN search_text TEXT;");
    }
    execOrThrow(impl->db, kCreateEventIndexes);
    execOrThrow(impl->db, kCreateFtsTable);
    execOrThrow(impl->db, kCreateFtsTriggers);
    execOrThrow(impl->db, kCreateVersionTable);
    execOrThrow(impl->db, kCreateMetaTable);

    Statement versionStmt(impl->db, "SELECT MAX(version) FROM db_version;");
    int storedVersion = 0;
    if (sqlite3_step(versionStmt.get()) == SQLITE_ROW) {
        storedVersion = sqlite3_column_int(versionStmt.get(), 0);
    }
    if (storedVersion < kSchemaVersion) {
        execOrThrow(impl->db,
                    "DELETE FROM events_fts;"
                    "INSERT INTO events_fts(rowid, id, content) "
                    "SELECT rowid, id, COALESCE(search_text, '') FROM events;");
        Statement insertVersion(impl->db, "INSERT INTO db_version (version) VALUES (?);");
        sqlite3_bind_int(insertVersion.get(), 1, kSchemaVersion);
        stepOrThrow(insertVersion.get(), "failed to record schema version");
    }
}

KillfeedStore::~KillfeedStore()
{
    if (impl && impl->db) {
        sqlite3_close(impl->db);
        impl->db = nullptr;
    }
}

AddEventResult KillfeedStore::addEvent(const KillEvent &event, EventSource source)
{
    const std::string player = impl->playerProvider ? impl->playerProvider() : std::string();
    KillEvent incoming = event;
    incoming.isPlayerInvolved = involvesPlayer(incoming, player);

    std::string lastError;
    for (int attempt = 1; attempt <= 2; ++attempt) {
        try {
            const Impl::WriteOutcome outcome = impl->writeEvent(incoming, source, player);
            notify(StoreNotification{outcome.isNew ? StoreChange::Added : StoreChange::Updated,
                                     outcome.event,
                                     outcome.source,
                                     true});
            return AddEventResult{outcome.isNew, outcome.event};
        } catch (const std::exception &ex) {
            rollbackIfOpen(impl->db);
            lastError = ex.what();
            if (attempt == 1) {
                KFLOG_WARN(QStringLiteral("KillfeedStore"),
                           QStringLiteral("addEvent"),
                           QStringLiteral("write_failed"),
                           QString::fromStdString(lastError),
                           QStringLiteral("retry_once"),
                           logging::defaultWho(),
                           QString(),
                           (nlohmann::json{{"id", incoming.id}}));
            }
        }
    }

    KFLOG_ERROR(QStringLiteral("KillfeedStore"),
                QStringLiteral("addEvent"),
                QStringLiteral("write_abandoned"),
                QString::fromStdString(lastError),
                QStringLiteral("notify_in_memory_only"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"id", incoming.id}, {"source", toSourceString(source)}}));

    notify(StoreNotification{StoreChange::Added, incoming, EventSource::Legacy, false});
    return AddEventResult{true, incoming};
}

EventPage KillfeedStore::query(const EventQuery &query) const
{
    const std::string match = buildFtsMatchExpression(query.searchQuery);
    const bool searching = !match.empty();

    std::string from = " FROM events";
    if (searching) {
        from += " JOIN events_fts ON events.rowid = events_fts.rowid";
    }
    std::string where = " WHERE 1 = 1";
    if (searching) {
        where += " AND events_fts MATCH ?";
    }
    if (query.playerOnly) {
        where += " AND events.is_player_involved = 1";
    }

    EventPage page;
    const std::string countSql = "SELECT COUNT(*)" + from + where + ";";
    Statement countStmt(impl->db, countSql.c_str());
    if (searching) {
        bindText(countStmt.get(), 1, match);
    }
    if (sqlite3_step(countStmt.get()) == SQLITE_ROW) {
        page.total = sqlite3_column_int(countStmt.get(), 0);
    }

    const std::string sql = "SELECT events.id, events.event_data" + from + where
        + " ORDER BY events.timestamp DESC, events.rowid DESC LIMIT ? OFFSET ?;";
    Statement stmt(impl->db, sql.c_str());
    int index = 1;
    if (searching) {
        bindText(stmt.get(), index++, match);
    }
    sqlite3_bind_int(stmt.get(), index++, std::max(0, query.limit));
    sqlite3_bind_int(stmt.get(), index++, std::max(0, query.offset));

    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        page.events.push_back(columnEvent(stmt.get(), 1, columnText(stmt.get(), 0)));
    }
    page.hasMore = std::max(0, query.offset) + static_cast<int>(page.events.size()) < page.total;
    return page;
}

std::optional<KillEvent> KillfeedStore::getEventById(const std::string &id) const
{
    if (auto row = impl->findById(id)) {
        return row->event;
    }
    return std::nullopt;
}

std::optional<EventSource> KillfeedStore::getEventSource(const std::string &id) const
{
    if (auto row = impl->findById(id)) {
        return row->source;
    }
    return std::nullopt;
}

void KillfeedStore::clearAllEvents()
{
    execOrThrow(impl->db, "DELETE FROM events;");
    KFLOG_INFO(QStringLiteral("KillfeedStore"),
               QStringLiteral("clearAllEvents"),
               QStringLiteral("events_cleared"),
               QStringLiteral("clear_requested"),
               QStringLiteral("delete_all"),
               logging::defaultWho(),
               QString(),
               nlohmann::json::object());
    notify(StoreNotification{StoreChange::Cleared, std::nullopt, EventSource::Local, true});
}

StoreStats KillfeedStore::stats() const
{
    StoreStats result;

    Statement totals(impl->db,
                     "SELECT COUNT(*), COALESCE(SUM(is_player_involved), 0), "
                     "MIN(timestamp), MAX(timestamp) FROM events;");
    if (sqlite3_step(totals.get()) == SQLITE_ROW) {
        result.totalEvents = sqlite3_column_int(totals.get(), 0);
        result.playerEvents = sqlite3_column_int(totals.get(), 1);
        if (sqlite3_column_type(totals.get(), 2) != SQLITE_NULL) {
            result.oldest = fromEpochMillis(sqlite3_column_int64(totals.get(), 2));
            result.newest = fromEpochMillis(sqlite3_column_int64(totals.get(), 3));
        }
    }

    Statement sources(impl->db, "SELECT source, COUNT(*) FROM events GROUP BY source;");
    while (sqlite3_step(sources.get()) == SQLITE_ROW) {
        result.bySource[columnText(sources.get(), 0)] = sqlite3_column_int(sources.get(), 1);
    }
    return result;
}

int KillfeedStore::subscribe(StoreSubscriber subscriber)
{
    const int id = impl->nextSubscriberId++;
    impl->subscribers.emplace(id, std::move(subscriber));
    return id;
}

void KillfeedStore::unsubscribe(int id)
{
    impl->subscribers.erase(id);
}

void KillfeedStore::setPlayerProvider(PlayerProvider provider)
{
    impl->playerProvider = std::move(provider);
}

std::optional<std::string> KillfeedStore::getMeta(const std::string &key) const
{
    Statement stmt(impl->db,
                   "SELECT value FROM meta WHERE key = ? LIMIT 1;");
    bindText(stmt.get(), 1, key);

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }

    return columnText(stmt.get(), 0);
}

void KillfeedStore::setMeta(const std::string &key, const std::string &value)
{
    Statement stmt(impl->db,
                   "INSERT OR REPLACE INTO meta (key, value) VALUES (?, ?);");
    bindText(stmt.get(), 1, key);
    bindText(stmt.get(), 2, value);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw std::runtime_error("failed to set meta value");
    }
}

const std::string &KillfeedStore::databasePath() const
{
    return impl->path;
}

void KillfeedStore::notify(const StoreNotification &notification)
{
    // Copy so a subscriber may unsubscribe from inside its callback.
    const auto subscribers = impl->subscribers;
    for (const auto &[id, subscriber] : subscribers) {
        try {
            subscriber(notification);
        } catch (const std::exception &ex) {
            KFLOG_WARN(QStringLiteral("KillfeedStore"),
                       QStringLiteral("notify"),
                       QStringLiteral("subscriber_failed"),
                       QString::fromUtf8(ex.what()),
                       QStringLiteral("continue"),
                       logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"subscriber", id}}));
        }
    }
}

} // namespace killfeed
