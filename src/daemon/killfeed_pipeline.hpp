#pragma once

#include <memory>
#include <string>

#include "common/config.hpp"
#include "daemon/entity_resolver.hpp"
#include "daemon/event_mirror.hpp"
#include "daemon/incident_correlator.hpp"
#include "daemon/killfeed_store.hpp"
#include "daemon/log_scanner.hpp"
#include "daemon/profile_lookup.hpp"
#include "daemon/session_context.hpp"
#include "daemon/zone_history.hpp"
#include "daemon/zone_resolver.hpp"

namespace killfeed {

// Last-known user persisted in the store's meta table.
class MetaLastUserStorage : public LastUserStorage
{
public:
    explicit MetaLastUserStorage(KillfeedStore &store);

    std::string loadLastUser() const override;
    void saveLastUser(const std::string &player) override;

private:
    KillfeedStore &m_store;
};

/**
 * KillfeedPipeline owns one instance of every stage:
 * - SessionContext and LogScanner for Game.log text
 * - ZoneResolver/ZoneHistoryManager and IncidentCorrelator for events
 * - KillfeedStore and the EventMirror fed by its notifications
 *
 * Text goes in through ingest(); events come out through the store.
 */
class KillfeedPipeline
{
public:
    explicit KillfeedPipeline(const PipelineConfig &config,
                              std::unique_ptr<ProfileLookup> profiles = nullptr);
    ~KillfeedPipeline();

    KillfeedPipeline(const KillfeedPipeline &) = delete;
    KillfeedPipeline &operator=(const KillfeedPipeline &) = delete;

    // Complete lines only.
    void ingest(const std::string &chunk);

    // Forget session and correlation state, e.g. when the log restarts.
    void resetSession();

    KillfeedStore &store();
    const EventMirror &mirror() const;
    SessionContext &session();
    const LogScanner &scanner() const;
    const IncidentCorrelator &correlator() const;
    ZoneHistoryManager &zones();
    DefaultEntityResolver &entities();
    const PipelineConfig &config() const;

private:
    void onSessionEvent(const SessionEvent &event);
    void storeEvent(const KillEvent &event);

    PipelineConfig m_config;
    std::unique_ptr<KillfeedStore> m_store;
    std::unique_ptr<EventMirror> m_mirror;
    std::unique_ptr<MetaLastUserStorage> m_lastUser;
    std::unique_ptr<SessionContext> m_session;
    std::unique_ptr<ZoneResolver> m_zoneResolver;
    std::unique_ptr<ZoneHistoryManager> m_zones;
    DefaultEntityResolver m_entities;
    std::unique_ptr<ProfileLookup> m_profiles;
    std::unique_ptr<IncidentCorrelator> m_correlator;
    std::unique_ptr<LogScanner> m_scanner;
};

} // namespace killfeed
