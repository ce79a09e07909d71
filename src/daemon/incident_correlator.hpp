#pragma once

#include <chrono>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/config.hpp"
#include "common/models.hpp"
#include "daemon/entity_resolver.hpp"
#include "daemon/profile_lookup.hpp"
#include "daemon/session_context.hpp"
#include "daemon/zone_history.hpp"

namespace killfeed {

using EventSink = std::function<void(const KillEvent &)>;

// Turns raw incident signals into KillEvents. Vehicle destructions whose
// driver is not known yet carry the vehicle as a placeholder victim; a player
// death reported close enough in time fills it in under the same event id.
class IncidentCorrelator
{
public:
    IncidentCorrelator(SessionContext &session,
                       ZoneHistoryManager &zones,
                       const EntityResolver &entities,
                       ProfileLookup &profiles,
                       const PipelineConfig &config);

    // New or updated event to store, or nothing when the signal does not
    // produce one (level-0 destruction, uncorrelated death).
    std::optional<KillEvent> resolve(const RawIncidentSignal &signal);

    // Receives events patched by asynchronous profile enrichment.
    void setEnrichmentSink(EventSink sink);

    int openPlaceholderCount() const;
    int recentDeathCount() const;
    int correlatedDeaths() const;
    void reset();

private:
    struct RecentDeath {
        std::string player;
        std::chrono::system_clock::time_point timestamp;
        bool consumed = false;
    };

    std::optional<KillEvent> resolveDestruction(const RawIncidentSignal &signal);
    std::optional<KillEvent> resolveActorKill(const RawIncidentSignal &signal);
    std::optional<KillEvent> resolveEnvironmentalDeath(const RawIncidentSignal &signal);
    std::optional<KillEvent> resolvePlayerDeath(const RawIncidentSignal &signal);

    KillEvent baseEvent(const RawIncidentSignal &signal) const;
    void fillLocation(KillEvent &event,
                      const std::string &zoneToken,
                      const std::optional<Coordinates> &coordinates,
                      const std::string &source);
    void describe(KillEvent &event) const;
    void remember(const KillEvent &event);
    void requestEnrichment(const KillEvent &event);
    bool fillFromRecentDeath(KillEvent &event);
    void observeTimestamp(std::chrono::system_clock::time_point timestamp);
    bool withinCorrelationWindow(std::chrono::system_clock::time_point a,
                                 std::chrono::system_clock::time_point b) const;

    SessionContext &m_session;
    ZoneHistoryManager &m_zones;
    const EntityResolver &m_entities;
    ProfileLookup &m_profiles;
    PipelineConfig m_config;
    EventSink m_enrichmentSink;

    std::deque<RecentDeath> m_recentDeaths;
    std::unordered_map<std::string, KillEvent> m_recentEvents;
    std::deque<std::string> m_recentEventOrder;
    std::chrono::system_clock::time_point m_newestTimestamp;
    int m_correlatedDeaths = 0;
};

} // namespace killfeed
