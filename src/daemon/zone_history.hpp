#pragma once

#include <chrono>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "daemon/zone_resolver.hpp"

namespace killfeed {

struct ZoneVisitCount {
    std::string zone;
    int visits = 0;
    long long totalTimeMs = 0;
};

struct ZoneStatistics {
    int totalZoneChanges = 0;
    std::chrono::system_clock::time_point sessionStart;
    double averageDwellMs = 0.0;
    std::vector<ZoneVisitCount> mostVisited;
    std::map<StarSystem, int> systemDistribution;
    std::map<ZoneClassification, int> typeDistribution;
};

struct ZoneHistoryFilter {
    std::optional<ZoneClassification> classification;
    std::optional<StarSystem> system;
    int limit = 0;
};

// Bounded list of zones the player passed through. Drives the location
// label attached to kill events.
class ZoneHistoryManager
{
public:
    ZoneHistoryManager(ZoneResolver &resolver, int maxHistorySize = 10, double proximityRadius = 100000.0);

    ZoneResolution addZoneToHistory(const std::string &zoneToken,
                                    const std::string &source,
                                    const std::optional<Coordinates> &coordinates = std::nullopt,
                                    std::optional<std::chrono::system_clock::time_point> timestamp = std::nullopt);

    std::optional<PrimaryZone> matchSecondaryToPrimary(const SecondaryZone &zone);
    std::optional<PrimaryZone> getLastPrimaryZone(std::optional<StarSystem> system = std::nullopt);

    StarSystem currentSystem() const;
    std::optional<ZoneResolution> currentZone() const;
    std::vector<ZoneHistoryEntry> history(const ZoneHistoryFilter &filter = {}) const;
    ZoneStatistics statistics() const;
    void clearHistory();

    // Display name and id of the newest entry; empty when nothing was visited.
    std::string currentLocation() const;
    std::string currentLocationId() const;

private:
    std::optional<PrimaryZone> resolvePrimary(const std::string &zoneId);
    std::optional<PrimaryZone> findNearbyPrimaryZone(const Coordinates &coordinates, StarSystem system);
    std::optional<PrimaryZone> systemDefaultZone(StarSystem system);

    ZoneResolver &m_resolver;
    int m_maxHistorySize = 10;
    double m_proximityRadius = 100000.0;

    std::deque<ZoneHistoryEntry> m_history;
    std::optional<ZoneResolution> m_currentZone;
    std::optional<PrimaryZone> m_lastPrimaryZone;
    StarSystem m_currentSystem = StarSystem::Unknown;
    int m_totalZoneChanges = 0;
    std::chrono::system_clock::time_point m_sessionStart;
};

} // namespace killfeed
