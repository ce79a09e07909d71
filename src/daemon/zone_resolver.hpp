#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/models.hpp"

namespace killfeed {

struct ZoneDatabaseStats {
    int totalZones = 0;
    int primaryZones = 0;
    int secondaryZones = 0;
    std::map<StarSystem, int> bySystem;
    std::chrono::system_clock::time_point lastUpdated;
    std::string version;
    std::string source;
};

// Knowledge base of zones keyed by clean id, seeded with well-known Stanton
// locations and grown by caching confident pattern resolutions.
class ZoneResolver
{
public:
    explicit ZoneResolver(double confidenceThreshold = 0.6);

    ZoneResolution resolveZone(const std::string &zoneToken,
                               const std::optional<Coordinates> &coordinates = std::nullopt);

    // Case-insensitive substring match on id or display name, sorted by name.
    std::vector<Zone> searchZones(const std::string &query) const;
    std::vector<Zone> getZonesByType(ZoneClassification classification,
                                     std::optional<StarSystem> system = std::nullopt) const;

    // Merges server-provided zones over the local knowledge base.
    void updateZoneDatabase(const std::vector<Zone> &zones, const std::string &version);
    ZoneDatabaseStats databaseStats() const;

    double confidenceThreshold() const;

    static ZoneResolution fallbackResolution();

private:
    PrimaryZone buildPrimary(const std::string &cleanId,
                             StarSystem system,
                             const std::optional<Coordinates> &coordinates) const;
    SecondaryZone buildSecondary(const std::string &cleanId,
                                 StarSystem system,
                                 const std::optional<Coordinates> &coordinates) const;
    void seedKnownZones();

    std::unordered_map<std::string, Zone> m_zones;
    double m_confidenceThreshold = 0.6;
    std::chrono::system_clock::time_point m_lastUpdated;
    std::string m_version = "1.0.0";
    std::string m_source = "local";
};

} // namespace killfeed
