#include "daemon/zone_resolver.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

#include "common/logging.hpp"
#include "daemon/zone_classifier.hpp"

namespace killfeed {

namespace {

constexpr double kPrimaryPatternConfidence = 0.8;
constexpr double kSecondaryPatternConfidence = 0.6;

std::string lowered(const std::string &value)
{
    std::string out = value;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

std::string findParentZone(const std::string &zoneId)
{
    static const std::regex moon(R"(^(OOC_(Stanton|Pyro)_\d+)[a-z]$)", std::regex::icase);
    static const std::regex planet(R"(^(OOC_(Stanton|Pyro))_\d+$)", std::regex::icase);

    std::smatch match;
    if (std::regex_match(zoneId, match, moon)) {
        return match[1].str();
    }
    if (std::regex_match(zoneId, match, planet)) {
        return match[1].str();
    }
    return std::string();
}

std::vector<std::string> findChildZones(const std::string &zoneId)
{
    static const std::regex planet(R"(^OOC_Stanton_\d+$)");

    if (zoneId == "OOC_Stanton") {
        return {"OOC_Stanton_1", "OOC_Stanton_2", "OOC_Stanton_3", "OOC_Stanton_4"};
    }
    if (std::regex_match(zoneId, planet)) {
        return {zoneId + "a", zoneId + "b", zoneId + "c"};
    }
    return {};
}

std::string determineJurisdiction(const std::string &zoneId, StarSystem system)
{
    if (system == StarSystem::Stanton) {
        if (zoneId.find("_1") != std::string::npos) {
            return "Hurston Dynamics";
        }
        if (zoneId.find("_2") != std::string::npos) {
            return "Crusader Industries";
        }
        if (zoneId.find("_3") != std::string::npos) {
            return "ArcCorp";
        }
        if (zoneId.find("_4") != std::string::npos) {
            return "Microtech Corporation";
        }
    }
    return "UEE";
}

std::string determinePurpose(const std::string &zoneId, SecondaryZoneType type)
{
    const std::string lower = lowered(zoneId);
    if (lower.find("mining") != std::string::npos) {
        return "Mining Operations";
    }
    if (lower.find("research") != std::string::npos) {
        return "Research Facility";
    }
    if (lower.find("security") != std::string::npos) {
        return "Security Operations";
    }
    if (lower.find("medical") != std::string::npos) {
        return "Medical Facility";
    }
    if (lower.find("commercial") != std::string::npos) {
        return "Commercial Hub";
    }
    if (type == SecondaryZoneType::LandingZone) {
        return "Urban Center";
    }
    if (type == SecondaryZoneType::Station) {
        return "Orbital Platform";
    }
    return std::string();
}

PrimaryZone seedPrimary(const std::string &id,
                        const std::string &name,
                        PrimaryZoneType type,
                        const std::string &parent,
                        const std::string &jurisdiction)
{
    PrimaryZone zone;
    zone.id = id;
    zone.displayName = name;
    zone.system = StarSystem::Stanton;
    zone.confidence = 1.0;
    zone.type = type;
    zone.parentZone = parent;
    zone.childZones = findChildZones(id);
    zone.jurisdiction = jurisdiction;
    return zone;
}

SecondaryZone seedSecondary(const std::string &id,
                            const std::string &name,
                            SecondaryZoneType type,
                            const std::string &primaryZoneId,
                            const std::string &orbitalBody,
                            const std::string &purpose)
{
    SecondaryZone zone;
    zone.id = id;
    zone.displayName = name;
    zone.system = StarSystem::Stanton;
    zone.confidence = 1.0;
    zone.type = type;
    zone.primaryZoneId = primaryZoneId;
    zone.orbitalBody = orbitalBody;
    zone.purpose = purpose;
    return zone;
}

void sortByDisplayName(std::vector<Zone> &zones)
{
    std::sort(zones.begin(), zones.end(), [](const Zone &a, const Zone &b) {
        return zoneInfo(a).displayName < zoneInfo(b).displayName;
    });
}

} // namespace

ZoneResolver::ZoneResolver(double confidenceThreshold)
    : m_confidenceThreshold(confidenceThreshold)
    , m_lastUpdated(std::chrono::system_clock::now())
{
    seedKnownZones();
}

ZoneResolution ZoneResolver::resolveZone(const std::string &zoneToken,
                                         const std::optional<Coordinates> &coordinates)
{
    const std::string cleanId = ZoneClassifier::cleanZoneId(zoneToken);
    if (cleanId.empty()) {
        KFLOG_DEBUG(QStringLiteral("ZoneResolver"),
                    QStringLiteral("resolveZone"),
                    QStringLiteral("zone_fallback"),
                    QStringLiteral("empty_zone_token"),
                    QStringLiteral("fallback_unknown"),
                    logging::defaultWho(),
                    QString(),
                    nlohmann::json::object());
        return fallbackResolution();
    }

    const auto known = m_zones.find(cleanId);
    if (known != m_zones.end()) {
        ZoneResolution resolution{known->second, 1.0, ZoneMatchMethod::Exact, false};
        return resolution;
    }

    const StarSystem system = ZoneClassifier::determineSystem(cleanId);
    ZoneResolution resolution;
    if (ZoneClassifier::classify(cleanId) == ZoneClassification::Primary) {
        resolution.zone = buildPrimary(cleanId, system, coordinates);
        resolution.confidence = kPrimaryPatternConfidence;
    } else {
        resolution.zone = buildSecondary(cleanId, system, coordinates);
        resolution.confidence = kSecondaryPatternConfidence;
    }
    resolution.matchMethod = ZoneMatchMethod::Pattern;
    resolution.fallbackUsed = false;

    if (resolution.confidence >= m_confidenceThreshold) {
        m_zones[cleanId] = resolution.zone;
    }

    KFLOG_DEBUG(QStringLiteral("ZoneResolver"),
                QStringLiteral("resolveZone"),
                QStringLiteral("zone_resolved"),
                QStringLiteral("pattern_match"),
                QStringLiteral("classifier"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"token", zoneToken},
                                {"id", cleanId},
                                {"displayName", zoneInfo(resolution.zone).displayName},
                                {"confidence", resolution.confidence}}));
    return resolution;
}

std::vector<Zone> ZoneResolver::searchZones(const std::string &query) const
{
    const std::string term = lowered(query);
    std::vector<Zone> results;
    for (const auto &[id, zone] : m_zones) {
        const ZoneInfo &info = zoneInfo(zone);
        if (lowered(info.displayName).find(term) != std::string::npos
            || lowered(id).find(term) != std::string::npos) {
            results.push_back(zone);
        }
    }
    sortByDisplayName(results);
    return results;
}

std::vector<Zone> ZoneResolver::getZonesByType(ZoneClassification classification,
                                               std::optional<StarSystem> system) const
{
    std::vector<Zone> results;
    for (const auto &[id, zone] : m_zones) {
        if (classificationOf(zone) != classification) {
            continue;
        }
        if (system && zoneInfo(zone).system != *system) {
            continue;
        }
        results.push_back(zone);
    }
    sortByDisplayName(results);
    return results;
}

void ZoneResolver::updateZoneDatabase(const std::vector<Zone> &zones, const std::string &version)
{
    for (Zone zone : zones) {
        ZoneInfo &info = zoneInfo(zone);
        info.source = "server";
        m_zones[info.id] = zone;
    }
    m_lastUpdated = std::chrono::system_clock::now();
    m_version = version;
    m_source = "server";

    KFLOG_INFO(QStringLiteral("ZoneResolver"),
               QStringLiteral("updateZoneDatabase"),
               QStringLiteral("zone_database_updated"),
               QStringLiteral("server_zones_received"),
               QStringLiteral("merge_by_id"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"zones", zones.size()},
                               {"version", version},
                               {"total", m_zones.size()}}));
}

ZoneDatabaseStats ZoneResolver::databaseStats() const
{
    ZoneDatabaseStats stats;
    stats.totalZones = static_cast<int>(m_zones.size());
    stats.bySystem = {{StarSystem::Stanton, 0}, {StarSystem::Pyro, 0}, {StarSystem::Unknown, 0}};
    for (const auto &[id, zone] : m_zones) {
        if (classificationOf(zone) == ZoneClassification::Primary) {
            ++stats.primaryZones;
        } else {
            ++stats.secondaryZones;
        }
        ++stats.bySystem[zoneInfo(zone).system];
    }
    stats.lastUpdated = m_lastUpdated;
    stats.version = m_version;
    stats.source = m_source;
    return stats;
}

double ZoneResolver::confidenceThreshold() const
{
    return m_confidenceThreshold;
}

ZoneResolution ZoneResolver::fallbackResolution()
{
    SecondaryZone zone;
    zone.id = "unknown";
    zone.displayName = "Unknown";
    zone.type = SecondaryZoneType::Poi;
    zone.system = StarSystem::Unknown;
    zone.confidence = 0.0;
    return ZoneResolution{zone, 0.0, ZoneMatchMethod::Fallback, true};
}

PrimaryZone ZoneResolver::buildPrimary(const std::string &cleanId,
                                       StarSystem system,
                                       const std::optional<Coordinates> &coordinates) const
{
    PrimaryZone zone;
    zone.id = cleanId;
    zone.displayName = ZoneClassifier::generateDisplayName(cleanId);
    zone.system = system;
    zone.confidence = kPrimaryPatternConfidence;
    zone.coordinates = coordinates;
    zone.type = ZoneClassifier::determinePrimaryType(cleanId);
    zone.parentZone = findParentZone(cleanId);
    zone.childZones = findChildZones(cleanId);
    zone.jurisdiction = determineJurisdiction(cleanId, system);
    return zone;
}

SecondaryZone ZoneResolver::buildSecondary(const std::string &cleanId,
                                           StarSystem system,
                                           const std::optional<Coordinates> &coordinates) const
{
    SecondaryZone zone;
    zone.id = cleanId;
    zone.displayName = ZoneClassifier::generateDisplayName(cleanId);
    zone.system = system;
    zone.confidence = kSecondaryPatternConfidence;
    zone.coordinates = coordinates;
    zone.type = ZoneClassifier::determineSecondaryType(cleanId);
    if (const auto primary = ZoneClassifier::derivePrimaryZone(cleanId)) {
        zone.primaryZoneId = *primary;
        zone.orbitalBody = ZoneClassifier::generateDisplayName(*primary);
    }
    zone.purpose = determinePurpose(cleanId, zone.type);
    return zone;
}

void ZoneResolver::seedKnownZones()
{
    const std::vector<Zone> seeds{
        seedPrimary("OOC_Stanton", "Stanton System", PrimaryZoneType::System, "", "UEE"),
        seedPrimary("OOC_Stanton_1", "Hurston", PrimaryZoneType::Planet, "OOC_Stanton", "Hurston Dynamics"),
        seedPrimary("OOC_Stanton_2", "Crusader", PrimaryZoneType::Planet, "OOC_Stanton", "Crusader Industries"),
        seedPrimary("OOC_Stanton_3", "ArcCorp", PrimaryZoneType::Planet, "OOC_Stanton", "ArcCorp"),
        seedPrimary("OOC_Stanton_4", "microTech", PrimaryZoneType::Planet, "OOC_Stanton", "Microtech Corporation"),
        seedPrimary("OOC_Stanton_1a", "Arial", PrimaryZoneType::Moon, "OOC_Stanton_1", "Hurston Dynamics"),
        seedPrimary("OOC_Stanton_1b", "Aberdeen", PrimaryZoneType::Moon, "OOC_Stanton_1", "Hurston Dynamics"),
        seedSecondary("PortOlisar", "Port Olisar", SecondaryZoneType::Station,
                      "OOC_Stanton_2", "Crusader", "Orbital Platform"),
        seedSecondary("GrimHex", "GrimHEX", SecondaryZoneType::Station,
                      "OOC_Stanton_2c", "Yela", "Outlaw Base"),
        seedSecondary("Lorville", "Lorville", SecondaryZoneType::LandingZone,
                      "OOC_Stanton_1", "Hurston", "Urban Center"),
        seedSecondary("Area18", "Area18", SecondaryZoneType::LandingZone,
                      "OOC_Stanton_3", "ArcCorp", "Urban Center"),
    };
    for (const auto &zone : seeds) {
        m_zones.emplace(zoneInfo(zone).id, zone);
    }
}

} // namespace killfeed
