#include "daemon/zone_history.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <unordered_map>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace killfeed {

namespace {

double distanceBetween(const Coordinates &a, const Coordinates &b)
{
    const double dx = a.x - b.x;
    const double dy = a.y - b.y;
    const double dz = a.z - b.z;
    return std::sqrt(dx * dx + dy * dy + dz * dz);
}

} // namespace

ZoneHistoryManager::ZoneHistoryManager(ZoneResolver &resolver, int maxHistorySize, double proximityRadius)
    : m_resolver(resolver)
    , m_maxHistorySize(std::max(1, maxHistorySize))
    , m_proximityRadius(proximityRadius)
    , m_sessionStart(std::chrono::system_clock::now())
{
}

ZoneResolution ZoneHistoryManager::addZoneToHistory(
    const std::string &zoneToken,
    const std::string &source,
    const std::optional<Coordinates> &coordinates,
    std::optional<std::chrono::system_clock::time_point> timestamp)
{
    const ZoneResolution resolution = m_resolver.resolveZone(zoneToken, coordinates);
    const ZoneInfo &info = zoneInfo(resolution.zone);
    const auto now = timestamp.value_or(std::chrono::system_clock::now());

    if (!m_history.empty() && m_history.back().zoneId == info.id) {
        return resolution;
    }

    std::string previousName;
    if (!m_history.empty()) {
        ZoneHistoryEntry &previous = m_history.back();
        previous.dwellTimeMs = std::max<long long>(
            0, toEpochMillis(now) - toEpochMillis(previous.timestamp));
        previousName = previous.zoneName;
    }

    ZoneHistoryEntry entry;
    entry.timestamp = now;
    entry.zoneId = info.id;
    entry.zoneName = info.displayName;
    entry.classification = classificationOf(resolution.zone);
    entry.system = info.system;
    entry.source = source;
    entry.coordinates = coordinates;
    m_history.push_back(entry);

    m_currentZone = resolution;
    ++m_totalZoneChanges;

    if (info.system != StarSystem::Unknown) {
        m_currentSystem = info.system;
    }
    if (const auto *primary = std::get_if<PrimaryZone>(&resolution.zone)) {
        m_lastPrimaryZone = *primary;
    }

    while (static_cast<int>(m_history.size()) > m_maxHistorySize) {
        m_history.pop_front();
    }

    KFLOG_INFO(QStringLiteral("ZoneHistoryManager"),
               QStringLiteral("addZoneToHistory"),
               QStringLiteral("zone_transition"),
               previousName.empty() ? QStringLiteral("initial_zone") : QStringLiteral("zone_changed"),
               QString::fromStdString(source),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"from", previousName},
                               {"to", entry.zoneName},
                               {"classification", toClassificationString(entry.classification)},
                               {"system", toSystemString(entry.system)}}));
    return resolution;
}

std::optional<PrimaryZone> ZoneHistoryManager::matchSecondaryToPrimary(const SecondaryZone &zone)
{
    if (!zone.primaryZoneId.empty()) {
        if (auto direct = resolvePrimary(zone.primaryZoneId)) {
            return direct;
        }
    }

    if (auto lastPrimary = getLastPrimaryZone(zone.system)) {
        return lastPrimary;
    }

    if (zone.coordinates) {
        if (auto nearby = findNearbyPrimaryZone(*zone.coordinates, zone.system)) {
            return nearby;
        }
    }

    if (auto systemDefault = systemDefaultZone(zone.system)) {
        return systemDefault;
    }

    KFLOG_DEBUG(QStringLiteral("ZoneHistoryManager"),
                QStringLiteral("matchSecondaryToPrimary"),
                QStringLiteral("primary_not_found"),
                QStringLiteral("no_association"),
                QStringLiteral("return_none"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"zone", zone.id}}));
    return std::nullopt;
}

std::optional<PrimaryZone> ZoneHistoryManager::getLastPrimaryZone(std::optional<StarSystem> system)
{
    if (m_lastPrimaryZone && (!system || m_lastPrimaryZone->system == *system)) {
        return m_lastPrimaryZone;
    }

    for (auto it = m_history.rbegin(); it != m_history.rend(); ++it) {
        if (it->classification != ZoneClassification::Primary) {
            continue;
        }
        if (system && it->system != *system) {
            continue;
        }
        if (auto primary = resolvePrimary(it->zoneId)) {
            return primary;
        }
    }
    return std::nullopt;
}

StarSystem ZoneHistoryManager::currentSystem() const
{
    if (m_currentZone && zoneInfo(m_currentZone->zone).system != StarSystem::Unknown) {
        return zoneInfo(m_currentZone->zone).system;
    }
    if (m_currentSystem != StarSystem::Unknown) {
        return m_currentSystem;
    }
    for (auto it = m_history.rbegin(); it != m_history.rend(); ++it) {
        if (it->system != StarSystem::Unknown) {
            return it->system;
        }
    }
    return StarSystem::Unknown;
}

std::optional<ZoneResolution> ZoneHistoryManager::currentZone() const
{
    return m_currentZone;
}

std::vector<ZoneHistoryEntry> ZoneHistoryManager::history(const ZoneHistoryFilter &filter) const
{
    std::vector<ZoneHistoryEntry> result;
    for (const auto &entry : m_history) {
        if (filter.classification && entry.classification != *filter.classification) {
            continue;
        }
        if (filter.system && entry.system != *filter.system) {
            continue;
        }
        result.push_back(entry);
    }
    if (filter.limit > 0 && static_cast<int>(result.size()) > filter.limit) {
        result.erase(result.begin(), result.end() - filter.limit);
    }
    return result;
}

ZoneStatistics ZoneHistoryManager::statistics() const
{
    ZoneStatistics stats;
    stats.totalZoneChanges = m_totalZoneChanges;
    stats.sessionStart = m_sessionStart;
    stats.systemDistribution = {{StarSystem::Stanton, 0}, {StarSystem::Pyro, 0}, {StarSystem::Unknown, 0}};

    std::vector<ZoneVisitCount> visits;
    std::unordered_map<std::string, size_t> visitIndex;
    long long totalDwell = 0;
    int dwellCount = 0;

    for (const auto &entry : m_history) {
        auto found = visitIndex.find(entry.zoneName);
        if (found == visitIndex.end()) {
            found = visitIndex.emplace(entry.zoneName, visits.size()).first;
            visits.push_back(ZoneVisitCount{entry.zoneName, 0, 0});
        }
        ZoneVisitCount &count = visits[found->second];
        ++count.visits;
        if (entry.dwellTimeMs > 0) {
            count.totalTimeMs += entry.dwellTimeMs;
            totalDwell += entry.dwellTimeMs;
            ++dwellCount;
        }
        ++stats.systemDistribution[entry.system];
        ++stats.typeDistribution[entry.classification];
    }

    std::stable_sort(visits.begin(), visits.end(), [](const ZoneVisitCount &a, const ZoneVisitCount &b) {
        return a.visits > b.visits;
    });
    if (visits.size() > 10) {
        visits.resize(10);
    }
    stats.mostVisited = visits;
    stats.averageDwellMs = dwellCount > 0 ? static_cast<double>(totalDwell) / dwellCount : 0.0;
    return stats;
}

void ZoneHistoryManager::clearHistory()
{
    m_history.clear();
    m_currentZone.reset();
    m_lastPrimaryZone.reset();
    m_currentSystem = StarSystem::Unknown;
    m_totalZoneChanges = 0;
    m_sessionStart = std::chrono::system_clock::now();

    KFLOG_INFO(QStringLiteral("ZoneHistoryManager"),
               QStringLiteral("clearHistory"),
               QStringLiteral("zone_history_cleared"),
               QStringLiteral("reset_requested"),
               QStringLiteral("drop_all"),
               logging::defaultWho(),
               QString(),
               nlohmann::json::object());
}

std::string ZoneHistoryManager::currentLocation() const
{
    return m_history.empty() ? std::string() : m_history.back().zoneName;
}

std::string ZoneHistoryManager::currentLocationId() const
{
    return m_history.empty() ? std::string() : m_history.back().zoneId;
}

std::optional<PrimaryZone> ZoneHistoryManager::resolvePrimary(const std::string &zoneId)
{
    const ZoneResolution resolution = m_resolver.resolveZone(zoneId);
    if (const auto *primary = std::get_if<PrimaryZone>(&resolution.zone)) {
        return *primary;
    }
    return std::nullopt;
}

std::optional<PrimaryZone> ZoneHistoryManager::findNearbyPrimaryZone(const Coordinates &coordinates,
                                                                     StarSystem system)
{
    const ZoneHistoryEntry *nearest = nullptr;
    double nearestDistance = std::numeric_limits<double>::max();
    for (const auto &entry : m_history) {
        if (entry.classification != ZoneClassification::Primary
            || entry.system != system
            || !entry.coordinates) {
            continue;
        }
        const double distance = distanceBetween(coordinates, *entry.coordinates);
        if (distance <= m_proximityRadius && distance < nearestDistance) {
            nearest = &entry;
            nearestDistance = distance;
        }
    }
    if (!nearest) {
        return std::nullopt;
    }
    return resolvePrimary(nearest->zoneId);
}

std::optional<PrimaryZone> ZoneHistoryManager::systemDefaultZone(StarSystem system)
{
    switch (system) {
    case StarSystem::Stanton:
        return resolvePrimary("OOC_Stanton");
    case StarSystem::Pyro:
        return resolvePrimary("OOC_Pyro");
    case StarSystem::Unknown:
        break;
    }
    return std::nullopt;
}

} // namespace killfeed
