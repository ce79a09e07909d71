#include "daemon/incident_correlator.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <regex>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "daemon/kill_description.hpp"
#include "daemon/zone_classifier.hpp"

namespace killfeed {

namespace {

constexpr size_t kRecentEventCapacity = 256;

std::string stripInstanceSuffix(const std::string &token)
{
    static const std::regex cleanup(R"(^(.+?)_\d+$)");
    return std::regex_replace(token, cleanup, "$1");
}

std::string stableId(const std::string &raw)
{
    std::string out;
    out.reserve(raw.size());
    for (const char c : raw) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_') {
            out.push_back(c);
        }
    }
    return out;
}

std::string lowered(const std::string &value)
{
    std::string out = value;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

nlohmann::json eventSummary(const KillEvent &event)
{
    return nlohmann::json{{"id", event.id},
                          {"killers", event.killers},
                          {"victims", event.victims},
                          {"deathType", toDeathTypeString(event.deathType)},
                          {"location", event.location}};
}

} // namespace

IncidentCorrelator::IncidentCorrelator(SessionContext &session,
                                       ZoneHistoryManager &zones,
                                       const EntityResolver &entities,
                                       ProfileLookup &profiles,
                                       const PipelineConfig &config)
    : m_session(session)
    , m_zones(zones)
    , m_entities(entities)
    , m_profiles(profiles)
    , m_config(config)
{
}

void IncidentCorrelator::setEnrichmentSink(EventSink sink)
{
    m_enrichmentSink = std::move(sink);
}

std::optional<KillEvent> IncidentCorrelator::resolve(const RawIncidentSignal &signal)
{
    observeTimestamp(signal.timestamp);

    switch (signal.kind) {
    case IncidentKind::VehicleDestruction:
        return resolveDestruction(signal);
    case IncidentKind::ActorKill:
        return resolveActorKill(signal);
    case IncidentKind::EnvironmentalDeath:
        return resolveEnvironmentalDeath(signal);
    case IncidentKind::PlayerDeath:
        return resolvePlayerDeath(signal);
    case IncidentKind::Incapacitation:
        break;
    }
    return std::nullopt;
}

KillEvent IncidentCorrelator::baseEvent(const RawIncidentSignal &signal) const
{
    KillEvent event;
    event.timestamp = signal.timestamp;
    event.gameMode = m_session.gameMode();
    event.gameVersion = m_session.gameVersion();
    event.playerShip = m_session.currentVehicle();
    event.playerName = m_session.player();
    return event;
}

std::optional<KillEvent> IncidentCorrelator::resolveDestruction(const RawIncidentSignal &signal)
{
    const std::string vehicleBase = stripInstanceSuffix(signal.vehicleToken);

    // Zone history follows the vehicle even when the destruction is not final.
    KillEvent event = baseEvent(signal);
    fillLocation(event, signal.locationToken, signal.coordinates, "vehicle_destruction");

    if (signal.destroyLevelTo < 1) {
        KFLOG_DEBUG(QStringLiteral("IncidentCorrelator"),
                    QStringLiteral("resolveDestruction"),
                    QStringLiteral("destruction_ignored"),
                    QStringLiteral("destroy_level_below_soft"),
                    QStringLiteral("skip"),
                    logging::playerWho(m_session.player()),
                    QString(),
                    (nlohmann::json{{"vehicle", signal.vehicleToken},
                                    {"level", signal.destroyLevelTo}}));
        return std::nullopt;
    }

    event.id = stableId("v_kill_" + signal.vehicleToken);
    if (!signal.causedBy.empty() && signal.causedBy != "unknown") {
        event.killers = {signal.causedBy};
    }
    if (!signal.driver.empty() && signal.driver != "unknown") {
        event.victims = {signal.driver};
    } else {
        event.victims = {vehicleBase};
    }
    event.deathType = determineDeathType(signal.destroyLevelTo,
                                         signal.damageType,
                                         signal.causedBy,
                                         signal.driver,
                                         m_config.selfInflictedPolicy);

    const ResolvedEntity vehicle = m_entities.resolve(vehicleBase);
    event.vehicleType = vehicle.isNpc ? std::string("NPC") : vehicle.displayName;
    event.vehicleModel = vehicleBase;
    event.vehicleId = signal.vehicleToken;
    event.weapon = signal.damageType;
    event.damageType = signal.damageType;
    event.coordinates = signal.coordinates;

    // A soft then hard destruction of the same vehicle shares one id; keep a
    // victim that an earlier death already filled in.
    const auto previous = m_recentEvents.find(event.id);
    if (previous != m_recentEvents.end()
        && isPlaceholderVictim(event.victims, event.vehicleModel)
        && !isPlaceholderVictim(previous->second.victims, previous->second.vehicleModel)) {
        event.victims = previous->second.victims;
    }

    if (m_config.correlateOutOfOrder && isPlaceholderVictim(event.victims, event.vehicleModel)) {
        fillFromRecentDeath(event);
    }

    describe(event);
    remember(event);
    requestEnrichment(event);
    return event;
}

std::optional<KillEvent> IncidentCorrelator::resolveActorKill(const RawIncidentSignal &signal)
{
    if (signal.killers.empty() || signal.victims.empty()) {
        return std::nullopt;
    }

    const std::string zone = stripInstanceSuffix(signal.locationToken);
    const std::string weapon = stripInstanceSuffix(signal.weapon);
    const std::string &killer = signal.killers.front();
    const std::string &victim = signal.victims.front();

    KillEvent event = baseEvent(signal);
    event.id = stableId("kill_" + killer + "_" + victim + "_" + zone + "_" + weapon);
    event.killers = {killer};
    event.victims = {victim};

    if (signal.damageType == "Crash") {
        event.deathType = DeathType::Crash;
    } else if (signal.damageType == "Collision") {
        event.deathType = DeathType::Collision;
    } else {
        event.deathType = DeathType::Combat;
    }

    event.vehicleType = m_entities.resolve(victim).isNpc ? std::string("NPC") : std::string("Player");
    event.vehicleModel = "Player";
    event.vehicleId = zone;
    event.weapon = weapon;
    event.damageType = signal.damageType;
    fillLocation(event, zone, std::nullopt, "combat_death");

    describe(event);
    remember(event);
    requestEnrichment(event);
    return event;
}

std::optional<KillEvent> IncidentCorrelator::resolveEnvironmentalDeath(const RawIncidentSignal &signal)
{
    if (signal.victims.empty()) {
        return std::nullopt;
    }
    const std::string &player = signal.victims.front();

    KillEvent event = baseEvent(signal);
    event.id = stableId("env_death_" + player + "_" + toIso8601Utc(signal.timestamp));
    event.killers = {"Environment"};
    event.victims = {player};
    event.deathType = determineDeathType(0, signal.damageType, "Environment", std::string(),
                                         m_config.selfInflictedPolicy);
    event.vehicleType = m_entities.resolve(player).isNpc ? std::string("NPC") : std::string("Player");
    event.vehicleModel = "Player";
    event.weapon = signal.damageType;
    event.damageType = signal.damageType;
    fillLocation(event, std::string(), std::nullopt, "environmental_death");

    describe(event);
    remember(event);
    requestEnrichment(event);
    return event;
}

std::optional<KillEvent> IncidentCorrelator::resolvePlayerDeath(const RawIncidentSignal &signal)
{
    if (signal.victims.empty() || signal.victims.front().empty()) {
        return std::nullopt;
    }
    const std::string &player = signal.victims.front();
    m_recentDeaths.push_back(RecentDeath{player, signal.timestamp, false});

    KillEvent *target = nullptr;
    long long bestDistance = 0;
    for (auto &[id, candidate] : m_recentEvents) {
        if (id.rfind("v_kill_", 0) != 0
            || !isPlaceholderVictim(candidate.victims, candidate.vehicleModel)
            || !withinCorrelationWindow(candidate.timestamp, signal.timestamp)
            || std::find(candidate.killers.begin(), candidate.killers.end(), player) != candidate.killers.end()) {
            continue;
        }
        const long long distance =
            std::llabs(toEpochMillis(candidate.timestamp) - toEpochMillis(signal.timestamp));
        if (!target || distance < bestDistance) {
            target = &candidate;
            bestDistance = distance;
        }
    }

    if (!target) {
        KFLOG_DEBUG(QStringLiteral("IncidentCorrelator"),
                    QStringLiteral("resolvePlayerDeath"),
                    QStringLiteral("correlation_miss"),
                    QStringLiteral("no_open_placeholder"),
                    QStringLiteral("keep_recent_death"),
                    logging::playerWho(m_session.player()),
                    QString(),
                    (nlohmann::json{{"victim", player},
                                    {"signal", toDeathSignalString(signal.deathSignal)}}));
        return std::nullopt;
    }

    m_recentDeaths.back().consumed = true;
    ++m_correlatedDeaths;

    const std::string placeholder = target->victims.front();
    target->victims = {player};
    target->playerName = m_session.player();
    describe(*target);
    const KillEvent updated = *target;

    KFLOG_INFO(QStringLiteral("IncidentCorrelator"),
               QStringLiteral("resolvePlayerDeath"),
               QStringLiteral("placeholder_resolved"),
               QStringLiteral("player_death_in_window"),
               QStringLiteral("upsert_same_id"),
               logging::playerWho(m_session.player()),
               QString(),
               (nlohmann::json{{"id", updated.id},
                               {"placeholder", placeholder},
                               {"victim", player},
                               {"signal", toDeathSignalString(signal.deathSignal)}}));

    requestEnrichment(updated);
    return updated;
}

void IncidentCorrelator::fillLocation(KillEvent &event,
                                      const std::string &zoneToken,
                                      const std::optional<Coordinates> &coordinates,
                                      const std::string &source)
{
    if (!ZoneClassifier::cleanZoneId(zoneToken).empty()) {
        const ZoneResolution resolution =
            m_zones.addZoneToHistory(zoneToken, source, coordinates, event.timestamp);
        const ZoneInfo &info = zoneInfo(resolution.zone);
        event.location = info.displayName;
        event.locationId = info.id;

        if (const auto *secondary = std::get_if<SecondaryZone>(&resolution.zone)) {
            const auto primary = m_zones.matchSecondaryToPrimary(*secondary);
            if (primary && primary->type != PrimaryZoneType::System
                && primary->displayName != info.displayName) {
                event.location = info.displayName + ", " + primary->displayName;
            }
        }
    } else if (!m_zones.currentLocation().empty()) {
        event.location = m_zones.currentLocation();
        event.locationId = m_zones.currentLocationId();
    } else if (!m_session.location().empty()) {
        event.location = m_session.location();
    } else {
        event.location = "Unknown";
    }
    m_session.setLocation(event.location);
}

void IncidentCorrelator::describe(KillEvent &event) const
{
    const bool placeholder = isPlaceholderVictim(event.victims, event.vehicleModel);
    const auto displayNames = [this](const std::vector<std::string> &names) {
        std::vector<std::string> display;
        for (const auto &name : names) {
            const ResolvedEntity entity = m_entities.resolve(name);
            display.push_back(entity.isNpc ? entity.displayName : name);
        }
        return display;
    };

    event.eventDescription = formatKillDescription(displayNames(event.killers),
                                                   placeholder ? event.victims : displayNames(event.victims),
                                                   event.vehicleType,
                                                   event.vehicleModel,
                                                   event.deathType);
}

void IncidentCorrelator::remember(const KillEvent &event)
{
    if (m_recentEvents.find(event.id) == m_recentEvents.end()) {
        m_recentEventOrder.push_back(event.id);
    }
    m_recentEvents[event.id] = event;

    while (m_recentEventOrder.size() > kRecentEventCapacity) {
        m_recentEvents.erase(m_recentEventOrder.front());
        m_recentEventOrder.pop_front();
    }
}

void IncidentCorrelator::requestEnrichment(const KillEvent &event)
{
    std::vector<std::string> names;
    const auto consider = [&](const std::string &name) {
        if (name.empty() || name.find('_') != std::string::npos
            || lowered(name) == "unknown" || name == "Environment"
            || m_entities.resolve(name).isNpc) {
            return;
        }
        if (std::find(names.begin(), names.end(), name) == names.end()) {
            names.push_back(name);
        }
    };
    for (const auto &killer : event.killers) {
        consider(killer);
    }
    for (const auto &victim : event.victims) {
        consider(victim);
    }
    if (names.empty()) {
        return;
    }

    const std::string eventId = event.id;
    m_profiles.lookup(names, [this, eventId](const std::unordered_map<std::string, ProfileData> &profiles) {
        const auto it = m_recentEvents.find(eventId);
        if (it == m_recentEvents.end()) {
            return;
        }
        KillEvent &patched = it->second;
        bool changed = false;

        if (!patched.victims.empty()) {
            const auto victim = profiles.find(patched.victims.front());
            if (victim != profiles.end()) {
                patched.victimEnlisted = victim->second.enlisted;
                patched.victimRecord = victim->second.record;
                patched.victimOrg = victim->second.org;
                changed = true;
            }
        }
        if (!patched.killers.empty()) {
            const auto attacker = profiles.find(patched.killers.front());
            if (attacker != profiles.end()) {
                patched.attackerEnlisted = attacker->second.enlisted;
                patched.attackerRecord = attacker->second.record;
                patched.attackerOrg = attacker->second.org;
                changed = true;
            }
        }

        if (changed && m_enrichmentSink) {
            m_enrichmentSink(patched);
        }
    });
}

bool IncidentCorrelator::fillFromRecentDeath(KillEvent &event)
{
    for (auto &death : m_recentDeaths) {
        if (death.consumed || !withinCorrelationWindow(death.timestamp, event.timestamp)) {
            continue;
        }
        if (std::find(event.killers.begin(), event.killers.end(), death.player) != event.killers.end()) {
            continue;
        }
        death.consumed = true;
        ++m_correlatedDeaths;
        event.victims = {death.player};

        KFLOG_INFO(QStringLiteral("IncidentCorrelator"),
                   QStringLiteral("fillFromRecentDeath"),
                   QStringLiteral("placeholder_resolved"),
                   QStringLiteral("death_before_destruction"),
                   QStringLiteral("fill_before_write"),
                   logging::playerWho(m_session.player()),
                   QString(),
                   eventSummary(event));
        return true;
    }
    return false;
}

void IncidentCorrelator::observeTimestamp(std::chrono::system_clock::time_point timestamp)
{
    if (timestamp > m_newestTimestamp) {
        m_newestTimestamp = timestamp;
    }
    const auto retention = std::chrono::milliseconds(m_config.recentDeathRetentionMs);
    while (!m_recentDeaths.empty() && m_newestTimestamp - m_recentDeaths.front().timestamp > retention) {
        m_recentDeaths.pop_front();
    }
}

bool IncidentCorrelator::withinCorrelationWindow(std::chrono::system_clock::time_point a,
                                                 std::chrono::system_clock::time_point b) const
{
    return std::llabs(toEpochMillis(a) - toEpochMillis(b)) <= m_config.destructionDeathWindowMs;
}

int IncidentCorrelator::openPlaceholderCount() const
{
    int count = 0;
    for (const auto &[id, event] : m_recentEvents) {
        if (id.rfind("v_kill_", 0) == 0 && isPlaceholderVictim(event.victims, event.vehicleModel)) {
            ++count;
        }
    }
    return count;
}

int IncidentCorrelator::recentDeathCount() const
{
    return static_cast<int>(m_recentDeaths.size());
}

int IncidentCorrelator::correlatedDeaths() const
{
    return m_correlatedDeaths;
}

void IncidentCorrelator::reset()
{
    m_recentDeaths.clear();
    m_recentEvents.clear();
    m_recentEventOrder.clear();
    m_newestTimestamp = std::chrono::system_clock::time_point();
    m_correlatedDeaths = 0;
}

} // namespace killfeed
