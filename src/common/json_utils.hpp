#pragma once

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace killfeed {

inline long long toEpochMillis(std::chrono::system_clock::time_point timestamp)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               timestamp.time_since_epoch())
        .count();
}

inline std::chrono::system_clock::time_point fromEpochMillis(long long value)
{
    return std::chrono::system_clock::time_point{std::chrono::milliseconds{value}};
}

// Game.log and stored events both use YYYY-MM-DDTHH:MM:SS.mmmZ.
inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    const long long millis = toEpochMillis(timestamp);
    long long seconds = millis / 1000;
    long long fraction = millis % 1000;
    if (fraction < 0) {
        fraction += 1000;
        --seconds;
    }

    std::time_t time = static_cast<std::time_t>(seconds);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setw(3) << std::setfill('0') << fraction << 'Z';
    return out.str();
}

// Accepts both the millisecond form and the plain seconds form.
inline std::optional<std::chrono::system_clock::time_point> parseIso8601Utc(
    const std::string &value)
{
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) {
        return std::nullopt;
    }

    int millis = 0;
    if (in.peek() == '.') {
        in.get();
        std::string digits;
        while (std::isdigit(in.peek()) && digits.size() < 3) {
            digits.push_back(static_cast<char>(in.get()));
        }
        while (std::isdigit(in.peek())) {
            in.get();
        }
        if (digits.empty()) {
            return std::nullopt;
        }
        while (digits.size() < 3) {
            digits.push_back('0');
        }
        millis = std::stoi(digits);
    }
    if (in.peek() != 'Z') {
        return std::nullopt;
    }

#if defined(_WIN32)
    std::time_t time = _mkgmtime(&tm);
#else
    std::time_t time = timegm(&tm);
#endif
    if (time == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(time) + std::chrono::milliseconds(millis);
}

inline std::chrono::system_clock::time_point fromIso8601Utc(const std::string &value)
{
    return parseIso8601Utc(value).value_or(std::chrono::system_clock::time_point{});
}

inline std::string toGameModeString(GameMode mode)
{
    switch (mode) {
    case GameMode::PU:
        return "PU";
    case GameMode::AC:
        return "AC";
    case GameMode::Unknown:
        return "Unknown";
    }
    return "Unknown";
}

inline GameMode parseGameModeString(const std::string &value)
{
    if (value == "PU") {
        return GameMode::PU;
    }
    if (value == "AC") {
        return GameMode::AC;
    }
    return GameMode::Unknown;
}

inline std::string toDeathTypeString(DeathType type)
{
    switch (type) {
    case DeathType::Combat:
        return "Combat";
    case DeathType::Hard:
        return "Hard";
    case DeathType::Soft:
        return "Soft";
    case DeathType::Collision:
        return "Collision";
    case DeathType::Crash:
        return "Crash";
    case DeathType::BleedOut:
        return "BleedOut";
    case DeathType::Suffocation:
        return "Suffocation";
    case DeathType::Unknown:
        return "Unknown";
    }
    return "Unknown";
}

inline DeathType parseDeathTypeString(const std::string &value)
{
    if (value == "Combat") {
        return DeathType::Combat;
    }
    if (value == "Hard") {
        return DeathType::Hard;
    }
    if (value == "Soft") {
        return DeathType::Soft;
    }
    if (value == "Collision") {
        return DeathType::Collision;
    }
    if (value == "Crash") {
        return DeathType::Crash;
    }
    if (value == "BleedOut") {
        return DeathType::BleedOut;
    }
    if (value == "Suffocation") {
        return DeathType::Suffocation;
    }
    return DeathType::Unknown;
}

inline std::string toSourceString(EventSource source)
{
    switch (source) {
    case EventSource::Local:
        return "local";
    case EventSource::Server:
        return "server";
    case EventSource::Merged:
        return "merged";
    case EventSource::Legacy:
        return "legacy";
    }
    return "local";
}

inline EventSource parseSourceString(const std::string &value)
{
    if (value == "server") {
        return EventSource::Server;
    }
    if (value == "merged") {
        return EventSource::Merged;
    }
    if (value == "legacy") {
        return EventSource::Legacy;
    }
    return EventSource::Local;
}

inline std::string toDeathSignalString(DeathSignalFormat format)
{
    switch (format) {
    case DeathSignalFormat::None:
        return "none";
    case DeathSignalFormat::Corpse:
        return "corpse";
    case DeathSignalFormat::SpawnReservationLost:
        return "spawn_reservation_lost";
    case DeathSignalFormat::LocalDeadState:
        return "local_dead_state";
    }
    return "none";
}

inline std::string toSystemString(StarSystem system)
{
    switch (system) {
    case StarSystem::Stanton:
        return "stanton";
    case StarSystem::Pyro:
        return "pyro";
    case StarSystem::Unknown:
        return "unknown";
    }
    return "unknown";
}

inline StarSystem parseSystemString(const std::string &value)
{
    if (value == "stanton") {
        return StarSystem::Stanton;
    }
    if (value == "pyro") {
        return StarSystem::Pyro;
    }
    return StarSystem::Unknown;
}

inline std::string toClassificationString(ZoneClassification classification)
{
    return classification == ZoneClassification::Primary ? "primary" : "secondary";
}

inline std::string toPrimaryTypeString(PrimaryZoneType type)
{
    switch (type) {
    case PrimaryZoneType::System:
        return "system";
    case PrimaryZoneType::Planet:
        return "planet";
    case PrimaryZoneType::Moon:
        return "moon";
    case PrimaryZoneType::JumpPoint:
        return "jump_point";
    case PrimaryZoneType::AsteroidField:
        return "asteroid_field";
    }
    return "system";
}

inline PrimaryZoneType parsePrimaryTypeString(const std::string &value)
{
    if (value == "planet") {
        return PrimaryZoneType::Planet;
    }
    if (value == "moon") {
        return PrimaryZoneType::Moon;
    }
    if (value == "jump_point") {
        return PrimaryZoneType::JumpPoint;
    }
    if (value == "asteroid_field") {
        return PrimaryZoneType::AsteroidField;
    }
    return PrimaryZoneType::System;
}

inline std::string toSecondaryTypeString(SecondaryZoneType type)
{
    switch (type) {
    case SecondaryZoneType::Station:
        return "station";
    case SecondaryZoneType::LandingZone:
        return "landing_zone";
    case SecondaryZoneType::Outpost:
        return "outpost";
    case SecondaryZoneType::Derelict:
        return "derelict";
    case SecondaryZoneType::Asteroid:
        return "asteroid";
    case SecondaryZoneType::Ship:
        return "ship";
    case SecondaryZoneType::Poi:
        return "poi";
    }
    return "poi";
}

inline SecondaryZoneType parseSecondaryTypeString(const std::string &value)
{
    if (value == "station") {
        return SecondaryZoneType::Station;
    }
    if (value == "landing_zone") {
        return SecondaryZoneType::LandingZone;
    }
    if (value == "outpost") {
        return SecondaryZoneType::Outpost;
    }
    if (value == "derelict") {
        return SecondaryZoneType::Derelict;
    }
    if (value == "asteroid") {
        return SecondaryZoneType::Asteroid;
    }
    if (value == "ship") {
        return SecondaryZoneType::Ship;
    }
    return SecondaryZoneType::Poi;
}

inline std::string toMatchMethodString(ZoneMatchMethod method)
{
    switch (method) {
    case ZoneMatchMethod::Exact:
        return "exact";
    case ZoneMatchMethod::Pattern:
        return "pattern";
    case ZoneMatchMethod::Fallback:
        return "fallback";
    }
    return "fallback";
}

inline void to_json(nlohmann::json &j, const GameMode &mode)
{
    j = toGameModeString(mode);
}

inline void from_json(const nlohmann::json &j, GameMode &mode)
{
    mode = j.is_string() ? parseGameModeString(j.get<std::string>()) : GameMode::Unknown;
}

inline void to_json(nlohmann::json &j, const DeathType &type)
{
    j = toDeathTypeString(type);
}

inline void from_json(const nlohmann::json &j, DeathType &type)
{
    type = j.is_string() ? parseDeathTypeString(j.get<std::string>()) : DeathType::Unknown;
}

inline void to_json(nlohmann::json &j, const EventSource &source)
{
    j = toSourceString(source);
}

inline void from_json(const nlohmann::json &j, EventSource &source)
{
    source = j.is_string() ? parseSourceString(j.get<std::string>()) : EventSource::Local;
}

inline void to_json(nlohmann::json &j, const Coordinates &coords)
{
    j = nlohmann::json{{"x", coords.x}, {"y", coords.y}, {"z", coords.z}};
}

inline void from_json(const nlohmann::json &j, Coordinates &coords)
{
    coords.x = j.value("x", 0.0);
    coords.y = j.value("y", 0.0);
    coords.z = j.value("z", 0.0);
}

inline void to_json(nlohmann::json &j, const KillEvent &event)
{
    j = nlohmann::json{
        {"id", event.id},
        {"timestamp", toIso8601Utc(event.timestamp)},
        {"killers", event.killers},
        {"victims", event.victims},
        {"deathType", event.deathType},
        {"vehicleType", event.vehicleType},
        {"vehicleModel", event.vehicleModel},
        {"vehicleId", event.vehicleId},
        {"location", event.location},
        {"locationId", event.locationId},
        {"weapon", event.weapon},
        {"damageType", event.damageType},
        {"gameMode", event.gameMode},
        {"gameVersion", event.gameVersion},
        {"playerShip", event.playerShip},
        {"eventDescription", event.eventDescription},
        {"isPlayerInvolved", event.isPlayerInvolved},
        {"playerName", event.playerName},
        {"victimEnlisted", event.victimEnlisted},
        {"victimRecord", event.victimRecord},
        {"victimOrg", event.victimOrg},
        {"attackerEnlisted", event.attackerEnlisted},
        {"attackerRecord", event.attackerRecord},
        {"attackerOrg", event.attackerOrg}
    };
    if (event.coordinates.has_value()) {
        j["coordinates"] = *event.coordinates;
    }
}

inline void from_json(const nlohmann::json &j, KillEvent &event)
{
    event.id = j.value("id", "");
    event.timestamp = fromIso8601Utc(j.value("timestamp", ""));
    if (j.contains("killers") && j.at("killers").is_array()) {
        event.killers = j.at("killers").get<std::vector<std::string>>();
    } else {
        event.killers.clear();
    }
    if (j.contains("victims") && j.at("victims").is_array()) {
        event.victims = j.at("victims").get<std::vector<std::string>>();
    } else {
        event.victims.clear();
    }
    if (j.contains("deathType")) {
        event.deathType = j.at("deathType").get<DeathType>();
    } else {
        event.deathType = DeathType::Unknown;
    }
    event.vehicleType = j.value("vehicleType", "");
    event.vehicleModel = j.value("vehicleModel", "");
    event.vehicleId = j.value("vehicleId", "");
    event.location = j.value("location", "");
    event.locationId = j.value("locationId", "");
    event.weapon = j.value("weapon", "");
    event.damageType = j.value("damageType", "");
    if (j.contains("gameMode")) {
        event.gameMode = j.at("gameMode").get<GameMode>();
    } else {
        event.gameMode = GameMode::Unknown;
    }
    event.gameVersion = j.value("gameVersion", "");
    event.playerShip = j.value("playerShip", "");
    if (j.contains("coordinates") && j.at("coordinates").is_object()) {
        event.coordinates = j.at("coordinates").get<Coordinates>();
    } else {
        event.coordinates.reset();
    }
    event.eventDescription = j.value("eventDescription", "");
    event.isPlayerInvolved = j.value("isPlayerInvolved", false);
    event.playerName = j.value("playerName", "");
    event.victimEnlisted = j.value("victimEnlisted", "-");
    event.victimRecord = j.value("victimRecord", "-");
    event.victimOrg = j.value("victimOrg", "-");
    event.attackerEnlisted = j.value("attackerEnlisted", "-");
    event.attackerRecord = j.value("attackerRecord", "-");
    event.attackerOrg = j.value("attackerOrg", "-");
}

inline void to_json(nlohmann::json &j, const Zone &zone)
{
    const ZoneInfo &info = zoneInfo(zone);
    j = nlohmann::json{
        {"id", info.id},
        {"displayName", info.displayName},
        {"classification", toClassificationString(classificationOf(zone))},
        {"system", toSystemString(info.system)},
        {"confidence", info.confidence},
        {"source", info.source}
    };
    if (info.coordinates.has_value()) {
        j["coordinates"] = *info.coordinates;
    }
    if (const auto *primary = std::get_if<PrimaryZone>(&zone)) {
        j["type"] = toPrimaryTypeString(primary->type);
        j["parentZone"] = primary->parentZone;
        j["childZones"] = primary->childZones;
        j["jurisdiction"] = primary->jurisdiction;
    } else if (const auto *secondary = std::get_if<SecondaryZone>(&zone)) {
        j["type"] = toSecondaryTypeString(secondary->type);
        j["primaryZone"] = secondary->primaryZoneId;
        j["orbitalBody"] = secondary->orbitalBody;
        j["purpose"] = secondary->purpose;
    }
}

inline void from_json(const nlohmann::json &j, Zone &zone)
{
    ZoneInfo info;
    info.id = j.value("id", "");
    info.displayName = j.value("displayName", info.id);
    info.system = parseSystemString(j.value("system", "unknown"));
    info.confidence = j.value("confidence", 1.0);
    info.source = j.value("source", "local");
    if (j.contains("coordinates") && j.at("coordinates").is_object()) {
        info.coordinates = j.at("coordinates").get<Coordinates>();
    }

    if (j.value("classification", "secondary") == "primary") {
        PrimaryZone primary;
        static_cast<ZoneInfo &>(primary) = info;
        primary.type = parsePrimaryTypeString(j.value("type", "system"));
        primary.parentZone = j.value("parentZone", "");
        if (j.contains("childZones") && j.at("childZones").is_array()) {
            primary.childZones = j.at("childZones").get<std::vector<std::string>>();
        }
        primary.jurisdiction = j.value("jurisdiction", "");
        zone = primary;
        return;
    }

    SecondaryZone secondary;
    static_cast<ZoneInfo &>(secondary) = info;
    secondary.type = parseSecondaryTypeString(j.value("type", "poi"));
    secondary.primaryZoneId = j.value("primaryZone", "");
    secondary.orbitalBody = j.value("orbitalBody", "");
    secondary.purpose = j.value("purpose", "");
    zone = secondary;
}

} // namespace killfeed
