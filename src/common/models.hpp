#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "common/enums.hpp"

namespace killfeed {

struct Coordinates {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

struct KillEvent {
    std::string id;
    std::chrono::system_clock::time_point timestamp;
    std::vector<std::string> killers;
    std::vector<std::string> victims;
    DeathType deathType = DeathType::Unknown;

    // Display label ("NPC" for NPC entities, "Player" on foot).
    std::string vehicleType;
    // Base token without the instance suffix, e.g. AEGS_Avenger.
    std::string vehicleModel;
    std::string vehicleId;

    std::string location;
    std::string locationId;
    std::string weapon;
    std::string damageType;
    GameMode gameMode = GameMode::Unknown;
    std::string gameVersion;
    std::string playerShip;
    std::optional<Coordinates> coordinates;
    std::string eventDescription;
    bool isPlayerInvolved = false;
    std::string playerName;

    // Profile enrichment, "-" until a lookup fills them in.
    std::string victimEnlisted = "-";
    std::string victimRecord = "-";
    std::string victimOrg = "-";
    std::string attackerEnlisted = "-";
    std::string attackerRecord = "-";
    std::string attackerOrg = "-";
};

// Intermediate per-line structure handed from the scanner to the
// correlation engine. Never persisted.
struct RawIncidentSignal {
    IncidentKind kind = IncidentKind::ActorKill;
    std::string incidentId;
    std::chrono::system_clock::time_point timestamp;
    std::vector<std::string> killers;
    std::vector<std::string> victims;
    DeathSignalFormat deathSignal = DeathSignalFormat::None;
    std::string damageType;
    std::string locationToken;
    std::optional<Coordinates> coordinates;
    std::string vehicleToken;
    std::string weapon;
    std::string driver;
    std::string causedBy;
    int destroyLevelFrom = 0;
    int destroyLevelTo = 0;
    std::string rawLine;
};

struct SessionEvent {
    SessionEventKind kind = SessionEventKind::SessionStarted;
    std::string player;
    GameMode gameMode = GameMode::Unknown;
    std::string gameVersion;
    std::string vehicle;
    std::string detail;
};

struct ZoneInfo {
    std::string id;
    std::string displayName;
    StarSystem system = StarSystem::Unknown;
    double confidence = 0.0;
    std::string source = "local";
    std::optional<Coordinates> coordinates;
};

struct PrimaryZone : ZoneInfo {
    PrimaryZoneType type = PrimaryZoneType::System;
    std::string parentZone;
    std::vector<std::string> childZones;
    std::string jurisdiction;
};

struct SecondaryZone : ZoneInfo {
    SecondaryZoneType type = SecondaryZoneType::Poi;
    std::string primaryZoneId;
    std::string orbitalBody;
    std::string purpose;
};

using Zone = std::variant<PrimaryZone, SecondaryZone>;

inline const ZoneInfo &zoneInfo(const Zone &zone)
{
    return std::visit([](const auto &z) -> const ZoneInfo & { return z; }, zone);
}

inline ZoneInfo &zoneInfo(Zone &zone)
{
    return std::visit([](auto &z) -> ZoneInfo & { return z; }, zone);
}

inline ZoneClassification classificationOf(const Zone &zone)
{
    return std::holds_alternative<PrimaryZone>(zone)
        ? ZoneClassification::Primary
        : ZoneClassification::Secondary;
}

struct ZoneResolution {
    Zone zone;
    double confidence = 0.0;
    ZoneMatchMethod matchMethod = ZoneMatchMethod::Fallback;
    bool fallbackUsed = true;
};

struct ZoneHistoryEntry {
    std::chrono::system_clock::time_point timestamp;
    std::string zoneId;
    std::string zoneName;
    ZoneClassification classification = ZoneClassification::Secondary;
    StarSystem system = StarSystem::Unknown;
    std::string source;
    std::optional<Coordinates> coordinates;
    long long dwellTimeMs = 0;
    int eventCount = 0;
};

} // namespace killfeed
