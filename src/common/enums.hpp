#pragma once

namespace killfeed {

enum class GameMode {
    PU,
    AC,
    Unknown
};

enum class DeathType {
    Combat,
    Hard,
    Soft,
    Collision,
    Crash,
    BleedOut,
    Suffocation,
    Unknown
};

// Tag attached to every stored row and change notification.
enum class EventSource {
    Local,
    Server,
    Merged,
    Legacy
};

// Player-death wire formats. Higher value wins when two formats
// report the same death.
enum class DeathSignalFormat {
    None = 0,
    Corpse = 1,
    SpawnReservationLost = 2,
    LocalDeadState = 3
};

enum class IncidentKind {
    VehicleDestruction,
    ActorKill,
    EnvironmentalDeath,
    PlayerDeath,
    Incapacitation
};

enum class SessionEventKind {
    PlayerLogin,
    GameModeChanged,
    GameVersionDetected,
    VehicleChanged,
    SessionStarted,
    SystemQuit
};

enum class SelfInflictedPolicy {
    Unknown,
    Crash
};

enum class ZoneClassification {
    Primary,
    Secondary
};

enum class StarSystem {
    Stanton,
    Pyro,
    Unknown
};

enum class PrimaryZoneType {
    System,
    Planet,
    Moon,
    JumpPoint,
    AsteroidField
};

enum class SecondaryZoneType {
    Station,
    LandingZone,
    Outpost,
    Derelict,
    Asteroid,
    Ship,
    Poi
};

enum class ZoneMatchMethod {
    Exact,
    Pattern,
    Fallback
};

} // namespace killfeed
