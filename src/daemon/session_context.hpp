#pragma once

#include <functional>
#include <regex>
#include <string>
#include <vector>

#include <QTimer>

#include "common/models.hpp"

namespace killfeed {

inline constexpr const char *kUnknownVehicle = "Unknown";

// Durable last-known-user slot. The daemon backs it with the store's meta
// table; tests use the in-memory variant.
class LastUserStorage
{
public:
    virtual ~LastUserStorage() = default;
    virtual std::string loadLastUser() const = 0;
    virtual void saveLastUser(const std::string &player) = 0;
};

class InMemoryLastUserStorage : public LastUserStorage
{
public:
    std::string loadLastUser() const override { return m_player; }
    void saveLastUser(const std::string &player) override { m_player = player; }

private:
    std::string m_player;
};

// Session state inferred from Game.log: player, stable game mode, build,
// current vehicle and location. Ambiguous mode hints are debounced; explicit
// mode lines apply at once.
class SessionContext
{
public:
    using Listener = std::function<void(const SessionEvent &)>;

    explicit SessionContext(LastUserStorage &storage, int modeDebounceMs = 2000);

    SessionContext(const SessionContext &) = delete;
    SessionContext &operator=(const SessionContext &) = delete;

    // Returns true when a session recognizer matched the line.
    bool observeLine(const std::string &line);

    void reset();
    void setListener(Listener listener);

    void setPlayer(const std::string &player);
    void setLocation(const std::string &location);
    void setCurrentVehicle(const std::string &vehicle);

    // Debounced observation: promoted only if it is still the latest raw mode
    // when the quiet window elapses.
    void observeRawMode(GameMode mode);
    // Explicit transition: cancels any pending promotion.
    void forceMode(GameMode mode);

    const std::string &player() const;
    GameMode gameMode() const;
    GameMode rawMode() const;
    const std::string &gameVersion() const;
    const std::string &currentVehicle() const;
    bool hasCurrentVehicle() const;
    const std::string &location() const;
    bool isModePromotionPending() const;
    int modeDebounceMs() const;

private:
    struct Recognizer {
        std::regex pattern;
        std::function<void(const std::smatch &)> apply;
    };

    void buildRecognizers();
    void promotePendingMode();
    void setStableMode(GameMode mode);
    void notify(SessionEvent event) const;

    LastUserStorage &m_storage;
    std::vector<Recognizer> m_recognizers;
    Listener m_listener;
    QTimer m_debounceTimer;

    std::string m_player;
    GameMode m_stableMode = GameMode::Unknown;
    GameMode m_rawMode = GameMode::Unknown;
    GameMode m_pendingMode = GameMode::Unknown;
    std::string m_gameVersion;
    std::string m_currentVehicle = kUnknownVehicle;
    std::string m_location;
};

} // namespace killfeed
