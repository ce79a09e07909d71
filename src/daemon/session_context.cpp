#include "daemon/session_context.hpp"

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "daemon/entity_resolver.hpp"

namespace killfeed {

namespace {

std::string stripInstanceSuffix(const std::string &token)
{
    static const std::regex suffix(R"(_\d+$)");
    return std::regex_replace(token, suffix, "");
}

} // namespace

SessionContext::SessionContext(LastUserStorage &storage, int modeDebounceMs)
    : m_storage(storage)
{
    m_debounceTimer.setSingleShot(true);
    m_debounceTimer.setInterval(modeDebounceMs);
    QObject::connect(&m_debounceTimer, &QTimer::timeout, [this]() {
        promotePendingMode();
    });

    buildRecognizers();
    m_player = m_storage.loadLastUser();
}

void SessionContext::buildRecognizers()
{
    const auto login = [this](const std::smatch &match) {
        setPlayer(match[1].str());
    };

    m_recognizers.push_back({std::regex(R"(<AccountLoginCharacterStatus_Character>.*?name\s+(\S+)\s+-)"), login});
    m_recognizers.push_back({std::regex(R"(<Legacy login response>.*?Handle\[([A-Za-z0-9_-]+)\])"), login});

    m_recognizers.push_back({std::regex(R"(Loading GameModeRecord='SC_Default')"),
                             [this](const std::smatch &) { forceMode(GameMode::PU); }});
    m_recognizers.push_back({std::regex(R"(Loading GameModeRecord='EA_.*?')"),
                             [this](const std::smatch &) { forceMode(GameMode::AC); }});
    m_recognizers.push_back({std::regex(
                                 R"(Requesting game mode Frontend_Main/SC_Frontend|Loading screen for Frontend_Main : SC_Frontend closed)"),
                             [this](const std::smatch &) { forceMode(GameMode::Unknown); }});
    m_recognizers.push_back({std::regex(R"(<SystemQuit>|System Fast Shutdown)", std::regex::ECMAScript | std::regex::icase),
                             [this](const std::smatch &) {
                                 forceMode(GameMode::Unknown);
                                 setLocation("Unknown");
                                 SessionEvent event;
                                 event.kind = SessionEventKind::SystemQuit;
                                 event.player = m_player;
                                 notify(event);
                             }});

    m_recognizers.push_back({std::regex(R"(<Join PU>)"),
                             [this](const std::smatch &) { observeRawMode(GameMode::PU); }});
    m_recognizers.push_back({std::regex(R"(\[EALobby\])"),
                             [this](const std::smatch &) { observeRawMode(GameMode::AC); }});

    m_recognizers.push_back({std::regex(R"(--system-trace-env-id='pub-sc-alpha-(\d{3,4}-\d{7})')"),
                             [this](const std::smatch &match) {
                                 const std::string version = match[1].str();
                                 if (version == m_gameVersion) {
                                     return;
                                 }
                                 m_gameVersion = version;
                                 SessionEvent event;
                                 event.kind = SessionEventKind::GameVersionDetected;
                                 event.player = m_player;
                                 event.gameVersion = version;
                                 notify(event);
                             }});

    m_recognizers.push_back({std::regex(
                                 R"(\[InstancedInterior\] OnEntityLeaveZone - InstancedInterior \[[^\]]+\] \[\d+\] -> Entity \[([^\]]+)\] \[\d+\] --.*?m_ownerGEID\[([^\[\]]+)[\[\]])"),
                             [this](const std::smatch &match) {
                                 const std::string entity = match[1].str();
                                 const std::string owner = match[2].str();
                                 if (m_player.empty() || owner != m_player || !hasManufacturerPrefix(entity)) {
                                     return;
                                 }
                                 setCurrentVehicle(stripInstanceSuffix(entity));
                             }});

    m_recognizers.push_back({std::regex(R"(<(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{3}Z)>.*?Starting new game session)",
                                        std::regex::ECMAScript | std::regex::icase),
                             [this](const std::smatch &match) {
                                 SessionEvent event;
                                 event.kind = SessionEventKind::SessionStarted;
                                 event.player = m_player;
                                 event.gameMode = m_stableMode;
                                 event.detail = match[1].str();
                                 notify(event);
                             }});
}

bool SessionContext::observeLine(const std::string &line)
{
    std::smatch match;
    for (const auto &recognizer : m_recognizers) {
        if (std::regex_search(line, match, recognizer.pattern)) {
            recognizer.apply(match);
            return true;
        }
    }
    return false;
}

void SessionContext::reset()
{
    m_debounceTimer.stop();
    m_stableMode = GameMode::Unknown;
    m_rawMode = GameMode::Unknown;
    m_pendingMode = GameMode::Unknown;
    m_gameVersion.clear();
    m_currentVehicle = kUnknownVehicle;
    m_location.clear();
    m_player = m_storage.loadLastUser();

    KFLOG_INFO(QStringLiteral("SessionContext"),
               QStringLiteral("reset"),
               QStringLiteral("session_reset"),
               QStringLiteral("reset_requested"),
               QStringLiteral("reload_last_user"),
               logging::playerWho(m_player),
               QString(),
               nlohmann::json::object());
}

void SessionContext::setListener(Listener listener)
{
    m_listener = std::move(listener);
}

void SessionContext::setPlayer(const std::string &player)
{
    if (player.empty() || player == m_player) {
        return;
    }
    m_player = player;
    m_storage.saveLastUser(player);

    KFLOG_INFO(QStringLiteral("SessionContext"),
               QStringLiteral("setPlayer"),
               QStringLiteral("player_login"),
               QStringLiteral("login_line"),
               QStringLiteral("persist_last_user"),
               logging::playerWho(player),
               QString(),
               nlohmann::json::object());

    SessionEvent event;
    event.kind = SessionEventKind::PlayerLogin;
    event.player = player;
    notify(event);
}

void SessionContext::setLocation(const std::string &location)
{
    m_location = location;
}

void SessionContext::setCurrentVehicle(const std::string &vehicle)
{
    if (vehicle == m_currentVehicle) {
        return;
    }
    m_currentVehicle = vehicle;

    SessionEvent event;
    event.kind = SessionEventKind::VehicleChanged;
    event.player = m_player;
    event.vehicle = vehicle;
    notify(event);
}

void SessionContext::observeRawMode(GameMode mode)
{
    m_rawMode = mode;
    if (mode == m_stableMode) {
        m_debounceTimer.stop();
        m_pendingMode = mode;
        return;
    }
    m_pendingMode = mode;
    m_debounceTimer.start();
}

void SessionContext::forceMode(GameMode mode)
{
    m_debounceTimer.stop();
    m_rawMode = mode;
    m_pendingMode = mode;
    setStableMode(mode);
}

void SessionContext::promotePendingMode()
{
    if (m_rawMode != m_pendingMode) {
        return;
    }
    setStableMode(m_pendingMode);
}

void SessionContext::setStableMode(GameMode mode)
{
    if (mode == m_stableMode) {
        return;
    }
    const GameMode previous = m_stableMode;
    m_stableMode = mode;

    KFLOG_INFO(QStringLiteral("SessionContext"),
               QStringLiteral("setStableMode"),
               QStringLiteral("game_mode_changed"),
               QStringLiteral("mode_line"),
               QStringLiteral("update_stable_mode"),
               logging::playerWho(m_player),
               QString(),
               (nlohmann::json{{"from", toGameModeString(previous)},
                               {"to", toGameModeString(mode)}}));

    SessionEvent event;
    event.kind = SessionEventKind::GameModeChanged;
    event.player = m_player;
    event.gameMode = mode;
    notify(event);
}

void SessionContext::notify(SessionEvent event) const
{
    if (m_listener) {
        m_listener(event);
    }
}

const std::string &SessionContext::player() const
{
    return m_player;
}

GameMode SessionContext::gameMode() const
{
    return m_stableMode;
}

GameMode SessionContext::rawMode() const
{
    return m_rawMode;
}

const std::string &SessionContext::gameVersion() const
{
    return m_gameVersion;
}

const std::string &SessionContext::currentVehicle() const
{
    return m_currentVehicle;
}

const std::string &SessionContext::location() const
{
    return m_location;
}

bool SessionContext::hasCurrentVehicle() const
{
    return !m_currentVehicle.empty() && m_currentVehicle != kUnknownVehicle;
}

bool SessionContext::isModePromotionPending() const
{
    return m_debounceTimer.isActive();
}

int SessionContext::modeDebounceMs() const
{
    return m_debounceTimer.interval();
}

} // namespace killfeed
