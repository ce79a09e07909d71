#include "daemon/killfeed_pipeline.hpp"

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace killfeed {

namespace {

constexpr const char *kLastUserKey = "last_user";

QString sessionEventName(SessionEventKind kind)
{
    switch (kind) {
    case SessionEventKind::PlayerLogin:
        return QStringLiteral("player_login");
    case SessionEventKind::GameModeChanged:
        return QStringLiteral("game_mode_changed");
    case SessionEventKind::GameVersionDetected:
        return QStringLiteral("game_version_detected");
    case SessionEventKind::VehicleChanged:
        return QStringLiteral("vehicle_changed");
    case SessionEventKind::SessionStarted:
        return QStringLiteral("session_started");
    case SessionEventKind::SystemQuit:
        return QStringLiteral("system_quit");
    }
    return QStringLiteral("unknown");
}

} // namespace

MetaLastUserStorage::MetaLastUserStorage(KillfeedStore &store)
    : m_store(store)
{
}

std::string MetaLastUserStorage::loadLastUser() const
{
    try {
        return m_store.getMeta(kLastUserKey).value_or(std::string());
    } catch (const std::exception &ex) {
        KFLOG_WARN(QStringLiteral("MetaLastUserStorage"),
                   QStringLiteral("loadLastUser"),
                   QStringLiteral("meta_read_failed"),
                   QString::fromUtf8(ex.what()),
                   QStringLiteral("start_without_player"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json::object());
        return {};
    }
}

void MetaLastUserStorage::saveLastUser(const std::string &player)
{
    try {
        m_store.setMeta(kLastUserKey, player);
    } catch (const std::exception &ex) {
        KFLOG_WARN(QStringLiteral("MetaLastUserStorage"),
                   QStringLiteral("saveLastUser"),
                   QStringLiteral("meta_write_failed"),
                   QString::fromUtf8(ex.what()),
                   QStringLiteral("keep_in_memory"),
                   logging::playerWho(player),
                   QString(),
                   nlohmann::json::object());
    }
}

KillfeedPipeline::KillfeedPipeline(const PipelineConfig &config,
                                   std::unique_ptr<ProfileLookup> profiles)
    : m_config(config)
    , m_profiles(std::move(profiles))
{
    if (!m_profiles) {
        m_profiles = std::make_unique<NullProfileLookup>();
    }

    m_store = std::make_unique<KillfeedStore>(m_config.databasePath,
                                              m_config.maxStoredEvents,
                                              m_config.fingerprintWindowMs);
    m_mirror = std::make_unique<EventMirror>(*m_store, m_config.mirrorSize);
    m_lastUser = std::make_unique<MetaLastUserStorage>(*m_store);
    m_session = std::make_unique<SessionContext>(*m_lastUser, m_config.modeDebounceMs);
    m_zoneResolver = std::make_unique<ZoneResolver>(m_config.zoneConfidenceThreshold);
    m_zones = std::make_unique<ZoneHistoryManager>(*m_zoneResolver,
                                                   m_config.zoneHistorySize,
                                                   m_config.proximityRadius);
    m_correlator = std::make_unique<IncidentCorrelator>(*m_session, *m_zones, m_entities,
                                                        *m_profiles, m_config);
    m_scanner = std::make_unique<LogScanner>(*m_session, *m_correlator,
                                             [this](const KillEvent &event) { storeEvent(event); },
                                             m_config);

    m_store->setPlayerProvider([this]() { return m_session->player(); });
    m_correlator->setEnrichmentSink([this](const KillEvent &event) { storeEvent(event); });
    m_session->setListener([this](const SessionEvent &event) { onSessionEvent(event); });
}

KillfeedPipeline::~KillfeedPipeline() = default;

void KillfeedPipeline::ingest(const std::string &chunk)
{
    m_scanner->parse(chunk);
}

void KillfeedPipeline::resetSession()
{
    m_session->reset();
    m_correlator->reset();
    m_scanner->reset();
    m_zones->clearHistory();
}

KillfeedStore &KillfeedPipeline::store()
{
    return *m_store;
}

const EventMirror &KillfeedPipeline::mirror() const
{
    return *m_mirror;
}

SessionContext &KillfeedPipeline::session()
{
    return *m_session;
}

const LogScanner &KillfeedPipeline::scanner() const
{
    return *m_scanner;
}

const IncidentCorrelator &KillfeedPipeline::correlator() const
{
    return *m_correlator;
}

ZoneHistoryManager &KillfeedPipeline::zones()
{
    return *m_zones;
}

DefaultEntityResolver &KillfeedPipeline::entities()
{
    return m_entities;
}

const PipelineConfig &KillfeedPipeline::config() const
{
    return m_config;
}

void KillfeedPipeline::onSessionEvent(const SessionEvent &event)
{
    KFLOG_INFO(QStringLiteral("KillfeedPipeline"),
               QStringLiteral("onSessionEvent"),
               sessionEventName(event.kind),
               QStringLiteral("session_line"),
               QStringLiteral("update_context"),
               logging::playerWho(event.player),
               QString(),
               (nlohmann::json{{"gameMode", toGameModeString(event.gameMode)},
                               {"gameVersion", event.gameVersion},
                               {"vehicle", event.vehicle},
                               {"detail", event.detail}}));
}

void KillfeedPipeline::storeEvent(const KillEvent &event)
{
    const AddEventResult result = m_store->addEvent(event, EventSource::Local);
    KFLOG_DEBUG(QStringLiteral("KillfeedPipeline"),
                QStringLiteral("storeEvent"),
                result.isNew ? QStringLiteral("event_added") : QStringLiteral("event_updated"),
                QStringLiteral("correlated_event"),
                QStringLiteral("persist"),
                logging::playerWho(m_session->player()),
                QString(),
                (nlohmann::json{{"id", result.event.id},
                                {"description", result.event.eventDescription}}));
}

} // namespace killfeed
