#include "daemon/log_scanner.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace killfeed {

namespace {

const char *const kTimestamp = R"(<(\d{4}-\d{2}-\d{2}T[^>]*)>)";

std::string stripInstanceSuffix(const std::string &token)
{
    static const std::regex cleanup(R"(^(.+?)_\d+$)");
    return std::regex_replace(token, cleanup, "$1");
}

std::chrono::system_clock::time_point parseLineTimestamp(const std::string &value)
{
    const auto parsed = parseIso8601Utc(value);
    if (!parsed) {
        throw std::runtime_error("unparsable timestamp: " + value);
    }
    return *parsed;
}

bool isBlank(const std::string &line)
{
    return std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c); });
}

bool contains(const std::vector<std::string> &names, const std::string &name)
{
    return std::find(names.begin(), names.end(), name) != names.end();
}

QString kindName(IncidentKind kind)
{
    switch (kind) {
    case IncidentKind::VehicleDestruction:
        return QStringLiteral("vehicle_destruction");
    case IncidentKind::ActorKill:
        return QStringLiteral("actor_kill");
    case IncidentKind::EnvironmentalDeath:
        return QStringLiteral("environmental_death");
    case IncidentKind::PlayerDeath:
        return QStringLiteral("player_death");
    case IncidentKind::Incapacitation:
        return QStringLiteral("incapacitation");
    }
    return QStringLiteral("unknown");
}

} // namespace

LogScanner::LogScanner(SessionContext &session,
                       IncidentCorrelator &correlator,
                       EventSink sink,
                       const PipelineConfig &config)
    : m_session(session)
    , m_correlator(correlator)
    , m_sink(std::move(sink))
    , m_deathFilter(config.deathCoincidenceWindowMs, config.recentDeathRetentionMs)
{
    buildRecognizers();
}

void LogScanner::buildRecognizers()
{
    const std::string ts = kTimestamp;

    m_recognizers.push_back({IncidentKind::VehicleDestruction, DeathSignalFormat::None,
                             std::regex(ts + R"( \[Notice\] <Vehicle Destruction>.*?Vehicle '([^']+)' \[\d+\] in zone '([^']+)' \[pos x: ([-\d\.]+), y: ([-\d\.]+), z: ([-\d\.]+) .*? driven by '([^']+)' \[\d+\] advanced from destroy level (\d+) to (\d+) caused by '([^']+)' \[\d+\] with '([^']+)')")});
    m_recognizers.push_back({IncidentKind::PlayerDeath, DeathSignalFormat::LocalDeadState,
                             std::regex(ts + R"(.*?<\[ActorState\] Dead>.*?Local player entered dead state)")});
    m_recognizers.push_back({IncidentKind::PlayerDeath, DeathSignalFormat::SpawnReservationLost,
                             std::regex(ts + R"(.*?<Spawn Flow>.*?Player '([^']+)' \[\d+\] lost reservation for spawnpoint)")});
    m_recognizers.push_back({IncidentKind::PlayerDeath, DeathSignalFormat::Corpse,
                             std::regex(ts + R"(.*?<\[ActorState\] Corpse>.*?Player '([^']+)')")});
    m_recognizers.push_back({IncidentKind::EnvironmentalDeath, DeathSignalFormat::None,
                             std::regex(ts + R"(.*?<Actor Death> CActor::Kill: '([^']+)' .*? damage type '(BleedOut|SuffocationDamage)')")});
    m_recognizers.push_back({IncidentKind::ActorKill, DeathSignalFormat::None,
                             std::regex(ts + R"(.*?<Actor Death> CActor::Kill: '([^']+)' \[\d+\] in zone '([^']+)' killed by '([^']+)' \[[^']+\] using '([^']+)' \[Class ([^\]]+)\] with damage type '([^']+)')")});
    m_recognizers.push_back({IncidentKind::Incapacitation, DeathSignalFormat::None,
                             std::regex(ts + R"(.*?Logged an incap.! nickname: ([^,]+), causes: \[([^\]]+)\])")});
}

void LogScanner::parse(const std::string &chunk)
{
    size_t start = 0;
    while (start <= chunk.size()) {
        size_t end = chunk.find('\n', start);
        if (end == std::string::npos) {
            end = chunk.size();
        }
        std::string line = chunk.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!isBlank(line)) {
            scanLine(line);
        }
        start = end + 1;
    }
}

void LogScanner::scanLine(const std::string &line)
{
    ++m_counters.linesScanned;

    try {
        if (m_session.observeLine(line)) {
            ++m_counters.linesMatched;
            return;
        }

        std::smatch match;
        for (const auto &recognizer : m_recognizers) {
            if (!std::regex_search(line, match, recognizer.pattern)) {
                continue;
            }
            ++m_counters.linesMatched;
            RawIncidentSignal signal = buildSignal(recognizer, match, line);

            if (signal.kind == IncidentKind::Incapacitation) {
                ++m_counters.incapacitations;
                KFLOG_INFO(QStringLiteral("LogScanner"),
                           QStringLiteral("scanLine"),
                           QStringLiteral("incapacitation_detected"),
                           QStringLiteral("incap_line"),
                           QStringLiteral("log_only"),
                           logging::playerWho(m_session.player()),
                           QString(),
                           (nlohmann::json{{"victim", signal.victims.empty() ? std::string() : signal.victims.front()},
                                           {"cause", signal.damageType}}));
                return;
            }

            if (signal.kind == IncidentKind::PlayerDeath) {
                if (signal.victims.empty() || signal.victims.front().empty()) {
                    ++m_counters.signalsDropped;
                    return;
                }
                const DeathSignalVerdict verdict =
                    m_deathFilter.submit(signal.victims.front(), signal.deathSignal, signal.timestamp);
                m_counters.preventedDuplicates = m_deathFilter.preventedDuplicates();
                if (verdict != DeathSignalVerdict::Accepted) {
                    return;
                }
            } else if (!isRelevant(signal)) {
                ++m_counters.signalsDropped;
                KFLOG_DEBUG(QStringLiteral("LogScanner"),
                            QStringLiteral("scanLine"),
                            QStringLiteral("signal_dropped"),
                            QStringLiteral("player_not_involved"),
                            QStringLiteral("skip"),
                            logging::playerWho(m_session.player()),
                            QString(),
                            (nlohmann::json{{"kind", kindName(signal.kind).toStdString()},
                                            {"killers", signal.killers},
                                            {"victims", signal.victims}}));
                return;
            }

            forward(signal);
            return;
        }
    } catch (const std::exception &ex) {
        ++m_counters.malformedLines;
        KFLOG_WARN(QStringLiteral("LogScanner"),
                   QStringLiteral("scanLine"),
                   QStringLiteral("malformed_line"),
                   QString::fromUtf8(ex.what()),
                   QStringLiteral("skip_line"),
                   logging::playerWho(m_session.player()),
                   QString(),
                   (nlohmann::json{{"line", line.substr(0, 512)}}));
    }
}

std::optional<RawIncidentSignal> LogScanner::extractSignal(const std::string &line) const
{
    std::smatch match;
    for (const auto &recognizer : m_recognizers) {
        if (!std::regex_search(line, match, recognizer.pattern)) {
            continue;
        }
        try {
            return buildSignal(recognizer, match, line);
        } catch (const std::exception &) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

RawIncidentSignal LogScanner::buildSignal(const IncidentRecognizer &recognizer,
                                          const std::smatch &match,
                                          const std::string &line) const
{
    RawIncidentSignal signal;
    signal.kind = recognizer.kind;
    signal.deathSignal = recognizer.format;
    signal.rawLine = line;

    switch (recognizer.kind) {
    case IncidentKind::VehicleDestruction:
        signal.timestamp = parseLineTimestamp(match[1].str());
        signal.vehicleToken = match[2].str();
        signal.locationToken = match[3].str();
        signal.coordinates = Coordinates{std::stod(match[4].str()),
                                         std::stod(match[5].str()),
                                         std::stod(match[6].str())};
        signal.driver = match[7].str();
        signal.destroyLevelFrom = std::stoi(match[8].str());
        signal.destroyLevelTo = std::stoi(match[9].str());
        signal.causedBy = match[10].str();
        signal.damageType = match[11].str();
        signal.killers = {signal.causedBy};
        signal.victims = {signal.driver};
        signal.incidentId = "v_kill_" + signal.vehicleToken;
        break;
    case IncidentKind::PlayerDeath:
        signal.timestamp = parseLineTimestamp(match[1].str());
        if (recognizer.format == DeathSignalFormat::LocalDeadState) {
            signal.victims = {m_session.player()};
        } else {
            signal.victims = {match[2].str()};
        }
        signal.incidentId = "death_" + signal.victims.front();
        break;
    case IncidentKind::EnvironmentalDeath:
        signal.timestamp = parseLineTimestamp(match[1].str());
        signal.victims = {match[2].str()};
        signal.killers = {"Environment"};
        signal.damageType = match[3].str();
        signal.causedBy = "Environment";
        signal.incidentId = "env_death_" + signal.victims.front();
        break;
    case IncidentKind::ActorKill:
        signal.timestamp = parseLineTimestamp(match[1].str());
        signal.victims = {match[2].str()};
        signal.locationToken = match[3].str();
        signal.killers = {match[4].str()};
        signal.weapon = match[5].str();
        signal.damageType = match[7].str();
        signal.causedBy = signal.killers.front();
        signal.incidentId = "kill_" + signal.killers.front() + "_" + signal.victims.front();
        break;
    case IncidentKind::Incapacitation:
        signal.timestamp = parseLineTimestamp(match[1].str());
        signal.victims = {match[2].str()};
        signal.damageType = match[3].str();
        signal.incidentId = "incap_" + signal.victims.front();
        break;
    }
    return signal;
}

bool LogScanner::isRelevant(const RawIncidentSignal &signal) const
{
    const std::string &player = m_session.player();
    if (player.empty()) {
        return false;
    }

    const bool involved = contains(signal.killers, player) || contains(signal.victims, player);

    switch (signal.kind) {
    case IncidentKind::VehicleDestruction:
        return involved
            || (m_session.hasCurrentVehicle()
                && stripInstanceSuffix(signal.vehicleToken) == m_session.currentVehicle());
    case IncidentKind::ActorKill:
        // The vehicle destruction line already covers these.
        return involved && signal.damageType != "Crash" && signal.damageType != "Collision";
    case IncidentKind::EnvironmentalDeath:
        return involved;
    case IncidentKind::PlayerDeath:
        return true;
    case IncidentKind::Incapacitation:
        break;
    }
    return false;
}

void LogScanner::forward(const RawIncidentSignal &signal)
{
    ++m_counters.signalsForwarded;
    logging::CorrelationScope scope(QStringLiteral("line-%1").arg(m_counters.linesScanned));

    KFLOG_DEBUG(QStringLiteral("LogScanner"),
                QStringLiteral("forward"),
                QStringLiteral("signal_forwarded"),
                kindName(signal.kind),
                QStringLiteral("correlate"),
                logging::playerWho(m_session.player()),
                QString(),
                (nlohmann::json{{"incident", signal.incidentId},
                                {"timestamp", toIso8601Utc(signal.timestamp)},
                                {"signal", toDeathSignalString(signal.deathSignal)}}));

    const std::optional<KillEvent> event = m_correlator.resolve(signal);
    if (event && m_sink) {
        m_sink(*event);
    }
}

const ScannerCounters &LogScanner::counters() const
{
    return m_counters;
}

const DeathSignalFilter &LogScanner::deathFilter() const
{
    return m_deathFilter;
}

void LogScanner::reset()
{
    m_deathFilter.clear();
    m_counters = ScannerCounters();
}

} // namespace killfeed
