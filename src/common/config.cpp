#include "common/config.hpp"

#include <cstdlib>
#include <filesystem>

#include <QFile>

#include "common/logging.hpp"

namespace killfeed {

namespace {

void warnBadValue(const std::string &key, const std::string &reason)
{
    KFLOG_WARN(QStringLiteral("Config"),
               QStringLiteral("applyConfigJson"),
               QStringLiteral("config_value_ignored"),
               QString::fromStdString(reason),
               QStringLiteral("keep_default"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"key", key}}));
}

template <typename T>
void readNumber(const nlohmann::json &j, const char *key, T &target, T minimum)
{
    if (!j.contains(key)) {
        return;
    }
    const auto &value = j.at(key);
    if (!value.is_number()) {
        warnBadValue(key, "not_a_number");
        return;
    }
    const T parsed = value.get<T>();
    if (parsed < minimum) {
        warnBadValue(key, "below_minimum");
        return;
    }
    target = parsed;
}

void readBool(const nlohmann::json &j, const char *key, bool &target)
{
    if (!j.contains(key)) {
        return;
    }
    if (!j.at(key).is_boolean()) {
        warnBadValue(key, "not_a_boolean");
        return;
    }
    target = j.at(key).get<bool>();
}

void readString(const nlohmann::json &j, const char *key, std::string &target)
{
    if (!j.contains(key)) {
        return;
    }
    if (!j.at(key).is_string()) {
        warnBadValue(key, "not_a_string");
        return;
    }
    target = j.at(key).get<std::string>();
}

void applyEnvInt(const char *name, int &target, int minimum)
{
    const QString raw = qEnvironmentVariable(name);
    if (raw.isEmpty()) {
        return;
    }
    bool ok = false;
    const int value = raw.toInt(&ok);
    if (!ok || value < minimum) {
        warnBadValue(name, "invalid_environment_value");
        return;
    }
    target = value;
}

} // namespace

std::string defaultDatabasePath()
{
    const char *home = std::getenv("HOME");
    std::filesystem::path basePath = home ? home : ".";
    basePath /= ".local/share/killfeed";
    return (basePath / "killfeed.db").string();
}

QString defaultConfigPath()
{
    const QString home = qEnvironmentVariable("HOME");
    const QString base = home.isEmpty() ? QStringLiteral(".") : home;
    return base + QStringLiteral("/.config/killfeed/config.json");
}

void applyConfigJson(const nlohmann::json &j, PipelineConfig &config)
{
    if (!j.is_object()) {
        warnBadValue("<root>", "not_an_object");
        return;
    }

    readNumber(j, "maxStoredEvents", config.maxStoredEvents, 1);
    readNumber(j, "mirrorSize", config.mirrorSize, 1);
    readNumber(j, "modeDebounceMs", config.modeDebounceMs, 0);
    readNumber(j, "destructionDeathWindowMs", config.destructionDeathWindowMs, 0);
    readNumber(j, "fingerprintWindowMs", config.fingerprintWindowMs, 0);
    readNumber(j, "recentDeathRetentionMs", config.recentDeathRetentionMs, 0);
    readNumber(j, "deathCoincidenceWindowMs", config.deathCoincidenceWindowMs, 0);
    readNumber(j, "zoneHistorySize", config.zoneHistorySize, 1);
    readNumber(j, "zoneConfidenceThreshold", config.zoneConfidenceThreshold, 0.0);
    readNumber(j, "proximityRadius", config.proximityRadius, 0.0);
    readNumber(j, "pollIntervalMs", config.pollIntervalMs, 50);
    readBool(j, "correlateOutOfOrder", config.correlateOutOfOrder);
    readString(j, "gameLogPath", config.gameLogPath);
    readString(j, "databasePath", config.databasePath);

    if (j.contains("selfInflictedDeathType")) {
        const auto &value = j.at("selfInflictedDeathType");
        if (value.is_string() && value.get<std::string>() == "crash") {
            config.selfInflictedPolicy = SelfInflictedPolicy::Crash;
        } else if (value.is_string() && value.get<std::string>() == "unknown") {
            config.selfInflictedPolicy = SelfInflictedPolicy::Unknown;
        } else {
            warnBadValue("selfInflictedDeathType", "expected_unknown_or_crash");
        }
    }
}

PipelineConfig loadPipelineConfig(const QString &path)
{
    PipelineConfig config;

    QFile file(path);
    if (file.exists()) {
        if (!file.open(QIODevice::ReadOnly)) {
            KFLOG_WARN(QStringLiteral("Config"),
                       QStringLiteral("loadPipelineConfig"),
                       QStringLiteral("config_unreadable"),
                       QStringLiteral("open_failed"),
                       QStringLiteral("use_defaults"),
                       logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"path", path.toStdString()}}));
        } else {
            try {
                applyConfigJson(nlohmann::json::parse(file.readAll().toStdString()), config);
            } catch (const nlohmann::json::exception &ex) {
                KFLOG_WARN(QStringLiteral("Config"),
                           QStringLiteral("loadPipelineConfig"),
                           QStringLiteral("config_parse_failed"),
                           QStringLiteral("invalid_json"),
                           QStringLiteral("use_defaults"),
                           logging::defaultWho(),
                           QString(),
                           (nlohmann::json{{"path", path.toStdString()},
                                           {"error", ex.what()}}));
            }
        }
    }

    const QString gameLog = qEnvironmentVariable("KILLFEED_GAME_LOG");
    if (!gameLog.isEmpty()) {
        config.gameLogPath = gameLog.toStdString();
    }
    const QString dbPath = qEnvironmentVariable("KILLFEED_DB_PATH");
    if (!dbPath.isEmpty()) {
        config.databasePath = dbPath.toStdString();
    }
    applyEnvInt("KILLFEED_MAX_EVENTS", config.maxStoredEvents, 1);
    applyEnvInt("KILLFEED_DEBOUNCE_MS", config.modeDebounceMs, 0);

    if (config.databasePath.empty()) {
        config.databasePath = defaultDatabasePath();
    }
    return config;
}

nlohmann::json configToJson(const PipelineConfig &config)
{
    return nlohmann::json{
        {"maxStoredEvents", config.maxStoredEvents},
        {"mirrorSize", config.mirrorSize},
        {"modeDebounceMs", config.modeDebounceMs},
        {"destructionDeathWindowMs", config.destructionDeathWindowMs},
        {"fingerprintWindowMs", config.fingerprintWindowMs},
        {"recentDeathRetentionMs", config.recentDeathRetentionMs},
        {"deathCoincidenceWindowMs", config.deathCoincidenceWindowMs},
        {"zoneHistorySize", config.zoneHistorySize},
        {"zoneConfidenceThreshold", config.zoneConfidenceThreshold},
        {"proximityRadius", config.proximityRadius},
        {"selfInflictedDeathType",
         config.selfInflictedPolicy == SelfInflictedPolicy::Crash ? "crash" : "unknown"},
        {"correlateOutOfOrder", config.correlateOutOfOrder},
        {"pollIntervalMs", config.pollIntervalMs},
        {"gameLogPath", config.gameLogPath},
        {"databasePath", config.databasePath}
    };
}

} // namespace killfeed
