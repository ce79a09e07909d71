#pragma once

#include <string>

#include <QString>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"

namespace killfeed {

// Scalar pipeline settings. Defaults match the shipped behaviour; a JSON
// file and KILLFEED_* environment variables may override them.
struct PipelineConfig {
    int maxStoredEvents = 1000;
    int mirrorSize = 100;
    int modeDebounceMs = 2000;
    int destructionDeathWindowMs = 15000;
    int fingerprintWindowMs = 10000;
    int recentDeathRetentionMs = 60000;
    int deathCoincidenceWindowMs = 5000;
    int zoneHistorySize = 10;
    double zoneConfidenceThreshold = 0.6;
    double proximityRadius = 100000.0;
    SelfInflictedPolicy selfInflictedPolicy = SelfInflictedPolicy::Unknown;
    bool correlateOutOfOrder = true;
    int pollIntervalMs = 1000;
    std::string gameLogPath;
    // Empty means $HOME/.local/share/killfeed/killfeed.db.
    std::string databasePath;
};

std::string defaultDatabasePath();
QString defaultConfigPath();

// Applies every recognised key in `j` onto `config`. Unknown keys are
// ignored, values of the wrong type are logged and skipped.
void applyConfigJson(const nlohmann::json &j, PipelineConfig &config);

// Defaults, then the JSON file at `path` (if it exists), then environment.
PipelineConfig loadPipelineConfig(const QString &path = defaultConfigPath());

nlohmann::json configToJson(const PipelineConfig &config);

} // namespace killfeed
