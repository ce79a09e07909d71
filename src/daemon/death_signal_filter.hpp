#pragma once

#include <chrono>
#include <string>
#include <unordered_map>

#include "common/enums.hpp"

namespace killfeed {

enum class DeathSignalVerdict {
    Accepted,
    Duplicate,
    Upgraded
};

// Format-priority dedup for player-death reports. Newer builds log the same
// death in several formats; only the first report inside the coincidence
// window is forwarded, later ones may only upgrade the recorded format.
class DeathSignalFilter
{
public:
    DeathSignalFilter(int coincidenceWindowMs = 5000, int retentionMs = 60000);

    DeathSignalVerdict submit(const std::string &player,
                              DeathSignalFormat format,
                              std::chrono::system_clock::time_point timestamp);

    // Recorded format for the report covering (player, timestamp), or None.
    DeathSignalFormat recordedFormat(const std::string &player,
                                     std::chrono::system_clock::time_point timestamp) const;

    int preventedDuplicates() const;
    int trackedReports() const;
    void clear();

private:
    struct Report {
        std::chrono::system_clock::time_point timestamp;
        DeathSignalFormat format = DeathSignalFormat::None;
    };

    static std::string keyFor(const std::string &player, long long epochMinute);
    // Key of the recorded report within the window, empty when none.
    std::string findCoincident(const std::string &player, std::chrono::system_clock::time_point timestamp) const;
    void prune(std::chrono::system_clock::time_point now);

    std::unordered_map<std::string, Report> m_reports;
    std::chrono::milliseconds m_window;
    std::chrono::milliseconds m_retention;
    int m_preventedDuplicates = 0;
};

} // namespace killfeed
