#include "daemon/death_signal_filter.hpp"

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace killfeed {

namespace {

long long epochMinute(std::chrono::system_clock::time_point timestamp)
{
    return toEpochMillis(timestamp) / 60000;
}

long long distanceMs(std::chrono::system_clock::time_point a, std::chrono::system_clock::time_point b)
{
    const long long delta = toEpochMillis(a) - toEpochMillis(b);
    return delta < 0 ? -delta : delta;
}

} // namespace

DeathSignalFilter::DeathSignalFilter(int coincidenceWindowMs, int retentionMs)
    : m_window(coincidenceWindowMs)
    , m_retention(retentionMs)
{
}

std::string DeathSignalFilter::keyFor(const std::string &player, long long minute)
{
    return player + ":" + std::to_string(minute);
}

std::string DeathSignalFilter::findCoincident(const std::string &player,
                                              std::chrono::system_clock::time_point timestamp) const
{
    const long long minute = epochMinute(timestamp);
    for (const long long candidate : {minute, minute - 1, minute + 1}) {
        const auto it = m_reports.find(keyFor(player, candidate));
        if (it != m_reports.end() && distanceMs(it->second.timestamp, timestamp) <= m_window.count()) {
            return it->first;
        }
    }
    return std::string();
}

DeathSignalVerdict DeathSignalFilter::submit(const std::string &player,
                                             DeathSignalFormat format,
                                             std::chrono::system_clock::time_point timestamp)
{
    prune(timestamp);

    const std::string coincident = findCoincident(player, timestamp);
    if (!coincident.empty()) {
        Report *existing = &m_reports.at(coincident);
        ++m_preventedDuplicates;
        const bool upgrade = static_cast<int>(format) > static_cast<int>(existing->format);

        KFLOG_DEBUG(QStringLiteral("DeathSignalFilter"),
                    QStringLiteral("submit"),
                    QStringLiteral("death_report_suppressed"),
                    QStringLiteral("coincident_report"),
                    upgrade ? QStringLiteral("upgrade_format") : QStringLiteral("keep_format"),
                    logging::playerWho(player),
                    QString(),
                    (nlohmann::json{{"recorded", toDeathSignalString(existing->format)},
                                    {"incoming", toDeathSignalString(format)}}));

        if (upgrade) {
            existing->format = format;
            return DeathSignalVerdict::Upgraded;
        }
        return DeathSignalVerdict::Duplicate;
    }

    m_reports[keyFor(player, epochMinute(timestamp))] = Report{timestamp, format};
    return DeathSignalVerdict::Accepted;
}

DeathSignalFormat DeathSignalFilter::recordedFormat(const std::string &player,
                                                    std::chrono::system_clock::time_point timestamp) const
{
    const std::string coincident = findCoincident(player, timestamp);
    return coincident.empty() ? DeathSignalFormat::None : m_reports.at(coincident).format;
}

int DeathSignalFilter::preventedDuplicates() const
{
    return m_preventedDuplicates;
}

int DeathSignalFilter::trackedReports() const
{
    return static_cast<int>(m_reports.size());
}

void DeathSignalFilter::clear()
{
    m_reports.clear();
    m_preventedDuplicates = 0;
}

void DeathSignalFilter::prune(std::chrono::system_clock::time_point now)
{
    for (auto it = m_reports.begin(); it != m_reports.end();) {
        if (now - it->second.timestamp > m_retention) {
            it = m_reports.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace killfeed
