#pragma once

#include <functional>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "common/config.hpp"
#include "common/models.hpp"
#include "daemon/death_signal_filter.hpp"
#include "daemon/incident_correlator.hpp"
#include "daemon/session_context.hpp"

namespace killfeed {

struct ScannerCounters {
    long long linesScanned = 0;
    long long linesMatched = 0;
    long long malformedLines = 0;
    long long signalsForwarded = 0;
    long long signalsDropped = 0;
    long long preventedDuplicates = 0;
    long long incapacitations = 0;
};

// Line-oriented Game.log scanner. Session lines update the context; incident
// lines become RawIncidentSignals that pass the involvement filter before
// reaching the correlator. Resulting events go to the sink.
class LogScanner
{
public:
    LogScanner(SessionContext &session,
               IncidentCorrelator &correlator,
               EventSink sink,
               const PipelineConfig &config = PipelineConfig());

    // Chunk of complete lines; the caller keeps any trailing partial line.
    void parse(const std::string &chunk);
    void scanLine(const std::string &line);

    // Pure extraction, no session or correlation side effects.
    std::optional<RawIncidentSignal> extractSignal(const std::string &line) const;

    const ScannerCounters &counters() const;
    const DeathSignalFilter &deathFilter() const;
    void reset();

private:
    struct IncidentRecognizer {
        IncidentKind kind;
        DeathSignalFormat format;
        std::regex pattern;
    };

    void buildRecognizers();
    RawIncidentSignal buildSignal(const IncidentRecognizer &recognizer,
                                  const std::smatch &match,
                                  const std::string &line) const;
    bool isRelevant(const RawIncidentSignal &signal) const;
    void forward(const RawIncidentSignal &signal);

    SessionContext &m_session;
    IncidentCorrelator &m_correlator;
    EventSink m_sink;
    DeathSignalFilter m_deathFilter;
    std::vector<IncidentRecognizer> m_recognizers;
    ScannerCounters m_counters;
};

} // namespace killfeed
