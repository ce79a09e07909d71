#pragma once

#include <string>

#include <QString>

#include <nlohmann/json.hpp>

namespace killfeed::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
// With trace enabled, debug lines are kept and every line is mirrored to
// <process>-trace.log.
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Lines below this level are discarded (debug is additionally gated by trace).
void setMinimumLevel(LogLevel level);
LogLevel parseLogLevel(const QString &value, LogLevel fallback = LogLevel::Info);

// $KILLFEED_LOG_DIR, or $HOME/.local/share/killfeed/logs.
QString logsDirectory();

// Thread-local correlation id; the scanner sets one per incident so the
// scanner, correlator and store lines for the same kill can be joined.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

    CorrelationScope(const CorrelationScope &) = delete;
    CorrelationScope &operator=(const CorrelationScope &) = delete;

private:
    QString m_prev;
};

// Structured log event. All fields are required; use empty strings where unknown.
void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context = nlohmann::json::object());

QString defaultProcessName();
QString defaultWho();

// Player-facing "who" value used by pipeline components.
QString playerWho(const std::string &player);

} // namespace killfeed::logging

#define KFLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::killfeed::logging::logEvent(::killfeed::logging::LogLevel::Debug, \
                                  ::killfeed::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define KFLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::killfeed::logging::logEvent(::killfeed::logging::LogLevel::Info, \
                                  ::killfeed::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define KFLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::killfeed::logging::logEvent(::killfeed::logging::LogLevel::Warn, \
                                  ::killfeed::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define KFLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::killfeed::logging::logEvent(::killfeed::logging::LogLevel::Error, \
                                  ::killfeed::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
