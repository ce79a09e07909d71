#pragma once

#include <memory>
#include <string>

#include <QObject>

#include "common/config.hpp"
#include "daemon/killfeed_pipeline.hpp"

namespace killfeed {

/**
 * KillfeedDaemon tails Game.log:
 * - polls the file on a QTimer from a byte cursor persisted in meta
 * - hands complete lines to the pipeline, buffering a trailing partial line
 * - restarts from the top when the file shrinks (new game session)
 *
 * It is designed to be owned from main() and driven by Qt's event loop.
 */
class KillfeedDaemon : public QObject
{
    Q_OBJECT
public:
    explicit KillfeedDaemon(const PipelineConfig &config, QObject *parent = nullptr);
    ~KillfeedDaemon() override;

    // Call this after constructing the daemon to set up timers and start polling.
    void start();

    KillfeedPipeline &pipeline();

    // Byte offset of the first line not yet handed to the scanner.
    long long committedCursor() const;

public slots:
    void pollGameLog();

private:
    void handleBytes(const std::string &bytes);
    void loadStateFromMeta();
    void persistStateToMeta();
    void recordReadError(const QString &why);

    PipelineConfig m_config;
    std::unique_ptr<KillfeedPipeline> m_pipeline;

    long long m_readCursor = 0;
    std::string m_partialLine;

    int m_errorCount = 0;
    int m_backoffCycles = 0;
};

} // namespace killfeed
