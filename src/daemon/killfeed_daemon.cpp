#include "daemon/killfeed_daemon.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>

#include <QDebug>
#include <QTimer>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace killfeed {

namespace {

constexpr const char *kCursorKey = "game_log_cursor";
constexpr long long kMaxBytesPerPoll = 4 * 1024 * 1024;
constexpr int kMaxConsecutiveErrors = 3;
constexpr int kBackoffCycles = 5;

} // namespace

KillfeedDaemon::KillfeedDaemon(const PipelineConfig &config, QObject *parent)
    : QObject(parent)
    , m_config(config)
    , m_pipeline(std::make_unique<KillfeedPipeline>(config))
{
    loadStateFromMeta();
}

KillfeedDaemon::~KillfeedDaemon()
{
    persistStateToMeta();
}

void KillfeedDaemon::start()
{
    qInfo() << "Killfeed: daemon starting (version" << KILLFEED_VERSION << ")";

    if (m_config.gameLogPath.empty()) {
        qWarning() << "Killfeed: no game log configured; set gameLogPath or KILLFEED_GAME_LOG.";
    }

    auto *timer = new QTimer(this);
    timer->setInterval(m_config.pollIntervalMs);
    connect(timer, &QTimer::timeout, this, &KillfeedDaemon::pollGameLog);
    timer->start();

    pollGameLog();
}

KillfeedPipeline &KillfeedDaemon::pipeline()
{
    return *m_pipeline;
}

long long KillfeedDaemon::committedCursor() const
{
    return m_readCursor - static_cast<long long>(m_partialLine.size());
}

void KillfeedDaemon::pollGameLog()
{
    if (m_config.gameLogPath.empty()) {
        return;
    }
    if (m_backoffCycles > 0) {
        --m_backoffCycles;
        return;
    }

    std::error_code ec;
    const auto fileSize = std::filesystem::file_size(m_config.gameLogPath, ec);
    if (ec) {
        recordReadError(QString::fromStdString(ec.message()));
        return;
    }

    const long long size = static_cast<long long>(fileSize);
    if (size < m_readCursor) {
        // The client truncates Game.log when it starts a new session.
        KFLOG_INFO(QStringLiteral("KillfeedDaemon"),
                   QStringLiteral("pollGameLog"),
                   QStringLiteral("log_restarted"),
                   QStringLiteral("file_shrank"),
                   QStringLiteral("rewind_and_reset_session"),
                   logging::playerWho(m_pipeline->session().player()),
                   QString(),
                   (nlohmann::json{{"previousCursor", m_readCursor}, {"size", size}}));
        m_readCursor = 0;
        m_partialLine.clear();
        m_pipeline->resetSession();
    }
    if (size == m_readCursor) {
        m_errorCount = 0;
        return;
    }

    std::ifstream input(m_config.gameLogPath, std::ios::binary);
    if (!input) {
        recordReadError(QStringLiteral("open_failed"));
        return;
    }

    const long long toRead = std::min(size - m_readCursor, kMaxBytesPerPoll);
    std::string bytes(static_cast<size_t>(toRead), '\0');
    input.seekg(static_cast<std::streamoff>(m_readCursor));
    input.read(bytes.data(), static_cast<std::streamsize>(toRead));
    bytes.resize(static_cast<size_t>(input.gcount()));
    if (bytes.empty()) {
        recordReadError(QStringLiteral("short_read"));
        return;
    }

    m_errorCount = 0;
    m_readCursor += static_cast<long long>(bytes.size());
    handleBytes(bytes);

#ifndef NDEBUG
    Q_ASSERT(committedCursor() >= 0);
#endif

    persistStateToMeta();
}

void KillfeedDaemon::handleBytes(const std::string &bytes)
{
    m_partialLine += bytes;
    const size_t lastNewline = m_partialLine.rfind('\n');
    if (lastNewline == std::string::npos) {
        return;
    }

    const std::string complete = m_partialLine.substr(0, lastNewline);
    m_partialLine.erase(0, lastNewline + 1);

    try {
        m_pipeline->ingest(complete);
    } catch (const std::exception &ex) {
        KFLOG_ERROR(QStringLiteral("KillfeedDaemon"),
                    QStringLiteral("handleBytes"),
                    QStringLiteral("ingest_failed"),
                    QString::fromUtf8(ex.what()),
                    QStringLiteral("skip_chunk"),
                    logging::playerWho(m_pipeline->session().player()),
                    QString(),
                    (nlohmann::json{{"bytes", complete.size()}}));
    }
}

void KillfeedDaemon::recordReadError(const QString &why)
{
    if (m_errorCount == 0) {
        qWarning() << "Killfeed: game log unreadable:" << QString::fromStdString(m_config.gameLogPath);
    }
    KFLOG_WARN(QStringLiteral("KillfeedDaemon"),
               QStringLiteral("pollGameLog"),
               QStringLiteral("game_log_unreadable"),
               why,
               QStringLiteral("retry_next_poll"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"path", m_config.gameLogPath}, {"errors", m_errorCount + 1}}));

    m_errorCount++;
    if (m_errorCount >= kMaxConsecutiveErrors) {
        qWarning() << "Killfeed: game log polling failed repeatedly, backing off.";
        m_backoffCycles = kBackoffCycles;
        m_errorCount = 0;
    }
}

void KillfeedDaemon::loadStateFromMeta()
{
    try {
        if (const auto cursor = m_pipeline->store().getMeta(kCursorKey)) {
            const long long value = std::stoll(*cursor);
            m_readCursor = value >= 0 ? value : 0;
        }
    } catch (const std::exception &) {
        m_readCursor = 0;
    }
}

void KillfeedDaemon::persistStateToMeta()
{
    try {
        m_pipeline->store().setMeta(kCursorKey, std::to_string(committedCursor()));
    } catch (const std::exception &ex) {
        qWarning() << "Killfeed: failed to persist meta state:" << ex.what();
    }
}

} // namespace killfeed
