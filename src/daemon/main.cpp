#include <QCoreApplication>
#include <QDebug>

#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "common/logging.hpp"
#include "daemon/killfeed_daemon.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    QCoreApplication::setApplicationName(QStringLiteral("killfeed-daemon"));
    qInfo() << "Killfeed daemon starting...";

    bool trace = qEnvironmentVariableIntValue("KILLFEED_TRACE") == 1;
    QString configPath = killfeed::defaultConfigPath();
    for (int i = 1; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg == QStringLiteral("--trace")) {
            trace = true;
        } else if (arg == QStringLiteral("--config") && i + 1 < argc) {
            configPath = QString::fromLocal8Bit(argv[++i]);
        }
    }
    killfeed::logging::initLogging(QStringLiteral("killfeed-daemon"), trace);

    const killfeed::PipelineConfig config = killfeed::loadPipelineConfig(configPath);
    KFLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("daemon_start"),
               QStringLiteral("user_start"),
               QStringLiteral("loaded_config"),
               killfeed::logging::defaultWho(),
               QString(),
               killfeed::configToJson(config));

    try {
        // The daemon lives for the lifetime of the process.
        killfeed::KillfeedDaemon daemon(config);
        daemon.start();
        return app.exec();
    } catch (const std::exception &ex) {
        KFLOG_ERROR(QStringLiteral("main"),
                    QStringLiteral("main"),
                    QStringLiteral("daemon_failed"),
                    QString::fromUtf8(ex.what()),
                    QStringLiteral("exit"),
                    killfeed::logging::defaultWho(),
                    QString(),
                    nlohmann::json::object());
        qWarning() << "Killfeed: daemon failed:" << ex.what();
        return 1;
    }
}
