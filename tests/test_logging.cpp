#include <QtTest/QtTest>

#include <QTemporaryDir>
#include <QFile>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

class LoggingTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void testLogEventWrites();
    void testDebugNeedsTrace();
    void testTraceWrites();
    void testCorrelationScope();
    void testMinimumLevel();
    void testParseLogLevel();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    QString logPath(const QString &suffix) const;
    QList<nlohmann::json> readLines(const QString &path) const;
};

void LoggingTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
    qunsetenv("KILLFEED_LOG_DIR");
}

void LoggingTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void LoggingTests::init()
{
    QFile::remove(logPath(QStringLiteral(".log")));
    QFile::remove(logPath(QStringLiteral("-trace.log")));
    killfeed::logging::setMinimumLevel(killfeed::logging::LogLevel::Debug);
}

QString LoggingTests::logPath(const QString &suffix) const
{
    return m_tempDir.path() + "/.local/share/killfeed/logs/killfeed-test" + suffix;
}

QList<nlohmann::json> LoggingTests::readLines(const QString &path) const
{
    QList<nlohmann::json> lines;
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return lines;
    }
    while (!file.atEnd()) {
        const QByteArray line = file.readLine().trimmed();
        if (!line.isEmpty()) {
            lines.push_back(nlohmann::json::parse(line.toStdString()));
        }
    }
    return lines;
}

void LoggingTests::testLogEventWrites()
{
    killfeed::logging::initLogging(QStringLiteral("killfeed-test"), false);

    killfeed::logging::logEvent(killfeed::logging::LogLevel::Info,
                                QStringLiteral("killfeed-test"),
                                QStringLiteral("Test"),
                                QStringLiteral("testLogEventWrites"),
                                QStringLiteral("test_log"),
                                QStringLiteral("unit_test"),
                                QStringLiteral("direct_call"),
                                killfeed::logging::playerWho("TestPilot"),
                                QStringLiteral("corr-1"),
                                nlohmann::json{{"key", "value"}});

    const auto lines = readLines(logPath(QStringLiteral(".log")));
    QCOMPARE(lines.size(), 1);
    const auto &parsed = lines.front();
    QCOMPARE(QString::fromStdString(parsed.value("what", "")), QStringLiteral("test_log"));
    QCOMPARE(QString::fromStdString(parsed.value("level", "")), QStringLiteral("INFO"));
    QCOMPARE(QString::fromStdString(parsed.value("corr", "")), QStringLiteral("corr-1"));
    QCOMPARE(QString::fromStdString(parsed.value("who", "")), QStringLiteral("player:TestPilot"));
    QCOMPARE(QString::fromStdString(parsed.at("context").value("key", "")), QStringLiteral("value"));
}

void LoggingTests::testDebugNeedsTrace()
{
    killfeed::logging::initLogging(QStringLiteral("killfeed-test"), false);

    KFLOG_DEBUG(QStringLiteral("Test"),
                QStringLiteral("testDebugNeedsTrace"),
                QStringLiteral("debug_line"),
                QStringLiteral("unit_test"),
                QStringLiteral("macro"),
                killfeed::logging::defaultWho(),
                QString(),
                nlohmann::json::object());

    QVERIFY(readLines(logPath(QStringLiteral(".log"))).isEmpty());
}

void LoggingTests::testTraceWrites()
{
    killfeed::logging::initLogging(QStringLiteral("killfeed-test"), true);
    QVERIFY(killfeed::logging::isTraceEnabled());

    KFLOG_DEBUG(QStringLiteral("Test"),
                QStringLiteral("testTraceWrites"),
                QStringLiteral("trace_line"),
                QStringLiteral("unit_test"),
                QStringLiteral("macro"),
                killfeed::logging::defaultWho(),
                QStringLiteral("corr-2"),
                nlohmann::json::object());

    QCOMPARE(readLines(logPath(QStringLiteral(".log"))).size(), 1);
    const auto trace = readLines(logPath(QStringLiteral("-trace.log")));
    QCOMPARE(trace.size(), 1);
    QCOMPARE(QString::fromStdString(trace.front().value("what", "")), QStringLiteral("trace_line"));

    killfeed::logging::initLogging(QStringLiteral("killfeed-test"), false);
}

void LoggingTests::testCorrelationScope()
{
    killfeed::logging::initLogging(QStringLiteral("killfeed-test"), false);
    killfeed::logging::setCorrelationId(QStringLiteral("outer"));

    {
        killfeed::logging::CorrelationScope scope(QStringLiteral("line-7"));
        QCOMPARE(killfeed::logging::currentCorrelationId(), QStringLiteral("line-7"));
        KFLOG_INFO(QStringLiteral("Test"),
                   QStringLiteral("testCorrelationScope"),
                   QStringLiteral("scoped_line"),
                   QStringLiteral("unit_test"),
                   QStringLiteral("macro"),
                   killfeed::logging::defaultWho(),
                   QString(),
                   nlohmann::json::object());
    }

    QCOMPARE(killfeed::logging::currentCorrelationId(), QStringLiteral("outer"));
    const auto lines = readLines(logPath(QStringLiteral(".log")));
    QCOMPARE(lines.size(), 1);
    QCOMPARE(QString::fromStdString(lines.front().value("corr", "")), QStringLiteral("line-7"));
    killfeed::logging::setCorrelationId(QString());
}

void LoggingTests::testMinimumLevel()
{
    killfeed::logging::initLogging(QStringLiteral("killfeed-test"), false);
    killfeed::logging::setMinimumLevel(killfeed::logging::LogLevel::Warn);

    KFLOG_INFO(QStringLiteral("Test"),
               QStringLiteral("testMinimumLevel"),
               QStringLiteral("dropped"),
               QStringLiteral("unit_test"),
               QStringLiteral("macro"),
               killfeed::logging::defaultWho(),
               QString(),
               nlohmann::json::object());
    KFLOG_ERROR(QStringLiteral("Test"),
                QStringLiteral("testMinimumLevel"),
                QStringLiteral("kept"),
                QStringLiteral("unit_test"),
                QStringLiteral("macro"),
                killfeed::logging::defaultWho(),
                QString(),
                nlohmann::json::object());

    const auto lines = readLines(logPath(QStringLiteral(".log")));
    QCOMPARE(lines.size(), 1);
    QCOMPARE(QString::fromStdString(lines.front().value("what", "")), QStringLiteral("kept"));
}

void LoggingTests::testParseLogLevel()
{
    using killfeed::logging::LogLevel;
    QCOMPARE(killfeed::logging::parseLogLevel(QStringLiteral("WARNING")), LogLevel::Warn);
    QCOMPARE(killfeed::logging::parseLogLevel(QStringLiteral("debug")), LogLevel::Debug);
    QCOMPARE(killfeed::logging::parseLogLevel(QStringLiteral("loud"), LogLevel::Error), LogLevel::Error);
}

QTEST_MAIN(LoggingTests)
#include "test_logging.moc"
