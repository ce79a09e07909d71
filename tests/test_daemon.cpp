#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include "daemon/killfeed_daemon.hpp"

namespace {

const QByteArray kLogin =
    "<2024-01-02T03:00:00.000Z> [Notice] <Legacy login response> [CIG-net] User Login Success - Handle[TestPilot] - Time[1]\n";

const QByteArray kKill =
    "<2024-01-02T03:04:05.678Z> [Notice] <Actor Death> CActor::Kill: 'Victim' [300] in zone 'Lorville_12' killed by "
    "'TestPilot' [100] using 'KSAR_Rifle_Energy_01_555' [Class KSAR_Rifle_Energy_01] with damage type 'Bullet' "
    "from direction x: 0, y: 0, z: 0 [Team_ActorTech][Actor]\n";

} // namespace

class DaemonTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void testPartialLineIsBuffered();
    void testCursorSurvivesRestart();
    void testTruncatedLogRestartsSession();
    void testMissingLogBacksOff();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    QString logPath() const;
    killfeed::PipelineConfig config() const;
    void writeLog(const QByteArray &content, bool append);
};

void DaemonTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void DaemonTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void DaemonTests::init()
{
    QFile::remove(logPath());
    QFile::remove(QString::fromStdString(config().databasePath));
}

QString DaemonTests::logPath() const
{
    return m_tempDir.path() + QStringLiteral("/Game.log");
}

killfeed::PipelineConfig DaemonTests::config() const
{
    killfeed::PipelineConfig config;
    config.gameLogPath = logPath().toStdString();
    config.databasePath = (m_tempDir.path() + QStringLiteral("/daemon.db")).toStdString();
    return config;
}

void DaemonTests::writeLog(const QByteArray &content, bool append)
{
    QFile file(logPath());
    QVERIFY(file.open(append ? (QIODevice::WriteOnly | QIODevice::Append) : QIODevice::WriteOnly));
    QCOMPARE(file.write(content), static_cast<qint64>(content.size()));
}

void DaemonTests::testPartialLineIsBuffered()
{
    killfeed::KillfeedDaemon daemon(config());

    const QByteArray partial = kKill.left(40);
    writeLog(kLogin + partial, false);
    daemon.pollGameLog();

    QCOMPARE(daemon.committedCursor(), static_cast<long long>(kLogin.size()));
    QCOMPARE(QString::fromStdString(daemon.pipeline().session().player()), QStringLiteral("TestPilot"));
    QCOMPARE(daemon.pipeline().store().stats().totalEvents, 0);

    writeLog(kKill.mid(40), true);
    daemon.pollGameLog();

    QCOMPARE(daemon.committedCursor(), static_cast<long long>(kLogin.size() + kKill.size()));
    QCOMPARE(daemon.pipeline().store().stats().totalEvents, 1);
    QCOMPARE(daemon.pipeline().scanner().counters().malformedLines, 0LL);
}

void DaemonTests::testCursorSurvivesRestart()
{
    writeLog(kLogin + kKill, false);
    {
        killfeed::KillfeedDaemon daemon(config());
        daemon.pollGameLog();
        QCOMPARE(daemon.pipeline().store().stats().totalEvents, 1);
    }

    killfeed::KillfeedDaemon restarted(config());
    QCOMPARE(restarted.committedCursor(), static_cast<long long>(kLogin.size() + kKill.size()));
    QCOMPARE(QString::fromStdString(*restarted.pipeline().store().getMeta("game_log_cursor")),
             QString::number(kLogin.size() + kKill.size()));

    // Nothing new to read, so nothing is scanned twice.
    restarted.pollGameLog();
    QCOMPARE(restarted.pipeline().scanner().counters().linesScanned, 0LL);
}

void DaemonTests::testTruncatedLogRestartsSession()
{
    killfeed::KillfeedDaemon daemon(config());
    writeLog(kLogin + kKill, false);
    daemon.pollGameLog();
    QCOMPARE(daemon.pipeline().scanner().counters().linesScanned, 2LL);

    // A new client session starts a fresh, shorter log.
    writeLog(kLogin, false);
    daemon.pollGameLog();

    QCOMPARE(daemon.committedCursor(), static_cast<long long>(kLogin.size()));
    QCOMPARE(daemon.pipeline().scanner().counters().linesScanned, 1LL);
    QCOMPARE(daemon.pipeline().store().stats().totalEvents, 1);
}

void DaemonTests::testMissingLogBacksOff()
{
    killfeed::KillfeedDaemon daemon(config());

    for (int i = 0; i < 3; ++i) {
        daemon.pollGameLog();
    }
    writeLog(kLogin, false);

    // Three failures put polling on hold for five cycles.
    for (int i = 0; i < 5; ++i) {
        daemon.pollGameLog();
        QCOMPARE(daemon.committedCursor(), 0LL);
    }
    daemon.pollGameLog();
    QCOMPARE(daemon.committedCursor(), static_cast<long long>(kLogin.size()));
}

QTEST_MAIN(DaemonTests)
#include "test_daemon.moc"
