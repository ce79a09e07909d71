#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <filesystem>
#include <sstream>
#include <iostream>

#include <nlohmann/json.hpp>

#include "report/ReportCli.hpp"
#include "daemon/killfeed_store.hpp"
#include "common/json_utils.hpp"

namespace {

killfeed::KillEvent makeEvent(const std::string &id,
                              long long minute,
                              const std::string &killer,
                              const std::string &victim)
{
    killfeed::KillEvent event;
    event.id = id;
    event.timestamp = std::chrono::system_clock::time_point(std::chrono::minutes(28402744 + minute));
    event.killers = {killer};
    event.victims = {victim};
    event.deathType = killfeed::DeathType::Combat;
    event.vehicleType = "Player";
    event.vehicleModel = "Player";
    event.location = "Lorville, Hurston";
    event.weapon = "KSAR_Rifle_Energy_01";
    event.eventDescription = killer + " destroyed " + victim;
    return event;
}

} // namespace

class ReportCliTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();

    void testListMarkdown();
    void testListJsonPagination();
    void testSearch();
    void testStatsJson();
    void testClearNeedsConfirmation();
    void testUsageErrors_data();
    void testUsageErrors();
    void testDefaultDatabaseFromConfig();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    std::string dbPath() const;
    void seed();
    int runCli(const QStringList &args, std::string &out);
};

void ReportCliTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
    qunsetenv("KILLFEED_DB_PATH");
}

void ReportCliTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void ReportCliTests::init()
{
    std::error_code error;
    std::filesystem::remove(dbPath(), error);
}

std::string ReportCliTests::dbPath() const
{
    return m_tempDir.path().toStdString() + "/report.db";
}

void ReportCliTests::seed()
{
    killfeed::KillfeedStore store(dbPath());
    store.setPlayerProvider([]() { return std::string("TestPilot"); });
    store.addEvent(makeEvent("k1", 0, "TestPilot", "Outlaw"));
    store.addEvent(makeEvent("k2", 1, "Kelvin", "Bystander"));
    store.addEvent(makeEvent("k3", 2, "Kelvin", "TestPilot"), killfeed::EventSource::Server);
}

int ReportCliTests::runCli(const QStringList &args, std::string &out)
{
    std::stringstream buffer;
    auto *oldBuf = std::cout.rdbuf(buffer.rdbuf());
    auto *oldErr = std::cerr.rdbuf(buffer.rdbuf());

    killfeed::ReportCli cli;
    std::vector<QByteArray> utf8Args;
    std::vector<char *> rawArgs;
    for (const QString &arg : args) {
        utf8Args.push_back(arg.toLocal8Bit());
    }
    for (auto &arg : utf8Args) {
        rawArgs.push_back(arg.data());
    }

    const int result = cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());

    std::cout.rdbuf(oldBuf);
    std::cerr.rdbuf(oldErr);
    out = buffer.str();
    return result;
}

void ReportCliTests::testListMarkdown()
{
    seed();

    std::string output;
    const int code = runCli({"killfeed-report", "list", "--db", QString::fromStdString(dbPath())}, output);
    QCOMPARE(code, 0);

    const QString text = QString::fromStdString(output);
    QVERIFY(text.startsWith(QStringLiteral("# Killfeed Events\n")));
    QVERIFY(text.contains(QStringLiteral("Showing 1-3 of 3")));
    QVERIFY(!text.contains(QStringLiteral("(more available)")));
    QVERIFY(text.contains(QStringLiteral("(Combat, server) Kelvin destroyed TestPilot @ Lorville, Hurston")));
    QVERIFY(text.contains(QStringLiteral("  - weapon: KSAR_Rifle_Energy_01")));
    // Newest first.
    QVERIFY(text.indexOf(QStringLiteral("Kelvin destroyed TestPilot")) < text.indexOf(QStringLiteral("TestPilot destroyed Outlaw")));

    runCli({"killfeed-report", "list", "--player-only", "--db", QString::fromStdString(dbPath())}, output);
    const QString playerText = QString::fromStdString(output);
    QVERIFY(playerText.startsWith(QStringLiteral("# Killfeed Events (player involved)")));
    QVERIFY(!playerText.contains(QStringLiteral("Bystander")));
}

void ReportCliTests::testListJsonPagination()
{
    seed();

    std::string output;
    const int code = runCli({"killfeed-report", "list", "--limit", "2", "--format", "json",
                             "--db", QString::fromStdString(dbPath())}, output);
    QCOMPARE(code, 0);

    const auto parsed = nlohmann::json::parse(output);
    QCOMPARE(parsed.at("total").get<int>(), 3);
    QCOMPARE(parsed.at("limit").get<int>(), 2);
    QVERIFY(parsed.at("hasMore").get<bool>());
    QCOMPARE(static_cast<int>(parsed.at("events").size()), 2);
    QVERIFY(!parsed.contains("query"));

    runCli({"killfeed-report", "list", "--limit", "2", "--offset", "2", "--format", "json",
            "--db", QString::fromStdString(dbPath())}, output);
    const auto last = nlohmann::json::parse(output);
    QVERIFY(!last.at("hasMore").get<bool>());
    QCOMPARE(static_cast<int>(last.at("events").size()), 1);
}

void ReportCliTests::testSearch()
{
    seed();

    std::string output;
    int code = runCli({"killfeed-report", "search", "kelv", "--format", "json",
                       "--db", QString::fromStdString(dbPath())}, output);
    QCOMPARE(code, 0);
    const auto parsed = nlohmann::json::parse(output);
    QCOMPARE(parsed.at("total").get<int>(), 2);
    QCOMPARE(QString::fromStdString(parsed.at("query").get<std::string>()), QStringLiteral("kelv"));

    code = runCli({"killfeed-report", "search", "--db", QString::fromStdString(dbPath()), "zzz"}, output);
    QCOMPARE(code, 0);
    QVERIFY(QString::fromStdString(output).startsWith(QStringLiteral("# Killfeed Search: zzz")));
    QVERIFY(QString::fromStdString(output).contains(QStringLiteral("No events found.")));

    code = runCli({"killfeed-report", "search", "--db", QString::fromStdString(dbPath())}, output);
    QCOMPARE(code, 1);
}

void ReportCliTests::testStatsJson()
{
    seed();

    std::string output;
    const int code = runCli({"killfeed-report", "stats", "--format", "json",
                             "--db", QString::fromStdString(dbPath())}, output);
    QCOMPARE(code, 0);

    const auto parsed = nlohmann::json::parse(output);
    QCOMPARE(parsed.at("totalEvents").get<int>(), 3);
    QCOMPARE(parsed.at("playerEvents").get<int>(), 2);
    QCOMPARE(parsed.at("bySource").at("local").get<int>(), 2);
    QCOMPARE(parsed.at("bySource").at("server").get<int>(), 1);
    QVERIFY(parsed.at("oldest").is_string());
    QCOMPARE(QString::fromStdString(parsed.at("database").get<std::string>()),
             QString::fromStdString(dbPath()));

    runCli({"killfeed-report", "stats", "--db", QString::fromStdString(dbPath())}, output);
    const QString text = QString::fromStdString(output);
    QVERIFY(text.startsWith(QStringLiteral("# Killfeed Store Statistics")));
    QVERIFY(text.contains(QStringLiteral("Total events: 3")));
    QVERIFY(text.contains(QStringLiteral("- server: 1")));
}

void ReportCliTests::testClearNeedsConfirmation()
{
    seed();

    std::string output;
    int code = runCli({"killfeed-report", "clear", "--db", QString::fromStdString(dbPath())}, output);
    QCOMPARE(code, 1);
    QVERIFY(QString::fromStdString(output).contains(QStringLiteral("Refusing to clear without --yes.")));

    code = runCli({"killfeed-report", "clear", "--yes", "--db", QString::fromStdString(dbPath())}, output);
    QCOMPARE(code, 0);
    QVERIFY(QString::fromStdString(output).contains(QStringLiteral("Cleared 3 events.")));

    killfeed::KillfeedStore store(dbPath());
    QCOMPARE(store.stats().totalEvents, 0);
}

void ReportCliTests::testUsageErrors_data()
{
    QTest::addColumn<QStringList>("args");
    QTest::addColumn<int>("expected");

    QTest::newRow("no command") << QStringList{QStringLiteral("killfeed-report")} << 1;
    QTest::newRow("unknown command") << QStringList{QStringLiteral("killfeed-report"), QStringLiteral("timeline")} << 1;
    QTest::newRow("bad format") << QStringList{QStringLiteral("killfeed-report"), QStringLiteral("list"),
                                               QStringLiteral("--format"), QStringLiteral("csv")} << 1;
    QTest::newRow("bad limit") << QStringList{QStringLiteral("killfeed-report"), QStringLiteral("list"),
                                              QStringLiteral("--limit"), QStringLiteral("-3")} << 1;
    QTest::newRow("unopenable db") << QStringList{QStringLiteral("killfeed-report"), QStringLiteral("list"),
                                                  QStringLiteral("--db"), QStringLiteral("/proc/killfeed/none.db")} << 2;
}

void ReportCliTests::testUsageErrors()
{
    QFETCH(QStringList, args);
    QFETCH(int, expected);

    if (!args.contains(QStringLiteral("--db"))) {
        args << QStringLiteral("--db") << QString::fromStdString(dbPath());
    }

    std::string output;
    QCOMPARE(runCli(args, output), expected);
}

void ReportCliTests::testDefaultDatabaseFromConfig()
{
    {
        killfeed::KillfeedStore store;
        store.setPlayerProvider([]() { return std::string("TestPilot"); });
        store.addEvent(makeEvent("default", 0, "TestPilot", "Outlaw"));
    }

    std::string output;
    const int code = runCli({"killfeed-report", "stats", "--format", "json"}, output);
    QCOMPARE(code, 0);
    const auto parsed = nlohmann::json::parse(output);
    QCOMPARE(parsed.at("totalEvents").get<int>(), 1);
    QCOMPARE(QString::fromStdString(parsed.at("database").get<std::string>()),
             QString::fromStdString(killfeed::defaultDatabasePath()));
}

QTEST_MAIN(ReportCliTests)
#include "test_report_cli.moc"
