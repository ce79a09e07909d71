#include <QtTest/QtTest>

#include <QTemporaryDir>

#include "daemon/killfeed_pipeline.hpp"

namespace {

const std::string kLogin =
    "<2024-01-02T03:00:00.000Z> [Notice] <Legacy login response> [CIG-net] User Login Success - Handle[TestPilot] - Time[1]";

const std::string kBoardAvenger =
    "<2024-01-02T03:01:00.000Z> [Notice] <InstancedInterior> [InstancedInterior] OnEntityLeaveZone - "
    "InstancedInterior [Hangar_GrimHex] [11] -> Entity [AEGS_Avenger_1234567] [1234567] -- "
    "m_openDoors[0], m_managerGEID[12], m_ownerGEID[TestPilot]";

const std::string kAvengerDestroyed =
    "<2024-01-02T03:04:05.000Z> [Notice] <Vehicle Destruction> CVehicle::OnAdvanceDestroyLevel: "
    "Vehicle 'AEGS_Avenger_1234567' [1234567] in zone 'GrimHex_002' [pos x: 10.0, y: 20.0, z: 30.0 "
    "vel x: 0, y: 0, z: 0] driven by 'unknown' [0] advanced from destroy level 0 to 2 caused by 'Kelvin' [200] "
    "with 'Combat' [Team_VehicleFeatures][Vehicle]";

const std::string kCorpse =
    "<2024-01-02T03:04:08.000Z> [Notice] <[ActorState] Corpse> [ACTOR STATE][SSCActorStateCVars::LogCorpse] "
    "Player 'TestPilot' <local client>: Running corpsify [Team_ActorTech][Actor]";

const std::string kLocalDead =
    "<2024-01-02T03:04:09.000Z> [Notice] <[ActorState] Dead> [ACTOR STATE][CSCActorControlStateDead::PrePhysicsUpdate] "
    "Actor 'TestPilot' [100] ejected from zone. Local player entered dead state [Team_ActorTech][Actor]";

class ImmediateProfileLookup : public killfeed::ProfileLookup
{
public:
    void lookup(const std::vector<std::string> &names, Callback callback) override
    {
        std::unordered_map<std::string, killfeed::ProfileData> profiles;
        for (const auto &name : names) {
            killfeed::ProfileData data;
            data.org = name + "_ORG";
            data.record = "record:" + name;
            profiles.emplace(name, data);
        }
        callback(profiles);
    }
};

} // namespace

class PipelineEndToEndTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void testDestructionThenDeathYieldsOneEvent();
    void testLastUserSurvivesRestart();
    void testEnrichmentUpdatesStoredEvent();
    void testResetSessionForgetsCorrelationState();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    killfeed::PipelineConfig config() const;
};

void PipelineEndToEndTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void PipelineEndToEndTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void PipelineEndToEndTests::init()
{
    QFile::remove(QString::fromStdString(config().databasePath));
}

killfeed::PipelineConfig PipelineEndToEndTests::config() const
{
    killfeed::PipelineConfig config;
    config.databasePath = (m_tempDir.path() + QStringLiteral("/pipeline.db")).toStdString();
    return config;
}

void PipelineEndToEndTests::testDestructionThenDeathYieldsOneEvent()
{
    killfeed::KillfeedPipeline pipeline(config());

    std::vector<killfeed::StoreNotification> notifications;
    pipeline.store().subscribe([&notifications](const killfeed::StoreNotification &n) { notifications.push_back(n); });

    pipeline.ingest(kLogin + "\n" + kBoardAvenger + "\n" + kAvengerDestroyed + "\n" + kCorpse + "\n" + kLocalDead);

    QCOMPARE(QString::fromStdString(pipeline.session().currentVehicle()), QStringLiteral("AEGS_Avenger"));
    QCOMPARE(static_cast<int>(notifications.size()), 2);
    QCOMPARE(notifications[0].change, killfeed::StoreChange::Added);
    QCOMPARE(notifications[1].change, killfeed::StoreChange::Updated);

    killfeed::EventQuery query;
    const auto page = pipeline.store().query(query);
    QCOMPARE(page.total, 1);

    const killfeed::KillEvent &event = page.events.front();
    QCOMPARE(QString::fromStdString(event.id), QStringLiteral("v_kill_AEGS_Avenger_1234567"));
    QCOMPARE(event.killers, std::vector<std::string>{"Kelvin"});
    QCOMPARE(event.victims, std::vector<std::string>{"TestPilot"});
    QCOMPARE(event.deathType, killfeed::DeathType::Hard);
    QVERIFY(event.isPlayerInvolved);
    QCOMPARE(QString::fromStdString(event.location), QStringLiteral("GrimHEX, Yela"));
    QCOMPARE(QString::fromStdString(event.eventDescription),
             QStringLiteral("Kelvin destroyed TestPilot's AEGS Avenger"));

    QCOMPARE(pipeline.mirror().size(), 1);
    QCOMPARE(pipeline.mirror().events().front().victims, std::vector<std::string>{"TestPilot"});
    QCOMPARE(pipeline.scanner().counters().preventedDuplicates, 1LL);
    QCOMPARE(pipeline.correlator().correlatedDeaths(), 1);
}

void PipelineEndToEndTests::testLastUserSurvivesRestart()
{
    {
        killfeed::KillfeedPipeline pipeline(config());
        pipeline.ingest(kLogin);
    }

    killfeed::KillfeedPipeline restarted(config());
    QCOMPARE(QString::fromStdString(restarted.session().player()), QStringLiteral("TestPilot"));
    QCOMPARE(QString::fromStdString(*restarted.store().getMeta("last_user")), QStringLiteral("TestPilot"));
}

void PipelineEndToEndTests::testEnrichmentUpdatesStoredEvent()
{
    killfeed::KillfeedPipeline pipeline(config(), std::make_unique<ImmediateProfileLookup>());

    pipeline.ingest(kLogin + "\n" + kBoardAvenger + "\n" + kAvengerDestroyed + "\n" + kCorpse);

    const auto stored = pipeline.store().getEventById("v_kill_AEGS_Avenger_1234567");
    QVERIFY(stored.has_value());
    QCOMPARE(stored->victims, std::vector<std::string>{"TestPilot"});
    QCOMPARE(QString::fromStdString(stored->attackerOrg), QStringLiteral("Kelvin_ORG"));
    QCOMPARE(QString::fromStdString(stored->victimRecord), QStringLiteral("record:TestPilot"));
    QCOMPARE(pipeline.store().stats().totalEvents, 1);
}

void PipelineEndToEndTests::testResetSessionForgetsCorrelationState()
{
    killfeed::KillfeedPipeline pipeline(config());
    pipeline.ingest(kLogin + "\n" + kBoardAvenger + "\n" + kAvengerDestroyed);
    QCOMPARE(pipeline.correlator().openPlaceholderCount(), 1);

    pipeline.resetSession();

    QCOMPARE(pipeline.correlator().openPlaceholderCount(), 0);
    QCOMPARE(QString::fromStdString(pipeline.session().currentVehicle()), QStringLiteral("Unknown"));
    QVERIFY(!pipeline.session().hasCurrentVehicle());
    QVERIFY(pipeline.zones().currentLocation().empty());
    QCOMPARE(QString::fromStdString(pipeline.session().player()), QStringLiteral("TestPilot"));

    // The death arrives after the reset and finds nothing to fill.
    pipeline.ingest(kCorpse);
    const auto stored = pipeline.store().getEventById("v_kill_AEGS_Avenger_1234567");
    QVERIFY(stored.has_value());
    QCOMPARE(stored->victims, std::vector<std::string>{"AEGS_Avenger"});
}

QTEST_MAIN(PipelineEndToEndTests)
#include "test_pipeline_end_to_end.moc"
