#include <QtTest/QtTest>

#include "common/json_utils.hpp"
#include "daemon/kill_description.hpp"

Q_DECLARE_METATYPE(killfeed::DeathType)

class KillDescriptionTests : public QObject
{
    Q_OBJECT
private slots:
    void testDetermineDeathType_data();
    void testDetermineDeathType();
    void testSelfInflictedPolicy();
    void testFormatDescription_data();
    void testFormatDescription();
    void testPlaceholderVictim();
    void testJoinNames();
};

void KillDescriptionTests::testDetermineDeathType_data()
{
    QTest::addColumn<int>("level");
    QTest::addColumn<QString>("damageType");
    QTest::addColumn<QString>("causedBy");
    QTest::addColumn<QString>("driver");
    QTest::addColumn<killfeed::DeathType>("expected");

    QTest::newRow("collision by self") << 2 << QStringLiteral("Collision") << QStringLiteral("Pilot")
                                       << QStringLiteral("Pilot") << killfeed::DeathType::Crash;
    QTest::newRow("collision by other") << 2 << QStringLiteral("Collision") << QStringLiteral("Rammer")
                                        << QStringLiteral("Pilot") << killfeed::DeathType::Collision;
    QTest::newRow("crash unknown cause") << 1 << QStringLiteral("Crash") << QStringLiteral("unknown")
                                         << QString() << killfeed::DeathType::Crash;
    QTest::newRow("bleed out beats level") << 2 << QStringLiteral("BleedOut") << QStringLiteral("Environment")
                                           << QString() << killfeed::DeathType::BleedOut;
    QTest::newRow("suffocation") << 0 << QStringLiteral("SuffocationDamage") << QStringLiteral("Environment")
                                 << QString() << killfeed::DeathType::Suffocation;
    QTest::newRow("soft death") << 1 << QStringLiteral("Combat") << QStringLiteral("Kelvin")
                                << QStringLiteral("Pilot") << killfeed::DeathType::Soft;
    QTest::newRow("hard death") << 2 << QStringLiteral("Combat") << QStringLiteral("Kelvin")
                                << QStringLiteral("Pilot") << killfeed::DeathType::Hard;
    QTest::newRow("hard death self") << 2 << QStringLiteral("Combat") << QStringLiteral("unknown")
                                     << QString() << killfeed::DeathType::Hard;
    QTest::newRow("environment") << 0 << QStringLiteral("Fall") << QStringLiteral("Environment")
                                 << QString() << killfeed::DeathType::Unknown;
    QTest::newRow("combat") << 0 << QStringLiteral("Bullet") << QStringLiteral("Kelvin")
                            << QString() << killfeed::DeathType::Combat;
}

void KillDescriptionTests::testDetermineDeathType()
{
    QFETCH(int, level);
    QFETCH(QString, damageType);
    QFETCH(QString, causedBy);
    QFETCH(QString, driver);
    QFETCH(killfeed::DeathType, expected);

    const auto actual = killfeed::determineDeathType(level,
                                                     damageType.toStdString(),
                                                     causedBy.toStdString(),
                                                     driver.toStdString());
    QCOMPARE(QString::fromStdString(killfeed::toDeathTypeString(actual)),
             QString::fromStdString(killfeed::toDeathTypeString(expected)));
}

void KillDescriptionTests::testSelfInflictedPolicy()
{
    QCOMPARE(killfeed::determineDeathType(0, "Bullet", "Pilot", "Pilot"), killfeed::DeathType::Unknown);
    QCOMPARE(killfeed::determineDeathType(0, "Bullet", "Pilot", "Pilot", killfeed::SelfInflictedPolicy::Crash),
             killfeed::DeathType::Crash);
}

void KillDescriptionTests::testFormatDescription_data()
{
    QTest::addColumn<QStringList>("killers");
    QTest::addColumn<QStringList>("victims");
    QTest::addColumn<QString>("vehicleType");
    QTest::addColumn<QString>("vehicleModel");
    QTest::addColumn<killfeed::DeathType>("deathType");
    QTest::addColumn<QString>("expected");

    QTest::newRow("hard with craft")
        << QStringList{QStringLiteral("Kelvin")} << QStringList{QStringLiteral("TestPilot")}
        << QStringLiteral("Avenger Titan") << QStringLiteral("AEGS_Avenger") << killfeed::DeathType::Hard
        << QStringLiteral("Kelvin destroyed TestPilot's AEGS Avenger");
    QTest::newRow("soft placeholder")
        << QStringList{QStringLiteral("Kelvin")} << QStringList{QStringLiteral("AEGS_Avenger")}
        << QStringLiteral("Avenger_Titan") << QStringLiteral("AEGS_Avenger") << killfeed::DeathType::Soft
        << QStringLiteral("Kelvin disabled Avenger Titan");
    QTest::newRow("crash")
        << QStringList{QStringLiteral("unknown")} << QStringList{QStringLiteral("TestPilot")}
        << QStringLiteral("Cutlass") << QStringLiteral("DRAK_Cutlass") << killfeed::DeathType::Crash
        << QStringLiteral("TestPilot (DRAK Cutlass) crashed");
    QTest::newRow("collision without killer")
        << QStringList{QStringLiteral("unknown")} << QStringList{QStringLiteral("TestPilot")}
        << QString() << QString() << killfeed::DeathType::Collision
        << QStringLiteral("A collision occurred involving TestPilot");
    QTest::newRow("collision placeholder")
        << QStringList{QStringLiteral("Rammer")} << QStringList{QStringLiteral("DRAK_Cutlass")}
        << QStringLiteral("Cutlass") << QStringLiteral("DRAK_Cutlass") << killfeed::DeathType::Collision
        << QStringLiteral("Rammer's vessel collided with Cutlass");
    QTest::newRow("actor combat")
        << QStringList{QStringLiteral("Kelvin")} << QStringList{QStringLiteral("TestPilot")}
        << QStringLiteral("Player") << QStringLiteral("Player") << killfeed::DeathType::Combat
        << QStringLiteral("Kelvin destroyed TestPilot");
    QTest::newRow("bled out")
        << QStringList{QStringLiteral("Environment")} << QStringList{QStringLiteral("TestPilot")}
        << QString() << QString() << killfeed::DeathType::BleedOut
        << QStringLiteral("TestPilot bled out");
    QTest::newRow("environmental unknown")
        << QStringList{QStringLiteral("Environment")} << QStringList{QStringLiteral("TestPilot")}
        << QString() << QString() << killfeed::DeathType::Unknown
        << QStringLiteral("TestPilot succumbed to environmental factors");
    QTest::newRow("multiple killers")
        << QStringList{QStringLiteral("Kelvin"), QStringLiteral("Wing")} << QStringList{QStringLiteral("TestPilot")}
        << QString() << QString() << killfeed::DeathType::Unknown
        << QStringLiteral("Kelvin + Wing defeated TestPilot");
}

void KillDescriptionTests::testFormatDescription()
{
    QFETCH(QStringList, killers);
    QFETCH(QStringList, victims);
    QFETCH(QString, vehicleType);
    QFETCH(QString, vehicleModel);
    QFETCH(killfeed::DeathType, deathType);
    QFETCH(QString, expected);

    std::vector<std::string> killerNames;
    for (const auto &name : killers) {
        killerNames.push_back(name.toStdString());
    }
    std::vector<std::string> victimNames;
    for (const auto &name : victims) {
        victimNames.push_back(name.toStdString());
    }

    const std::string description = killfeed::formatKillDescription(killerNames,
                                                                     victimNames,
                                                                     vehicleType.toStdString(),
                                                                     vehicleModel.toStdString(),
                                                                     deathType);
    QCOMPARE(QString::fromStdString(description), expected);
}

void KillDescriptionTests::testPlaceholderVictim()
{
    QVERIFY(killfeed::isPlaceholderVictim({"AEGS_Avenger"}, "AEGS_Avenger"));
    QVERIFY(!killfeed::isPlaceholderVictim({"TestPilot"}, "AEGS_Avenger"));
    QVERIFY(!killfeed::isPlaceholderVictim({"AEGS_Avenger", "TestPilot"}, "AEGS_Avenger"));
    QVERIFY(!killfeed::isPlaceholderVictim({""}, ""));
}

void KillDescriptionTests::testJoinNames()
{
    QCOMPARE(QString::fromStdString(killfeed::joinNames({"A", "B", "C"})), QStringLiteral("A + B + C"));
    QCOMPARE(QString::fromStdString(killfeed::joinNames({"A", "B"}, ", ")), QStringLiteral("A, B"));
    QVERIFY(killfeed::joinNames({}).empty());
}

QTEST_MAIN(KillDescriptionTests)
#include "test_kill_description.moc"
