#include <QtTest/QtTest>

#include "daemon/zone_classifier.hpp"

using killfeed::ZoneClassifier;

class ZoneClassifierTests : public QObject
{
    Q_OBJECT
private slots:
    void testCleanZoneId();
    void testClassify_data();
    void testClassify();
    void testDetermineSystem();
    void testPrimaryTypes();
    void testSecondaryTypes();
    void testDisplayNames_data();
    void testDisplayNames();
    void testDerivePrimaryZone();
    void testTotalOnEmptyInput();
};

void ZoneClassifierTests::testCleanZoneId()
{
    QCOMPARE(QString::fromStdString(ZoneClassifier::cleanZoneId("OOC_Stanton_2b_Daymar_0042")),
             QStringLiteral("OOC_Stanton_2b_Daymar"));
    QCOMPARE(QString::fromStdString(ZoneClassifier::cleanZoneId("OOC_Stanton_1")),
             QStringLiteral("OOC_Stanton_1"));
    QCOMPARE(QString::fromStdString(ZoneClassifier::cleanZoneId("  GrimHex_002  ")),
             QStringLiteral("GrimHex"));
    QCOMPARE(QString::fromStdString(ZoneClassifier::cleanZoneId("Lorville")),
             QStringLiteral("Lorville"));
}

void ZoneClassifierTests::testClassify_data()
{
    QTest::addColumn<QString>("zoneId");
    QTest::addColumn<bool>("primary");

    QTest::newRow("system") << "OOC_Stanton" << true;
    QTest::newRow("planet") << "OOC_Stanton_3" << true;
    QTest::newRow("moon") << "OOC_Stanton_2b" << true;
    QTest::newRow("pyro planet") << "OOC_Pyro_4" << true;
    QTest::newRow("jump point") << "JP_Stanton_Pyro" << true;
    QTest::newRow("named planet") << "microTech" << true;
    QTest::newRow("body poi") << "OOC_Stanton_2b_Daymar_0042" << false;
    QTest::newRow("station") << "GrimHex" << false;
    QTest::newRow("lagrange") << "CRU-L1" << false;
    QTest::newRow("unrecognized") << "SomethingNew_12" << false;
}

void ZoneClassifierTests::testClassify()
{
    QFETCH(QString, zoneId);
    QFETCH(bool, primary);

    const auto expected = primary ? killfeed::ZoneClassification::Primary
                                  : killfeed::ZoneClassification::Secondary;
    QCOMPARE(ZoneClassifier::classify(zoneId.toStdString()), expected);
}

void ZoneClassifierTests::testDetermineSystem()
{
    QCOMPARE(ZoneClassifier::determineSystem("OOC_Stanton_1a"), killfeed::StarSystem::Stanton);
    QCOMPARE(ZoneClassifier::determineSystem("Area18"), killfeed::StarSystem::Stanton);
    QCOMPARE(ZoneClassifier::determineSystem("OOC_Pyro_2"), killfeed::StarSystem::Pyro);
    QCOMPARE(ZoneClassifier::determineSystem("Ruin_Station"), killfeed::StarSystem::Pyro);
    QCOMPARE(ZoneClassifier::determineSystem("GrimHex"), killfeed::StarSystem::Unknown);
}

void ZoneClassifierTests::testPrimaryTypes()
{
    QCOMPARE(ZoneClassifier::determinePrimaryType("OOC_Stanton"), killfeed::PrimaryZoneType::System);
    QCOMPARE(ZoneClassifier::determinePrimaryType("OOC_Stanton_4"), killfeed::PrimaryZoneType::Planet);
    QCOMPARE(ZoneClassifier::determinePrimaryType("OOC_Stanton_4a"), killfeed::PrimaryZoneType::Moon);
    QCOMPARE(ZoneClassifier::determinePrimaryType("JP_Stanton_Pyro"), killfeed::PrimaryZoneType::JumpPoint);
    QCOMPARE(ZoneClassifier::determinePrimaryType("Hurston"), killfeed::PrimaryZoneType::Planet);
}

void ZoneClassifierTests::testSecondaryTypes()
{
    QCOMPARE(ZoneClassifier::determineSecondaryType("PortOlisar"), killfeed::SecondaryZoneType::Station);
    QCOMPARE(ZoneClassifier::determineSecondaryType("Lorville"), killfeed::SecondaryZoneType::LandingZone);
    QCOMPARE(ZoneClassifier::determineSecondaryType("Benson_Mining_Outpost"), killfeed::SecondaryZoneType::Outpost);
    QCOMPARE(ZoneClassifier::determineSecondaryType("R&R_CRU_L5"), killfeed::SecondaryZoneType::Station);
    QCOMPARE(ZoneClassifier::determineSecondaryType("Derelict_Reclaimer"), killfeed::SecondaryZoneType::Derelict);
    QCOMPARE(ZoneClassifier::determineSecondaryType("Checkmate"), killfeed::SecondaryZoneType::Poi);
}

void ZoneClassifierTests::testDisplayNames_data()
{
    QTest::addColumn<QString>("zoneId");
    QTest::addColumn<QString>("displayName");

    QTest::newRow("planet") << "OOC_Stanton_1" << "Hurston";
    QTest::newRow("moon") << "OOC_Stanton_2b" << "Daymar";
    QTest::newRow("unnamed moon") << "OOC_Stanton_3z" << "ArcCorp Z";
    QTest::newRow("pyro planet") << "OOC_Pyro_5" << "Pyro V";
    QTest::newRow("known station") << "GrimHex_001" << "GrimHEX";
    QTest::newRow("security post") << "SPK" << "Security Post Kareah";
    QTest::newRow("system") << "OOC_Stanton" << "Stanton System";
    QTest::newRow("generic") << "shubin_mining_facility" << "Shubin Mining Facility";
    QTest::newRow("empty") << "" << "Unknown";
}

void ZoneClassifierTests::testDisplayNames()
{
    QFETCH(QString, zoneId);
    QFETCH(QString, displayName);

    QCOMPARE(QString::fromStdString(ZoneClassifier::generateDisplayName(zoneId.toStdString())),
             displayName);
}

void ZoneClassifierTests::testDerivePrimaryZone()
{
    const auto fromPrefix = ZoneClassifier::derivePrimaryZone("OOC_Stanton_2b_Daymar_0042");
    QVERIFY(fromPrefix.has_value());
    QCOMPARE(QString::fromStdString(*fromPrefix), QStringLiteral("OOC_Stanton_2b"));

    const auto fromStation = ZoneClassifier::derivePrimaryZone("GrimHex");
    QVERIFY(fromStation.has_value());
    QCOMPARE(QString::fromStdString(*fromStation), QStringLiteral("OOC_Stanton_2c"));

    QVERIFY(!ZoneClassifier::derivePrimaryZone("Checkmate").has_value());
}

void ZoneClassifierTests::testTotalOnEmptyInput()
{
    QCOMPARE(QString::fromStdString(ZoneClassifier::cleanZoneId("")), QString());
    QCOMPARE(ZoneClassifier::classify(""), killfeed::ZoneClassification::Secondary);
    QCOMPARE(ZoneClassifier::determineSystem(""), killfeed::StarSystem::Unknown);
    QCOMPARE(ZoneClassifier::determineSecondaryType(""), killfeed::SecondaryZoneType::Poi);
    QVERIFY(!ZoneClassifier::derivePrimaryZone("").has_value());
}

QTEST_MAIN(ZoneClassifierTests)
#include "test_zone_classifier.moc"
