#include <QtTest>
#include "quant/LadderBuilder.h"

class TestLadderBuilder : public QObject {
    Q_OBJECT

private slots:
    void testStrikeLadderAroundSpot();
    void testStrikeLadderRoundsToStep();
    void testStrikeLadderOddCount();
    void testStrikeLadderInvalidRequest();
    void testDefaultExpiryLadder();
    void testTargetDateReplacesZero();
    void testTargetDateInPastIgnored();
    void testTargetDateTodayIgnored();
    void testTargetMatchingExistingExpiry();
    void testParseTargetDate();
    void testYearsToExpiryFloorsToOneDay();
};

void TestLadderBuilder::testStrikeLadderAroundSpot() {
    const StrikeLadder strikes = StrikeLadderBuilder::build(101.0, 5.0, 10);
    const StrikeLadder expected = {125, 120, 115, 110, 105, 100, 95, 90, 85, 80};
    QCOMPARE(strikes, expected);
}

void TestLadderBuilder::testStrikeLadderRoundsToStep() {
    QCOMPARE(StrikeLadderBuilder::atmStrike(101.0), 100.0);
    QCOMPARE(StrikeLadderBuilder::atmStrike(103.0), 105.0);
    QCOMPARE(StrikeLadderBuilder::atmStrike(1234.0, 50.0), 1250.0);

    const StrikeLadder strikes = StrikeLadderBuilder::build(1234.0, 50.0, 4);
    const StrikeLadder expected = {1350, 1300, 1250, 1200};
    QCOMPARE(strikes, expected);
}

void TestLadderBuilder::testStrikeLadderOddCount() {
    const StrikeLadder strikes = StrikeLadderBuilder::build(50.0, 2.5, 5);
    const StrikeLadder expected = {55.0, 52.5, 50.0, 47.5, 45.0};
    QCOMPARE(strikes, expected);
}

void TestLadderBuilder::testStrikeLadderInvalidRequest() {
    QVERIFY(StrikeLadderBuilder::build(100.0, 0.0, 10).isEmpty());
    QVERIFY(StrikeLadderBuilder::build(100.0, -5.0, 10).isEmpty());
    QVERIFY(StrikeLadderBuilder::build(100.0, 5.0, 0).isEmpty());
    QVERIFY(StrikeLadderBuilder::build(0.0, 5.0, 10).isEmpty());
}

void TestLadderBuilder::testDefaultExpiryLadder() {
    const ExpiryLadder expected = {0, 30, 60, 90, 180};
    QCOMPARE(ExpiryLadderBuilder::defaultLadder(), expected);
    QCOMPARE(ExpiryLadderBuilder::build(QDate(2024, 6, 14)), expected);
}

void TestLadderBuilder::testTargetDateReplacesZero() {
    const QDate today(2024, 6, 14);
    const ExpiryLadder ladder = ExpiryLadderBuilder::build(today, today.addDays(45));
    const ExpiryLadder expected = {30, 45, 60, 90, 180};
    QCOMPARE(ladder, expected);

    const ExpiryLadder far = ExpiryLadderBuilder::build(today, today.addDays(400));
    const ExpiryLadder farExpected = {30, 60, 90, 180, 400};
    QCOMPARE(far, farExpected);
}

void TestLadderBuilder::testTargetDateInPastIgnored() {
    const QDate today(2024, 6, 14);
    QCOMPARE(ExpiryLadderBuilder::build(today, today.addDays(-3)), ExpiryLadderBuilder::defaultLadder());
}

void TestLadderBuilder::testTargetDateTodayIgnored() {
    const QDate today(2024, 6, 14);
    QCOMPARE(ExpiryLadderBuilder::build(today, today), ExpiryLadderBuilder::defaultLadder());
}

void TestLadderBuilder::testTargetMatchingExistingExpiry() {
    const QDate today(2024, 6, 14);
    const ExpiryLadder ladder = ExpiryLadderBuilder::build(today, today.addDays(60));
    const ExpiryLadder expected = {30, 60, 90, 180};
    QCOMPARE(ladder, expected);
}

void TestLadderBuilder::testParseTargetDate() {
    QCOMPARE(ExpiryLadderBuilder::parseTargetDate("2024-07-29"), QDate(2024, 7, 29));
    QCOMPARE(ExpiryLadderBuilder::parseTargetDate("  2024-07-29 "), QDate(2024, 7, 29));
    QVERIFY(!ExpiryLadderBuilder::parseTargetDate("not a date").isValid());
    QVERIFY(!ExpiryLadderBuilder::parseTargetDate("2024-13-40").isValid());
}

void TestLadderBuilder::testYearsToExpiryFloorsToOneDay() {
    QCOMPARE(ExpiryLadderBuilder::yearsToExpiry(0), 1.0 / 365.0);
    QCOMPARE(ExpiryLadderBuilder::yearsToExpiry(1), 1.0 / 365.0);
    QCOMPARE(ExpiryLadderBuilder::yearsToExpiry(73), 0.2);
}

QTEST_GUILESS_MAIN(TestLadderBuilder)
#include "test_ladder_builder.moc"
