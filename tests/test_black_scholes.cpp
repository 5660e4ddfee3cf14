#include <QtTest>
#include "quant/BlackScholesPricer.h"
#include "quant/PricingError.h"
#include <cmath>
#include <limits>

class TestBlackScholes : public QObject {
    Q_OBJECT

private slots:
    void testPutCallParity_data();
    void testPutCallParity();
    void testNearExpiryReturnsIntrinsic();
    void testShortExpiryConvergesToIntrinsic();
    void testInvalidInputsNameTheField_data();
    void testInvalidInputsNameTheField();
    void testDeltaRanges();
    void testCallPutShareGammaAndVega();
    void testGreeksMatchPrice();
    void testKnownPrice();
};

void TestBlackScholes::testPutCallParity_data() {
    QTest::addColumn<double>("S");
    QTest::addColumn<double>("K");
    QTest::addColumn<double>("T");
    QTest::addColumn<double>("r");
    QTest::addColumn<double>("v");

    QTest::newRow("atm") << 100.0 << 100.0 << 0.5 << 0.035 << 0.25;
    QTest::newRow("itm-call") << 120.0 << 100.0 << 1.0 << 0.05 << 0.40;
    QTest::newRow("otm-call") << 80.0 << 100.0 << 30.0 / 365.0 << 0.01 << 0.15;
    QTest::newRow("zero-rate") << 55.0 << 60.0 << 2.0 << 0.0 << 0.80;
    QTest::newRow("negative-rate") << 101.0 << 95.0 << 0.25 << -0.005 << 0.10;
}

void TestBlackScholes::testPutCallParity() {
    QFETCH(double, S);
    QFETCH(double, K);
    QFETCH(double, T);
    QFETCH(double, r);
    QFETCH(double, v);

    const double call = BlackScholesPricer::price(OptionKind::Call, S, K, T, r, v);
    const double put = BlackScholesPricer::price(OptionKind::Put, S, K, T, r, v);
    QVERIFY(std::abs((call - put) - (S - K * std::exp(-r * T))) < 1e-6);
}

void TestBlackScholes::testNearExpiryReturnsIntrinsic() {
    const double T = 1e-6;
    QCOMPARE(BlackScholesPricer::price(OptionKind::Call, 105.0, 100.0, T, 0.035, 0.3), 5.0);
    QCOMPARE(BlackScholesPricer::price(OptionKind::Put, 105.0, 100.0, T, 0.035, 0.3), 0.0);
    QCOMPARE(BlackScholesPricer::price(OptionKind::Put, 95.0, 100.0, T, 0.035, 0.3), 5.0);

    OptionGreeks call = BlackScholesPricer::greeks(OptionKind::Call, 105.0, 100.0, T, 0.035, 0.3);
    QCOMPARE(call.delta, 1.0);
    QCOMPARE(call.gamma, 0.0);
    QCOMPARE(call.vega, 0.0);

    OptionGreeks put = BlackScholesPricer::greeks(OptionKind::Put, 95.0, 100.0, T, 0.035, 0.3);
    QCOMPARE(put.delta, -1.0);

    OptionGreeks otmPut = BlackScholesPricer::greeks(OptionKind::Put, 105.0, 100.0, T, 0.035, 0.3);
    QCOMPARE(otmPut.delta, 0.0);
}

void TestBlackScholes::testShortExpiryConvergesToIntrinsic() {
    // Just above the intrinsic cut-off the formula itself must agree
    const double T = 2e-5;
    const double call = BlackScholesPricer::price(OptionKind::Call, 110.0, 100.0, T, 0.035, 0.3);
    const double put = BlackScholesPricer::price(OptionKind::Put, 90.0, 100.0, T, 0.035, 0.3);
    QVERIFY(std::abs(call - 10.0) < 1e-3);
    QVERIFY(std::abs(put - 10.0) < 1e-3);
}

void TestBlackScholes::testInvalidInputsNameTheField_data() {
    QTest::addColumn<double>("S");
    QTest::addColumn<double>("K");
    QTest::addColumn<double>("T");
    QTest::addColumn<double>("r");
    QTest::addColumn<double>("v");
    QTest::addColumn<QString>("field");

    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();

    QTest::newRow("zero spot") << 0.0 << 100.0 << 0.5 << 0.03 << 0.2 << "spot";
    QTest::newRow("negative spot") << -1.0 << 100.0 << 0.5 << 0.03 << 0.2 << "spot";
    QTest::newRow("nan spot") << nan << 100.0 << 0.5 << 0.03 << 0.2 << "spot";
    QTest::newRow("zero strike") << 100.0 << 0.0 << 0.5 << 0.03 << 0.2 << "strike";
    QTest::newRow("negative strike") << 100.0 << -5.0 << 0.5 << 0.03 << 0.2 << "strike";
    QTest::newRow("zero expiry") << 100.0 << 100.0 << 0.0 << 0.03 << 0.2 << "timeToExpiry";
    QTest::newRow("zero vol") << 100.0 << 100.0 << 0.5 << 0.03 << 0.0 << "volatility";
    QTest::newRow("inf vol") << 100.0 << 100.0 << 0.5 << 0.03 << inf << "volatility";
    QTest::newRow("nan rate") << 100.0 << 100.0 << 0.5 << nan << 0.2 << "rate";
}

void TestBlackScholes::testInvalidInputsNameTheField() {
    QFETCH(double, S);
    QFETCH(double, K);
    QFETCH(double, T);
    QFETCH(double, r);
    QFETCH(double, v);
    QFETCH(QString, field);

    bool thrown = false;
    try {
        BlackScholesPricer::price(OptionKind::Call, S, K, T, r, v);
    } catch (const PricingError& e) {
        thrown = true;
        QCOMPARE(QString::fromStdString(e.field()), field);
        QVERIFY(e.code() == MarketData::ErrorCode::InvalidInput);
    }
    QVERIFY(thrown);

    QVERIFY_EXCEPTION_THROWN(BlackScholesPricer::greeks(OptionKind::Put, S, K, T, r, v), PricingError);
}

void TestBlackScholes::testDeltaRanges() {
    for (double S = 20.0; S <= 300.0; S += 7.0) {
        for (double T : {1.0 / 365.0, 30.0 / 365.0, 1.0, 5.0}) {
            OptionGreeks call = BlackScholesPricer::greeks(OptionKind::Call, S, 100.0, T, 0.035, 0.5);
            OptionGreeks put = BlackScholesPricer::greeks(OptionKind::Put, S, 100.0, T, 0.035, 0.5);
            QVERIFY(call.delta >= 0.0 && call.delta <= 1.0);
            QVERIFY(put.delta >= -1.0 && put.delta <= 0.0);
            QVERIFY(call.gamma >= 0.0);
            QVERIFY(call.price >= 0.0);
            QVERIFY(put.price >= 0.0);
        }
    }
}

void TestBlackScholes::testCallPutShareGammaAndVega() {
    OptionGreeks call = BlackScholesPricer::greeks(OptionKind::Call, 101.0, 100.0, 0.25, 0.035, 0.28);
    OptionGreeks put = BlackScholesPricer::greeks(OptionKind::Put, 101.0, 100.0, 0.25, 0.035, 0.28);
    QVERIFY(std::abs(call.gamma - put.gamma) < 1e-12);
    QVERIFY(std::abs(call.vega - put.vega) < 1e-12);
    QVERIFY(std::abs((call.delta - put.delta) - 1.0) < 1e-6);
    QVERIFY(call.rho > 0.0);
    QVERIFY(put.rho < 0.0);
}

void TestBlackScholes::testGreeksMatchPrice() {
    const double price = BlackScholesPricer::price(OptionKind::Call, 101.0, 95.0, 0.5, 0.035, 0.3);
    OptionGreeks greeks = BlackScholesPricer::greeks(OptionKind::Call, 101.0, 95.0, 0.5, 0.035, 0.3);
    QCOMPARE(greeks.price, price);

    // Vega per 1% vol against a finite difference
    const double h = 1e-4;
    const double up = BlackScholesPricer::price(OptionKind::Call, 101.0, 95.0, 0.5, 0.035, 0.3 + h);
    const double down = BlackScholesPricer::price(OptionKind::Call, 101.0, 95.0, 0.5, 0.035, 0.3 - h);
    QVERIFY(std::abs(greeks.vega - (up - down) / (2 * h) / 100.0) < 1e-4);
}

void TestBlackScholes::testKnownPrice() {
    // Hull: S=42, K=40, r=10%, v=20%, T=0.5 -> call 4.76, put 0.81
    const double call = BlackScholesPricer::price(OptionKind::Call, 42.0, 40.0, 0.5, 0.10, 0.20);
    const double put = BlackScholesPricer::price(OptionKind::Put, 42.0, 40.0, 0.5, 0.10, 0.20);
    QVERIFY(std::abs(call - 4.76) < 0.01);
    QVERIFY(std::abs(put - 0.81) < 0.01);
}

QTEST_GUILESS_MAIN(TestBlackScholes)
#include "test_black_scholes.moc"
