#include <QtTest>
#include "quant/OptionChainGenerator.h"
#include "quant/PricingError.h"
#include "quant/VolatilityEstimator.h"
#include <cmath>
#include <limits>

using MarketData::ExpirySlice;
using MarketData::OptionChainSnapshot;
using MarketData::OptionContract;

class TestOptionChainGenerator : public QObject {
    Q_OBJECT

private slots:
    void testExpiryKeysMatchLadder();
    void testContractsFollowStrikeOrder();
    void testInTheMoneyFlags();
    void testPremiumFloor();
    void testCorruptedStrikeBecomesPlaceholder();
    void testInvalidSpotFailsWholeChain();
    void testEndToEndAbcChain();
    void testJsonShape();
};

namespace {

OptionChainSnapshot defaultChain(double spot = 101.0, double vol = 0.28) {
    OptionChainGenerator generator;
    return generator.generate("ABC", spot, vol, 0.035,
                              StrikeLadderBuilder::build(spot),
                              ExpiryLadderBuilder::defaultLadder());
}

} // namespace

void TestOptionChainGenerator::testExpiryKeysMatchLadder() {
    const OptionChainSnapshot snapshot = defaultChain();
    QCOMPARE(snapshot.expiries.keys(), QList<int>({0, 30, 60, 90, 180}));

    OptionChainGenerator generator;
    const ExpiryLadder custom = {30, 45, 60, 90, 180};
    const OptionChainSnapshot other = generator.generate("ABC", 101.0, 0.28, 0.035,
                                                         StrikeLadderBuilder::build(101.0), custom);
    QCOMPARE(other.expiries.keys(), QList<int>({30, 45, 60, 90, 180}));
    QCOMPARE(other.placeholderCount, 0);
}

void TestOptionChainGenerator::testContractsFollowStrikeOrder() {
    const StrikeLadder strikes = StrikeLadderBuilder::build(101.0);
    const OptionChainSnapshot snapshot = defaultChain();
    for (const ExpirySlice& slice : snapshot.expiries) {
        QCOMPARE(slice.calls.size(), strikes.size());
        QCOMPARE(slice.puts.size(), strikes.size());
        for (int i = 0; i < strikes.size(); ++i) {
            QCOMPARE(slice.calls[i].strike, strikes[i]);
            QCOMPARE(slice.puts[i].strike, strikes[i]);
        }
    }
}

void TestOptionChainGenerator::testInTheMoneyFlags() {
    const OptionChainSnapshot snapshot = defaultChain(101.0);
    for (const ExpirySlice& slice : snapshot.expiries) {
        for (const OptionContract& call : slice.calls) {
            QCOMPARE(call.inTheMoney, 101.0 > call.strike);
            QVERIFY(call.delta >= 0.0 && call.delta <= 1.0);
        }
        for (const OptionContract& put : slice.puts) {
            QCOMPARE(put.inTheMoney, 101.0 < put.strike);
            QVERIFY(put.delta >= -1.0 && put.delta <= 0.0);
        }
    }

    // Spot exactly on a strike: neither side is in the money there
    const OptionChainSnapshot onStrike = defaultChain(100.0);
    const ExpirySlice& slice = onStrike.expiries.value(30);
    QVERIFY(slice.callAt(100.0));
    QVERIFY(!slice.callAt(100.0)->inTheMoney);
    QVERIFY(!slice.putAt(100.0)->inTheMoney);
}

void TestOptionChainGenerator::testPremiumFloor() {
    // Deep out of the money at low vol and one day: theoretical value ~0
    OptionChainGenerator generator;
    const OptionChainSnapshot snapshot = generator.generate("ABC", 100.0, 0.10, 0.035,
                                                            {200.0, 100.0, 20.0}, {0});
    const ExpirySlice& slice = snapshot.expiries.value(0);
    QCOMPARE(slice.callAt(200.0)->price, OptionChainGenerator::MIN_PREMIUM);
    QCOMPARE(slice.putAt(20.0)->price, OptionChainGenerator::MIN_PREMIUM);
    QVERIFY(!slice.callAt(200.0)->placeholder);
    for (const OptionContract& c : slice.calls) QVERIFY(c.price >= OptionChainGenerator::MIN_PREMIUM);
    for (const OptionContract& p : slice.puts) QVERIFY(p.price >= OptionChainGenerator::MIN_PREMIUM);
}

void TestOptionChainGenerator::testCorruptedStrikeBecomesPlaceholder() {
    StrikeLadder strikes = StrikeLadderBuilder::build(101.0);
    const OptionChainSnapshot clean = defaultChain();

    strikes[3] = std::numeric_limits<double>::quiet_NaN();
    strikes[7] = -5.0;

    OptionChainGenerator generator;
    const OptionChainSnapshot snapshot = generator.generate("ABC", 101.0, 0.28, 0.035, strikes,
                                                            ExpiryLadderBuilder::defaultLadder());

    QCOMPARE(snapshot.placeholderCount, 2 * snapshot.expiries.size());

    for (auto it = snapshot.expiries.constBegin(); it != snapshot.expiries.constEnd(); ++it) {
        const ExpirySlice& slice = it.value();
        const ExpirySlice& reference = clean.expiries.value(it.key());
        for (int i = 0; i < strikes.size(); ++i) {
            if (i == 3 || i == 7) {
                QVERIFY(slice.calls[i].placeholder);
                QVERIFY(slice.puts[i].placeholder);
                QCOMPARE(slice.calls[i].price, OptionChainGenerator::MIN_PREMIUM);
                QCOMPARE(slice.calls[i].delta, 0.0);
                QCOMPARE(slice.puts[i].gamma, 0.0);
                QVERIFY(!slice.calls[i].inTheMoney);
                QVERIFY(!slice.puts[i].inTheMoney);
            } else {
                QVERIFY(!slice.calls[i].placeholder);
                QCOMPARE(slice.calls[i].price, reference.calls[i].price);
                QCOMPARE(slice.puts[i].delta, reference.puts[i].delta);
            }
        }
    }
}

void TestOptionChainGenerator::testInvalidSpotFailsWholeChain() {
    OptionChainGenerator generator;
    const StrikeLadder strikes = {100.0};
    const ExpiryLadder expiries = {30};
    QVERIFY_EXCEPTION_THROWN(generator.generate("ABC", 0.0, 0.3, 0.035, strikes, expiries), PricingError);
    QVERIFY_EXCEPTION_THROWN(generator.generate("ABC", -4.0, 0.3, 0.035, strikes, expiries), PricingError);

    try {
        generator.generate("ABC", std::numeric_limits<double>::quiet_NaN(), 0.3, 0.035, strikes, expiries);
        QFAIL("expected PricingError");
    } catch (const PricingError& e) {
        QCOMPARE(QString::fromStdString(e.field()), QString("spot"));
    }
}

void TestOptionChainGenerator::testEndToEndAbcChain() {
    // 31 closes ending at 101
    QVector<double> closes;
    for (int i = 0; i < 31; ++i) {
        closes.append(i == 30 ? 101.0 : 100.0 + ((i % 3) - 1) * 1.5);
    }
    const double spot = closes.last();
    const double vol = VolatilityEstimator::clampForPricing(VolatilityEstimator::historicalVolatilityOr(closes));
    QVERIFY(vol >= 0.10 && vol <= 0.80);

    OptionChainGenerator generator;
    const OptionChainSnapshot snapshot = generator.generate("ABC", spot, vol, 0.035,
                                                            StrikeLadderBuilder::build(spot),
                                                            ExpiryLadderBuilder::defaultLadder());
    QCOMPARE(snapshot.ticker, QString("ABC"));
    QCOMPARE(snapshot.spot, 101.0);

    const OptionContract* call = snapshot.expiries.value(30).callAt(100.0);
    QVERIFY(call != nullptr);
    QVERIFY(call->inTheMoney);
    QVERIFY(call->price > 1.0);
    QVERIFY(call->delta > 0.5);

    const OptionContract* put = snapshot.expiries.value(30).putAt(100.0);
    QVERIFY(put != nullptr);
    QVERIFY(!put->inTheMoney);
}

void TestOptionChainGenerator::testJsonShape() {
    OptionChainSnapshot snapshot = defaultChain();
    snapshot.customDate = "2024-07-29";
    const QJsonObject json = snapshot.toJson();

    QCOMPARE(json["ticker"].toString(), QString("ABC"));
    QCOMPARE(json["price"].toDouble(), 101.0);
    QCOMPARE(json["customDate"].toString(), QString("2024-07-29"));

    const QJsonObject chain = json["optionChain"].toObject();
    QCOMPARE(chain.keys().size(), 5);
    QVERIFY(chain.contains("30"));
    const QJsonArray calls = chain["30"].toObject()["calls"].toArray();
    QCOMPARE(calls.size(), 10);
    QVERIFY(calls.first().toObject().contains("inTheMoney"));

    snapshot.customDate.clear();
    QVERIFY(snapshot.toJson()["customDate"].isNull());
}

QTEST_GUILESS_MAIN(TestOptionChainGenerator)
#include "test_option_chain_generator.moc"
