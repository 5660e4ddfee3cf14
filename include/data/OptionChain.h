#ifndef OPTIONCHAIN_H
#define OPTIONCHAIN_H

#include <QJsonArray>
#include <QJsonObject>
#include <QMap>
#include <QString>
#include <QVector>

namespace MarketData {

/**
 * @brief One priced contract of a generated chain
 */
struct OptionContract {
    double strike = 0.0;
    double price = 0.0;
    double delta = 0.0;
    double gamma = 0.0;
    double theta = 0.0;     // per day
    double vega = 0.0;      // per 1% vol
    double rho = 0.0;       // per 1% rate
    bool inTheMoney = false;
    bool placeholder = false;

    QJsonObject toJson() const {
        QJsonObject obj;
        obj["strike"] = strike;
        obj["price"] = price;
        obj["delta"] = delta;
        obj["gamma"] = gamma;
        obj["theta"] = theta;
        obj["vega"] = vega;
        obj["rho"] = rho;
        obj["inTheMoney"] = inTheMoney;
        return obj;
    }
};

/**
 * @brief Calls and puts for one expiry, in strike ladder order
 */
struct ExpirySlice {
    QVector<OptionContract> calls;
    QVector<OptionContract> puts;

    const OptionContract* callAt(double strike) const { return find(calls, strike); }
    const OptionContract* putAt(double strike) const { return find(puts, strike); }

    QJsonObject toJson() const {
        QJsonArray callArr;
        QJsonArray putArr;
        for (const auto& c : calls) callArr.append(c.toJson());
        for (const auto& p : puts) putArr.append(p.toJson());
        QJsonObject obj;
        obj["calls"] = callArr;
        obj["puts"] = putArr;
        return obj;
    }

private:
    static const OptionContract* find(const QVector<OptionContract>& side, double strike) {
        for (const auto& contract : side) {
            if (contract.strike == strike) return &contract;
        }
        return nullptr;
    }
};

/**
 * @brief Full chain for a ticker, keyed by days to expiry
 */
struct OptionChainSnapshot {
    QString ticker;
    double spot = 0.0;
    double volatility = 0.0;
    double riskFreeRate = 0.0;
    QString customDate;                 // echo of the caller's target date, if any
    QMap<int, ExpirySlice> expiries;    // daysToExpiry -> slice
    int placeholderCount = 0;

    QJsonObject toJson() const {
        QJsonObject chain;
        for (auto it = expiries.constBegin(); it != expiries.constEnd(); ++it) {
            chain[QString::number(it.key())] = it.value().toJson();
        }
        QJsonObject obj;
        obj["ticker"] = ticker;
        obj["price"] = spot;
        obj["volatility"] = volatility;
        obj["optionChain"] = chain;
        obj["customDate"] = customDate.isEmpty() ? QJsonValue(QJsonValue::Null)
                                                 : QJsonValue(customDate);
        return obj;
    }
};

} // namespace MarketData

#endif // OPTIONCHAIN_H
