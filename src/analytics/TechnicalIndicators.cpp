#include "analytics/TechnicalIndicators.h"
#include <algorithm>
#include <cmath>
#include <limits>

namespace triplersi {
namespace analytics {

double TechnicalIndicators::calculateRSI(const std::vector<double>& prices, int period) {
    if (period < 1 || prices.size() < static_cast<size_t>(period + 1)) {
        return std::numeric_limits<double>::quiet_NaN();
    }

    double avg_gain = 0.0;
    double avg_loss = 0.0;

    // 1. 초기 평균 (첫 period 기간)
    for (int i = 1; i <= period; ++i) {
        double change = prices[i] - prices[i-1];
        if (change > 0) avg_gain += change;
        else avg_loss += std::abs(change);
    }

    avg_gain /= period;
    avg_loss /= period;

    // 2. Wilder's Smoothing
    for (size_t i = period + 1; i < prices.size(); ++i) {
        double change = prices[i] - prices[i-1];
        double current_gain = (change > 0) ? change : 0.0;
        double current_loss = (change < 0) ? std::abs(change) : 0.0;

        avg_gain = ((avg_gain * (period - 1)) + current_gain) / period;
        avg_loss = ((avg_loss * (period - 1)) + current_loss) / period;
    }

    if (avg_loss < 0.0000001) {
        return avg_gain < 0.0000001 ? 50.0 : 100.0;
    }

    double rs = avg_gain / avg_loss;
    return 100.0 - (100.0 / (1.0 + rs));
}

std::vector<double> TechnicalIndicators::calculateEMAVector(
    const std::vector<double>& prices,
    int period
) {
    std::vector<double> ema_values;
    if (period < 1 || prices.size() < static_cast<size_t>(period)) return ema_values;

    double multiplier = 2.0 / (period + 1.0);

    double ema = 0.0;
    for (int i = 0; i < period; ++i) ema += prices[i];
    ema /= period;

    ema_values.push_back(ema);

    for (size_t i = period; i < prices.size(); ++i) {
        ema = (prices[i] - ema) * multiplier + ema;
        ema_values.push_back(ema);
    }

    return ema_values;
}

std::vector<HeikinAshiCandle> TechnicalIndicators::calculateHeikinAshi(const std::vector<Candle>& candles) {
    std::vector<HeikinAshiCandle> result;
    result.reserve(candles.size());

    for (size_t i = 0; i < candles.size(); ++i) {
        const auto& c = candles[i];
        HeikinAshiCandle ha;
        ha.close = (c.open + c.high + c.low + c.close) / 4.0;
        if (i == 0) {
            ha.open = (c.open + c.close) / 2.0;
        } else {
            ha.open = (result[i - 1].open + result[i - 1].close) / 2.0;
        }
        ha.high = std::max({ha.open, ha.close, c.high});
        ha.low = std::min({ha.open, ha.close, c.low});
        result.push_back(ha);
    }

    return result;
}

std::vector<Candle> TechnicalIndicators::toCandles(
    const std::vector<HeikinAshiCandle>& ha,
    const std::vector<Candle>& source
) {
    std::vector<Candle> out;
    const size_t n = std::min(ha.size(), source.size());
    out.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        Candle c = source[i];
        c.open = ha[i].open;
        c.high = ha[i].high;
        c.low = ha[i].low;
        c.close = ha[i].close;
        out.push_back(c);
    }
    return out;
}

std::vector<double> TechnicalIndicators::resampleCloses(const std::vector<double>& closes, int factor) {
    if (factor <= 1) {
        return closes;
    }

    std::vector<double> out;
    out.reserve(closes.size() / factor + 1);
    for (size_t i = 0; i < closes.size(); i += factor) {
        const size_t last = std::min(closes.size(), i + static_cast<size_t>(factor)) - 1;
        out.push_back(closes[last]);
    }
    return out;
}

} // namespace analytics
} // namespace triplersi
