#include "analytics/CandleSeries.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>

namespace triplersi {
namespace analytics {

CandleSeries::CandleSeries(const engine::IndicatorConfig& config)
    : config_(config)
{
}

void CandleSeries::seed(const std::vector<Candle>& candles) {
    std::lock_guard<std::mutex> lock(mutex_);
    candles_.clear();
    for (const auto& c : candles) {
        if (!c.closed) {
            continue;
        }
        candles_.push_back(c);
    }
    while (candles_.size() > static_cast<size_t>(std::max(1, config_.max_candles))) {
        candles_.pop_front();
    }
    LOG_INFO("Candle series seeded: {} bars", candles_.size());
}

bool CandleSeries::update(const Candle& candle) {
    if (!candle.closed) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!candles_.empty()) {
        auto& last = candles_.back();
        if (candle.open_time == last.open_time) {
            last = candle;
            return true;
        }
        if (candle.open_time < last.open_time) {
            LOG_WARN("Out-of-order candle ignored (open_time={}, last={})",
                     candle.open_time, last.open_time);
            return false;
        }
    }

    candles_.push_back(candle);
    while (candles_.size() > static_cast<size_t>(std::max(1, config_.max_candles))) {
        candles_.pop_front();
    }
    return true;
}

size_t CandleSeries::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return candles_.size();
}

std::vector<Candle> CandleSeries::snapshotCandles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<Candle>(candles_.begin(), candles_.end());
}

IndicatorSnapshot CandleSeries::buildSnapshot(int sl_lookback) const {
    const std::vector<Candle> candles = snapshotCandles();

    IndicatorSnapshot snap;
    snap.rsi.assign(config_.rsi_periods.size(), std::nan(""));
    if (candles.empty()) {
        return snap;
    }

    const Candle& last = candles.back();
    snap.close = last.close;
    snap.candle_open_time = last.open_time;
    snap.candle_close_time = last.close_time;

    // 1. Heikin-Ashi (옵션: HA 위에 한 번 더)
    auto ha = TechnicalIndicators::calculateHeikinAshi(candles);
    if (config_.double_heikin_ashi) {
        ha = TechnicalIndicators::calculateHeikinAshi(TechnicalIndicators::toCandles(ha, candles));
    }

    const auto& ha_last = ha.back();
    snap.ha_open = ha_last.open;
    snap.ha_high = ha_last.high;
    snap.ha_low = ha_last.low;
    snap.ha_close = ha_last.close;

    const size_t lookback = static_cast<size_t>(std::max(1, sl_lookback));
    const size_t from = ha.size() > lookback ? ha.size() - lookback : 0;
    double lowest = ha[from].low;
    double highest = ha[from].high;
    for (size_t i = from + 1; i < ha.size(); ++i) {
        lowest = std::min(lowest, ha[i].low);
        highest = std::max(highest, ha[i].high);
    }
    snap.ha_lowest_low = lowest;
    snap.ha_highest_high = highest;

    // 2. RSI (HA 종가 기준)
    std::vector<double> ha_closes;
    ha_closes.reserve(ha.size());
    for (const auto& h : ha) {
        ha_closes.push_back(h.close);
    }

    for (size_t i = 0; i < config_.rsi_periods.size(); ++i) {
        snap.rsi[i] = TechnicalIndicators::calculateRSI(ha_closes, config_.rsi_periods[i]);
    }

    const auto mtf_closes = TechnicalIndicators::resampleCloses(ha_closes, config_.mtf_factor);
    snap.rsi_mtf = TechnicalIndicators::calculateRSI(mtf_closes, config_.rsi_mtf_period);

    // 3. EMA + 기울기 (실제 종가 기준)
    std::vector<double> closes;
    closes.reserve(candles.size());
    for (const auto& c : candles) {
        closes.push_back(c.close);
    }

    const auto ema = TechnicalIndicators::calculateEMAVector(closes, config_.ema_period);
    if (!ema.empty()) {
        snap.ema = ema.back();
        const int slope_lookback = std::max(1, config_.ema_slope_lookback);
        if (ema.size() > static_cast<size_t>(slope_lookback)) {
            const double past = ema[ema.size() - 1 - slope_lookback];
            snap.ema_slope = (snap.ema - past) / slope_lookback;
        }
    }

    return snap;
}

} // namespace analytics
} // namespace triplersi
