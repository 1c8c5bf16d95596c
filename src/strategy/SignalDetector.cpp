#include "strategy/SignalDetector.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>

namespace triplersi {
namespace strategy {

namespace {
bool allRsiValid(const IndicatorSnapshot& snapshot) {
    if (snapshot.rsi.empty()) {
        return false;
    }
    for (double v : snapshot.rsi) {
        if (std::isnan(v)) {
            return false;
        }
    }
    return true;
}
} // namespace

SignalDetector::SignalDetector(const engine::SignalConfig& config, ISignalSink* sink)
    : config_(config)
    , sink_(sink)
{
    LOG_INFO("SignalDetector: oversold {:.1f} / overbought {:.1f}, filters HA={} trend={} mtf={}, latch={}",
             config_.rsi_oversold, config_.rsi_overbought,
             config_.filter_ha, config_.filter_trend, config_.filter_mtf_rsi,
             config_.latch_policy == engine::SignalLatchPolicy::LATCHED ? "latched" : "reconfirm");
}

bool SignalDetector::rsiCondition(
    const IndicatorSnapshot& snapshot,
    Direction direction,
    const engine::SignalConfig& config
) {
    if (!allRsiValid(snapshot)) {
        return false;
    }

    if (direction == Direction::LONG) {
        return std::all_of(snapshot.rsi.begin(), snapshot.rsi.end(),
                           [&](double v) { return v < config.rsi_oversold; });
    }
    return std::all_of(snapshot.rsi.begin(), snapshot.rsi.end(),
                       [&](double v) { return v > config.rsi_overbought; });
}

bool SignalDetector::haConfirmation(const IndicatorSnapshot& snapshot, Direction direction) {
    if (direction == Direction::LONG) {
        return snapshot.ha_close > snapshot.ha_open;   // 양봉
    }
    return snapshot.ha_close < snapshot.ha_open;       // 음봉
}

bool SignalDetector::trendFilter(const IndicatorSnapshot& snapshot, Direction direction) {
    if (direction == Direction::LONG) {
        return snapshot.close > snapshot.ema && snapshot.ema_slope > 0.0;
    }
    return snapshot.close < snapshot.ema && snapshot.ema_slope < 0.0;
}

bool SignalDetector::mtfRsiFilter(const IndicatorSnapshot& snapshot, Direction direction) {
    if (direction == Direction::LONG) {
        return snapshot.rsi_mtf > 50.0;
    }
    return snapshot.rsi_mtf < 50.0;
}

std::optional<Signal> SignalDetector::update(const IndicatorSnapshot& snapshot) {
    const Timestamp now = snapshot.candle_close_time > 0 ? snapshot.candle_close_time : nowMs();

    std::optional<Signal> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        // RECONFIRM: 지표가 유효한데 조건이 깨졌으면 해제 (NaN 이면 유지)
        if (config_.latch_policy == engine::SignalLatchPolicy::RECONFIRM && allRsiValid(snapshot)) {
            if (state_.pending_long && !rsiCondition(snapshot, Direction::LONG, config_)) {
                LOG_DEBUG("LONG latch dropped (RSI condition no longer holds)");
                state_.pending_long = false;
                state_.long_armed_at = 0;
                state_.latches_dropped++;
            }
            if (state_.pending_short && !rsiCondition(snapshot, Direction::SHORT, config_)) {
                LOG_DEBUG("SHORT latch dropped (RSI condition no longer holds)");
                state_.pending_short = false;
                state_.short_armed_at = 0;
                state_.latches_dropped++;
            }
        }

        if (rsiCondition(snapshot, Direction::LONG, config_)) {
            arm(Direction::LONG, now);
        } else if (rsiCondition(snapshot, Direction::SHORT, config_)) {
            arm(Direction::SHORT, now);
        }

        if (state_.pending_long) {
            result = tryConfirm(snapshot, Direction::LONG, state_.long_armed_at, now);
            if (result) {
                state_.pending_long = false;
                state_.long_armed_at = 0;
            }
        } else if (state_.pending_short) {
            result = tryConfirm(snapshot, Direction::SHORT, state_.short_armed_at, now);
            if (result) {
                state_.pending_short = false;
                state_.short_armed_at = 0;
            }
        }

        if (result) {
            state_.signals_detected++;
        }
    }

    if (result) {
        LOG_INFO("Signal {} confirmed (confidence {:.0f}%)", toString(result->direction),
                 result->confidence * 100.0);
        if (sink_) {
            sink_->onSignal(*result);
        }
    }
    return result;
}

void SignalDetector::arm(Direction direction, Timestamp at) {
    if (direction == Direction::LONG) {
        if (state_.pending_short) {
            state_.pending_short = false;
            state_.short_armed_at = 0;
            state_.latches_dropped++;
        }
        // 이미 대기 중이면 최초 latch 시각 유지
        if (!state_.pending_long) {
            state_.latches_armed++;
            state_.pending_long = true;
            state_.long_armed_at = at;
            LOG_INFO("LONG latch armed (RSI oversold)");
        }
    } else {
        if (state_.pending_long) {
            state_.pending_long = false;
            state_.long_armed_at = 0;
            state_.latches_dropped++;
        }
        if (!state_.pending_short) {
            state_.latches_armed++;
            state_.pending_short = true;
            state_.short_armed_at = at;
            LOG_INFO("SHORT latch armed (RSI overbought)");
        }
    }
}

std::optional<Signal> SignalDetector::tryConfirm(
    const IndicatorSnapshot& snapshot,
    Direction direction,
    Timestamp armed_at,
    Timestamp now
) {
    Signal signal;
    signal.direction = direction;
    signal.detected_at = armed_at;
    signal.confirmed_at = now;
    signal.indicators = snapshot;
    signal.reasons.push_back(direction == Direction::LONG ? "RSI oversold" : "RSI overbought");

    double confidence = 0.4;
    int enabled = 0;
    int passed = 0;

    if (config_.filter_ha) {
        enabled++;
        if (!haConfirmation(snapshot, direction)) {
            return std::nullopt;
        }
        confidence += 0.3;
        passed++;
        signal.reasons.push_back(direction == Direction::LONG ? "HA green" : "HA red");
    }

    if (config_.filter_trend) {
        enabled++;
        if (!trendFilter(snapshot, direction)) {
            return std::nullopt;
        }
        confidence += 0.2;
        passed++;
        signal.reasons.push_back("EMA trend");
    }

    if (config_.filter_mtf_rsi) {
        enabled++;
        if (!mtfRsiFilter(snapshot, direction)) {
            return std::nullopt;
        }
        confidence += 0.1;
        passed++;
        signal.reasons.push_back("MTF RSI");
    }

    if (enabled > 0) {
        confidence = std::min(confidence + (static_cast<double>(passed) / enabled) * 0.3, 1.0);
    }
    signal.confidence = std::round(confidence * 100.0) / 100.0;
    return signal;
}

void SignalDetector::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.pending_long = false;
    state_.pending_short = false;
    state_.long_armed_at = 0;
    state_.short_armed_at = 0;
    LOG_INFO("SignalDetector reset");
}

SignalDetectorStatus SignalDetector::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

} // namespace strategy
} // namespace triplersi
