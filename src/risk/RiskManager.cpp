#include "risk/RiskManager.h"
#include "common/Logger.h"
#include "common/TickSizeHelper.h"
#include <algorithm>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace triplersi {
namespace risk {

RiskManager::RiskManager(const engine::RiskConfig& config)
    : config_(config)
{
    state_.trading_day = currentUtcDay();
    LOG_INFO("RiskManager initialized - risk/trade {:.2f}%, notional {:.2f}~{:.2f}, daily trades {}, "
             "daily loss {:.2f}, consecutive losses {}, emergency ceiling {:.2f}",
             config_.max_balance_risk * 100.0,
             config_.min_position_notional, config_.max_position_notional,
             config_.max_daily_trades, config_.max_daily_loss,
             config_.max_consecutive_losses, config_.emergency_stop_loss);
}

void RiskManager::setSymbolInfo(const SymbolInfo& info) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    symbol_info_ = info;
}

// ===== Position Sizing =====

Result<PositionSize> RiskManager::size(const Signal& signal, double balance, double stop) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    resetDailyIfNeeded();

    // 1) emergency latch
    if (state_.emergency_stop) {
        LOG_WARN("Position refused - emergency stop active: {}", state_.stop_reason);
        return Result<PositionSize>::fail(
            Error::systemic("EMERGENCY_STOP", "emergency stop active: " + state_.stop_reason));
    }

    // 2) daily limits
    if (isDailyLimitReached()) {
        LOG_WARN("Position refused - daily limits reached (trades {}/{}, pnl {:.2f}, consecutive losses {})",
                 state_.daily_trade_count, config_.max_daily_trades,
                 state_.daily_pnl, state_.consecutive_losses);
        return Result<PositionSize>::fail(Error::validation("DAILY_LIMIT", "daily limits reached"));
    }

    const double entry = signal.indicators.close;
    if (!(entry > 0.0) || !(balance > 0.0) || !(stop > 0.0)) {
        return Result<PositionSize>::fail(Error::validation(
            "INVALID_INPUT", "entry, balance and stop must be positive"));
    }

    // 3) stop must be on the loss side
    const double distance = (signal.direction == Direction::LONG) ? entry - stop : stop - entry;
    if (distance <= 0.0) {
        LOG_ERROR("Invalid stop loss {:.4f} for {} entry {:.4f}", stop, toString(signal.direction), entry);
        return Result<PositionSize>::fail(Error::validation(
            "INVALID_STOP", "stop loss is not on the loss side of entry"));
    }

    double risk_amount = balance * config_.max_balance_risk;
    double quantity = risk_amount / distance;
    double notional = quantity * entry;

    if (notional < config_.min_position_notional) {
        LOG_WARN("Position too small: {:.2f} < {:.2f}", notional, config_.min_position_notional);
        return Result<PositionSize>::fail(Error::validation(
            "NOTIONAL_TOO_SMALL", "computed notional below configured minimum"));
    }

    if (notional > config_.max_position_notional) {
        quantity = config_.max_position_notional / entry;
    }

    // 4) exchange step / minimums
    quantity = common::floorToStep(quantity, symbol_info_.step_size);
    notional = quantity * entry;
    risk_amount = quantity * distance;

    const double min_notional = std::max(config_.min_position_notional, symbol_info_.min_notional);
    if (quantity < symbol_info_.min_qty || notional + common::kTickEpsilon < min_notional) {
        LOG_WARN("Position below exchange minimum after rounding: qty {:.6f}, notional {:.2f}",
                 quantity, notional);
        return Result<PositionSize>::fail(Error::validation(
            "NOTIONAL_TOO_SMALL", "notional below exchange minimum after clamping"));
    }

    PositionSize ps;
    ps.quantity = quantity;
    ps.entry_price_estimate = entry;
    ps.stop_loss = stop;
    ps.take_profit = calculateTakeProfit(signal.direction, entry, stop);
    ps.risk_amount = risk_amount;
    ps.notional = notional;

    LOG_INFO("Position sized: {} {:.6f} @ {:.4f} (notional {:.2f}, risk {:.2f} = {:.2f}%), SL {:.4f}, TP {:.4f}",
             toString(signal.direction), ps.quantity, entry, ps.notional, ps.risk_amount,
             ps.risk_amount / balance * 100.0, ps.stop_loss, ps.take_profit);
    return Result<PositionSize>::ok(ps);
}

double RiskManager::calculateTakeProfit(Direction direction, double entry, double stop) const {
    if (config_.tp_mode == engine::TakeProfitMode::FIXED_PERCENT) {
        return direction == Direction::LONG
            ? entry * (1.0 + config_.tp_percent / 100.0)
            : entry * (1.0 - config_.tp_percent / 100.0);
    }

    const double tp_distance = std::fabs(entry - stop) * config_.tp_ratio;
    return direction == Direction::LONG ? entry + tp_distance : entry - tp_distance;
}

Status RiskManager::validateTrade(const Signal& signal, double balance, long long latency_ms) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    resetDailyIfNeeded();

    if (state_.emergency_stop) {
        return Status::fail(Error::systemic("EMERGENCY_STOP", "emergency stop active: " + state_.stop_reason));
    }
    if (isDailyLimitReached()) {
        return Status::fail(Error::validation("DAILY_LIMIT", "daily limits reached"));
    }
    if (signal.confidence < config_.min_confidence) {
        std::ostringstream oss;
        oss << "confidence too low: " << std::fixed << std::setprecision(2) << signal.confidence
            << " < " << config_.min_confidence;
        return Status::fail(Error::validation("LOW_CONFIDENCE", oss.str()));
    }
    if (balance < config_.min_balance) {
        std::ostringstream oss;
        oss << "balance " << std::fixed << std::setprecision(2) << balance
            << " below minimum " << config_.min_balance;
        return Status::fail(Error::validation("LOW_BALANCE", oss.str()));
    }
    if (latency_ms >= 0 && latency_ms > config_.max_latency_ms) {
        return Status::fail(Error::transient(
            "HIGH_LATENCY", "API latency " + std::to_string(latency_ms) + " ms above limit"));
    }
    return Status::ok();
}

// ===== Outcome Recording =====

void RiskManager::recordOutcome(
    Direction direction,
    double entry,
    double quantity,
    TradeResult result,
    double pnl
) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    resetDailyIfNeeded();

    state_.daily_trade_count++;
    state_.daily_pnl += pnl;
    state_.total_trades++;
    state_.total_pnl += pnl;

    if (result == TradeResult::LOSS) {
        state_.consecutive_losses++;
        state_.losing_trades++;
    } else {
        state_.consecutive_losses = 0;
        if (result == TradeResult::WIN) {
            state_.winning_trades++;
        }
    }

    if (state_.balance > 0.0) {
        applyBalance(state_.balance + pnl);
    }

    LOG_INFO("Trade recorded: {} {:.6f} @ {:.4f} -> {} pnl {:+.4f} (daily {:+.2f}, {} trades, {} consecutive losses)",
             toString(direction), quantity, entry, toString(result), pnl,
             state_.daily_pnl, state_.daily_trade_count, state_.consecutive_losses);

    checkEmergencyLimits();
}

void RiskManager::recordTrade(const Trade& trade) {
    TradeResult result = TradeResult::BREAKEVEN;
    if (trade.pnl > 0.0) {
        result = TradeResult::WIN;
    } else if (trade.pnl < 0.0) {
        result = TradeResult::LOSS;
    }
    recordOutcome(trade.direction, trade.entry_price, trade.quantity, result, trade.pnl);
}

void RiskManager::updateBalance(double balance) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    applyBalance(balance);
    checkEmergencyLimits();
}

void RiskManager::applyBalance(double balance) {
    if (state_.initial_balance == 0.0) {
        state_.initial_balance = balance;
        state_.peak_balance = balance;
    }

    state_.balance = balance;
    state_.peak_balance = std::max(state_.peak_balance, balance);
    state_.max_drawdown = std::max(state_.max_drawdown, state_.peak_balance - balance);
}

// ===== Circuit Breakers =====

bool RiskManager::isDailyLimitReached() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    resetDailyIfNeeded();

    if (state_.daily_trade_count >= config_.max_daily_trades) return true;
    if (state_.daily_pnl <= -config_.max_daily_loss) return true;
    if (state_.consecutive_losses >= config_.max_consecutive_losses) return true;
    return false;
}

void RiskManager::resetDailyLimits() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    state_.daily_pnl = 0.0;
    state_.daily_trade_count = 0;
    state_.trading_day = currentUtcDay();
    LOG_INFO("Daily risk limits reset");
}

void RiskManager::checkEmergencyLimits() {
    if (state_.emergency_stop) {
        return;
    }

    const double total_loss = state_.initial_balance - state_.balance;
    if (state_.initial_balance > 0.0 && total_loss >= config_.emergency_stop_loss) {
        std::ostringstream oss;
        oss << "total loss " << std::fixed << std::setprecision(2) << total_loss;
        triggerEmergencyStop(oss.str());
        return;
    }

    if (-state_.total_pnl >= config_.emergency_stop_loss) {
        std::ostringstream oss;
        oss << "cumulative realized loss " << std::fixed << std::setprecision(2) << -state_.total_pnl;
        triggerEmergencyStop(oss.str());
        return;
    }

    if (state_.max_drawdown >= config_.emergency_stop_loss) {
        std::ostringstream oss;
        oss << "max drawdown " << std::fixed << std::setprecision(2) << state_.max_drawdown;
        triggerEmergencyStop(oss.str());
    }
}

void RiskManager::triggerEmergencyStop(const std::string& reason) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (state_.emergency_stop) {
        return;
    }
    state_.emergency_stop = true;
    state_.stop_reason = reason;
    LOG_ERROR("EMERGENCY STOP: {}", reason);
}

bool RiskManager::overrideEmergencyStop(const std::string& reason) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!state_.emergency_stop) {
        return false;
    }
    state_.emergency_stop = false;
    state_.stop_reason.clear();
    LOG_WARN("Emergency stop manually cleared: {}", reason);
    return true;
}

bool RiskManager::isEmergencyStopped() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_.emergency_stop;
}

RiskState RiskManager::getRiskState() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_;
}

std::string RiskManager::getRiskSummary() const {
    const RiskState s = getRiskState();

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    oss << "Risk [" << (s.emergency_stop ? "EMERGENCY" : "NORMAL") << "] "
        << "balance " << s.balance
        << ", daily pnl " << s.daily_pnl
        << ", daily trades " << s.daily_trade_count << "/" << config_.max_daily_trades
        << ", consecutive losses " << s.consecutive_losses << "/" << config_.max_consecutive_losses
        << ", max drawdown " << s.max_drawdown;
    if (s.emergency_stop) {
        oss << ", reason: " << s.stop_reason;
    }
    return oss.str();
}

long long RiskManager::currentUtcDay() {
    std::time_t now = std::time(nullptr);
    std::tm tm_now{};
    gmtime_r(&now, &tm_now);
    return (tm_now.tm_year + 1900) * 10000LL + (tm_now.tm_mon + 1) * 100LL + tm_now.tm_mday;
}

void RiskManager::resetDailyIfNeeded() {
    const long long today = currentUtcDay();
    if (state_.trading_day == 0) {
        state_.trading_day = today;
        return;
    }

    if (today != state_.trading_day) {
        LOG_INFO("UTC day changed -> daily counters reset");
        state_.daily_pnl = 0.0;
        state_.daily_trade_count = 0;
        state_.trading_day = today;
    }
}

} // namespace risk
} // namespace triplersi
