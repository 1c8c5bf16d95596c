#include "engine/TradingEngine.h"

#include "common/Config.h"
#include "common/Logger.h"

#include <chrono>
#include <cmath>

namespace triplersi {
namespace engine {

TradingEngine::TradingEngine(
    const EngineConfig& config,
    std::shared_ptr<execution::IExchangeGateway> gateway,
    CandleFeedFactory feed_factory,
    std::shared_ptr<INotifier> notifier
)
    : config_(config)
    , gateway_(std::move(gateway))
    , feed_factory_(std::move(feed_factory))
    , notifier_(notifier ? std::move(notifier) : std::make_shared<LogNotifier>())
    , candles_(config.indicators)
    , detector_(config.signal, this)
{
    risk_manager_ = std::make_unique<risk::RiskManager>(config_.risk);
    order_manager_ = std::make_unique<execution::OrderManager>(gateway_, config_, this);
    deferred_ = std::make_unique<execution::DeferredProtectionCoordinator>(
        gateway_, config_, order_manager_.get());
    if (config_.orders.deferred_protection) {
        order_manager_->setProtectionScheduler(deferred_.get());
    }

    network::MarketFeedFactory supervisor_factory;
    if (feed_factory_) {
        supervisor_factory = [this](network::IFeedListener* listener) {
            return feed_factory_(listener, [this](const Candle& candle) { onCandle(candle); });
        };
    }
    supervisor_ = std::make_unique<ConnectionSupervisor>(
        config_, gateway_, order_manager_.get(), supervisor_factory, notifier_.get());
    supervisor_->setGiveUpHandler([this](const std::string& reason) {
        emergencyStop("market feed lost: " + reason);
    });

    LOG_INFO("TradingEngine created - {} {} ({}, trading {})",
             config_.exchange.symbol, config_.exchange.timeframe,
             config_.mode == TradingMode::LIVE ? "LIVE" : "TESTNET",
             config_.trading_enabled ? "enabled" : "disabled");
}

TradingEngine::~TradingEngine() {
    stop();
}

// ===== 엔진 제어 =====

bool TradingEngine::start() {
    if (running_) {
        LOG_WARN("엔진이 이미 실행 중입니다");
        return false;
    }

    LOG_INFO("========================================");
    LOG_INFO("거래 엔진 시작");
    LOG_INFO("========================================");

    const auto errors = Config::validate(config_);
    if (!errors.empty()) {
        for (const auto& e : errors) {
            LOG_ERROR("Config: {}", e);
        }
        return false;
    }

    auto latency = gateway_->ping();
    if (!latency) {
        LOG_ERROR("Exchange unreachable: {}", latency.error().describe());
        return false;
    }
    last_latency_ms_ = latency.value();

    auto info = gateway_->getSymbolInfo();
    if (!info) {
        LOG_ERROR("Symbol info unavailable: {}", info.error().describe());
        return false;
    }
    risk_manager_->setSymbolInfo(info.value());
    order_manager_->setSymbolInfo(info.value());
    deferred_->setSymbolInfo(info.value());

    auto balance = gateway_->getBalance();
    if (!balance) {
        LOG_ERROR("Balance unavailable: {}", balance.error().describe());
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        balance_ = balance.value();
    }
    risk_manager_->updateBalance(balance.value());
    LOG_INFO("Balance {:.4f} {}, API latency {} ms",
             balance.value(), config_.exchange.balance_asset, latency.value());

    auto klines = gateway_->getKlines(config_.exchange.initial_klines);
    if (klines) {
        candles_.seed(klines.value());
        LOG_INFO("Candle series seeded with {} bars", candles_.size());
    } else {
        LOG_WARN("Historical klines unavailable ({}) - indicators warm up from the feed",
                 klines.error().describe());
    }

    running_ = true;
    emergency_handled_ = risk_manager_->isEmergencyStopped();

    order_manager_->start();
    if (config_.orders.deferred_protection) {
        deferred_->start();
    }
    if (!supervisor_->start()) {
        LOG_WARN("Feed not connected yet - reconnection loop takes over");
    }

    health_thread_ = std::thread(&TradingEngine::healthLoop, this);
    return true;
}

void TradingEngine::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO("========================================");
    LOG_INFO("거래 엔진 중지");
    LOG_INFO("========================================");

    wake_cv_.notify_all();
    if (health_thread_.joinable()) {
        health_thread_.join();
    }

    supervisor_->stop();
    deferred_->stop();
    order_manager_->stop();

    if (order_manager_->hasActiveTrade()) {
        LOG_WARN("Engine stopped with an open trade - exchange-side protection stays in place");
    }
    logPerformance();
}

// ===== 피드 입력 =====

void TradingEngine::onCandle(const Candle& candle) {
    if (!candle.closed) {
        return;
    }
    try {
        if (!candles_.update(candle)) {
            return;
        }
        const IndicatorSnapshot snapshot = candles_.buildSnapshot(config_.risk.sl_lookback_candles);
        LOG_DEBUG("Candle closed {:.4f} | RSI[0] {:.2f} | HA {:.4f}/{:.4f}",
                  snapshot.close, snapshot.rsi.empty() ? NAN : snapshot.rsi.front(),
                  snapshot.ha_open, snapshot.ha_close);
        detector_.update(snapshot);
    } catch (const std::exception& e) {
        LOG_ERROR("Candle processing error: {}", e.what());
    }
}

// ===== 신호 처리 =====

void TradingEngine::onSignal(const Signal& signal) {
    std::lock_guard<std::mutex> lock(signal_mutex_);

    if (!running_) {
        return;
    }
    LOG_INFO("{} signal confirmed (confidence {:.2f})", toString(signal.direction), signal.confidence);

    // 보유 중에는 새 신호 무시
    if (order_manager_->hasActiveTrade()) {
        LOG_INFO("Trade already active - signal ignored");
        return;
    }
    if (!config_.trading_enabled) {
        rejectSignal(signal, "trading disabled by configuration");
        return;
    }
    if (risk_manager_->isEmergencyStopped()) {
        rejectSignal(signal, "emergency stop active: " + risk_manager_->getRiskState().stop_reason);
        return;
    }

    auto conditions = supervisor_->validateTradeConditions();
    if (!conditions) {
        rejectSignal(signal, conditions.error().describe());
        return;
    }

    const double balance = refreshBalance();
    auto valid = risk_manager_->validateTrade(signal, balance, last_latency_ms_.load());
    if (!valid) {
        rejectSignal(signal, valid.error().describe());
        return;
    }

    auto stop = calculateStopLoss(signal, config_.risk.sl_buffer_pct);
    if (!stop) {
        rejectSignal(signal, stop.error().describe());
        return;
    }

    auto size = risk_manager_->size(signal, balance, stop.value());
    if (!size) {
        rejectSignal(signal, size.error().describe());
        return;
    }

    auto trade = order_manager_->openTrade(signal, size.value());
    if (!trade) {
        if (trade.error().code == "POSITION_OPEN") {
            rejectSignal(signal, trade.error().describe());
        } else {
            LOG_ERROR("Trade open failed: {}", trade.error().describe());
        }
        return;
    }
    handleEmergencyTransition();
}

Result<double> TradingEngine::calculateStopLoss(const Signal& signal, double buffer_pct) {
    const IndicatorSnapshot& s = signal.indicators;
    const double reference = signal.direction == Direction::LONG ? s.ha_lowest_low : s.ha_highest_high;
    if (std::isnan(reference) || reference <= 0.0) {
        return Result<double>::fail(Error::validation("NO_STOP_REFERENCE", "Heikin-Ashi extreme unavailable"));
    }
    const double stop = signal.direction == Direction::LONG
        ? reference * (1.0 - buffer_pct)
        : reference * (1.0 + buffer_pct);
    return Result<double>::ok(stop);
}

void TradingEngine::rejectSignal(const Signal& signal, const std::string& reason) {
    LOG_WARN("{} signal rejected: {}", toString(signal.direction), reason);
    notifier_->signalRejected(signal, reason);
}

// ===== 트레이드 이벤트 =====

void TradingEngine::onTradeOpened(const Trade& trade) {
    notifier_->tradeOpened(trade);
}

void TradingEngine::onTradeClosed(const Trade& trade) {
    risk_manager_->recordTrade(trade);
    notifier_->tradeClosed(trade);
    LOG_INFO("{}", risk_manager_->getRiskSummary());
    handleEmergencyTransition();
}

void TradingEngine::onTradeFailed(const Trade& trade, const std::string& reason) {
    notifier_->tradeFailed(trade, reason);
}

void TradingEngine::onFallbackFill(const Trade& trade, double slippage_pct) {
    notifier_->fallbackFill(trade, slippage_pct);
}

void TradingEngine::onTradeAnomaly(const Trade& trade, const std::string& message) {
    notifier_->tradeAnomaly(trade, message);
}

// ===== 운영자 제어 =====

void TradingEngine::emergencyStop(const std::string& reason) {
    if (!risk_manager_->isEmergencyStopped()) {
        risk_manager_->triggerEmergencyStop(reason);
    }
    handleEmergencyTransition();
}

// 리스크 매니저가 비상 정지로 바뀐 첫 시점에 1회 알림 + 전량 청산
void TradingEngine::handleEmergencyTransition() {
    if (!risk_manager_->isEmergencyStopped()) {
        return;
    }
    if (emergency_handled_.exchange(true)) {
        return;
    }

    const std::string reason = risk_manager_->getRiskState().stop_reason;
    LOG_ERROR("🚨 비상 정지: {}", reason);
    notifier_->emergencyStop(reason);

    const int closed = order_manager_->closeAllTrades(ExitReason::EMERGENCY);
    if (order_manager_->hasActiveTrade()) {
        LOG_ERROR("Emergency close incomplete ({} closed) - retried on each health check", closed);
    }
}

bool TradingEngine::manualOverride(const std::string& reason) {
    if (!risk_manager_->overrideEmergencyStop(reason)) {
        return false;
    }
    api_failures_ = 0;
    emergency_handled_ = false;
    LOG_WARN("Emergency stop overridden by operator: {}", reason);
    return true;
}

Status TradingEngine::closePosition(const std::string& reason) {
    const auto trades = order_manager_->getActiveTrades();
    if (trades.empty()) {
        return Status::fail(Error::validation("NO_POSITION", "no active trade"));
    }

    LOG_INFO("Manual close requested: {}", reason);
    for (const auto& trade : trades) {
        auto closed = order_manager_->closeTrade(trade.id, ExitReason::MANUAL);
        if (!closed) {
            return closed;
        }
    }
    return Status::ok();
}

// ===== 헬스 체크 =====

void TradingEngine::healthLoop() {
    while (running_) {
        {
            std::unique_lock<std::mutex> lock(wake_mutex_);
            wake_cv_.wait_for(lock, std::chrono::milliseconds(config_.health_check_interval_ms),
                              [this]() { return !running_; });
        }
        if (!running_) {
            break;
        }
        try {
            runHealthCheck();
        } catch (const std::exception& e) {
            LOG_ERROR("Health check error: {}", e.what());
        }
    }
}

void TradingEngine::runHealthCheck() {
    auto latency = gateway_->ping();
    if (latency) {
        last_latency_ms_ = latency.value();
        api_failures_ = 0;
        if (latency.value() > config_.risk.max_latency_ms) {
            LOG_WARN("API latency {} ms above limit {} ms", latency.value(), config_.risk.max_latency_ms);
        }
    } else {
        const int failures = ++api_failures_;
        last_latency_ms_ = -1;
        LOG_WARN("API health check failed ({}/{}): {}",
                 failures, config_.max_api_failures, latency.error().describe());
        if (failures >= config_.max_api_failures) {
            emergencyStop("exchange API unreachable for " + std::to_string(failures) + " consecutive checks");
        }
    }

    if (api_failures_ == 0) {
        refreshBalance();
    }

    supervisor_->checkFeedStaleness();
    if (config_.orders.deferred_protection) {
        deferred_->cleanupCompleted();
    }

    handleEmergencyTransition();
    if (risk_manager_->isEmergencyStopped() && order_manager_->hasActiveTrade()) {
        LOG_WARN("Emergency stop active with open trade - retrying close");
        order_manager_->closeAllTrades(ExitReason::EMERGENCY);
    }

    const HealthSnapshot h = healthSnapshot();
    LOG_DEBUG("Health: balance {:.4f}, trades {}, feed {}, state {}, latency {} ms",
              h.balance, h.active_trades, h.feed_connected ? "up" : "down",
              toString(h.connection_state), h.latency_ms);
}

double TradingEngine::refreshBalance() {
    auto balance = gateway_->getBalance();
    if (!balance) {
        LOG_WARN("Balance refresh failed: {}", balance.error().describe());
        std::lock_guard<std::mutex> lock(state_mutex_);
        return balance_;
    }
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        balance_ = balance.value();
    }
    risk_manager_->updateBalance(balance.value());
    return balance.value();
}

HealthSnapshot TradingEngine::healthSnapshot() const {
    HealthSnapshot h;
    h.running = running_;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        h.balance = balance_;
    }
    h.active_trades = static_cast<int>(order_manager_->getActiveTrades().size());
    h.feed_connected = supervisor_->isFeedConnected();
    h.connection_state = supervisor_->state();
    h.latency_ms = last_latency_ms_.load();
    h.api_failures = api_failures_.load();
    h.emergency_stop = risk_manager_->isEmergencyStopped();
    h.trading_blocked = supervisor_->isTradingBlocked();
    h.pending_protections = deferred_->size();
    h.last_data_time_ms = supervisor_->lastDataTimeMs();
    h.performance = order_manager_->getPerformanceStats();
    return h;
}

void TradingEngine::logPerformance() const {
    const auto stats = order_manager_->getPerformanceStats();
    LOG_INFO("========================================");
    LOG_INFO("최종 성과");
    LOG_INFO("  트레이드 {} (승 {} / 패 {}), 승률 {:.1f}%",
             stats.total_trades, stats.winning_trades, stats.losing_trades, stats.win_rate * 100.0);
    LOG_INFO("  총 손익 {:+.4f}, 평균 이익 {:.4f}, 평균 손실 {:.4f}, PF {:.2f}",
             stats.total_pnl, stats.avg_win, stats.avg_loss, stats.profit_factor);
    LOG_INFO("{}", risk_manager_->getRiskSummary());
    LOG_INFO("========================================");
}

} // namespace engine
} // namespace triplersi
