#include "engine/ConnectionSupervisor.h"

#include "common/Logger.h"

#include <algorithm>
#include <chrono>
#include <sstream>

namespace triplersi {
namespace engine {

const char* toString(ConnectionState state) {
    switch (state) {
        case ConnectionState::DISCONNECTED: return "DISCONNECTED";
        case ConnectionState::CONNECTED: return "CONNECTED";
        case ConnectionState::RECONNECTING: return "RECONNECTING";
        case ConnectionState::SAFE_MODE: return "SAFE_MODE";
    }
    return "UNKNOWN";
}

ConnectionSupervisor::ConnectionSupervisor(
    const EngineConfig& config,
    std::shared_ptr<execution::IExchangeGateway> gateway,
    execution::OrderManager* order_manager,
    network::MarketFeedFactory feed_factory,
    INotifier* notifier
)
    : config_(config)
    , gateway_(std::move(gateway))
    , order_manager_(order_manager)
    , feed_factory_(std::move(feed_factory))
    , notifier_(notifier)
{
    LOG_INFO("ConnectionSupervisor initialized - retry {}, base {} ms, cap {} ms, max retries {}",
             config_.connection.retry_enabled ? "on" : "off",
             config_.connection.retry_interval_ms, config_.connection.backoff_max_ms,
             config_.connection.max_retries == 0 ? std::string("unlimited")
                                                 : std::to_string(config_.connection.max_retries));
}

ConnectionSupervisor::~ConnectionSupervisor() {
    stop();
}

void ConnectionSupervisor::setSleepFunction(SleepFunction sleep) {
    sleep_ = std::move(sleep);
}

void ConnectionSupervisor::setGiveUpHandler(GiveUpHandler handler) {
    give_up_handler_ = std::move(handler);
}

long long ConnectionSupervisor::backoffDelay(int attempt, long long base_ms, long long cap_ms) {
    if (attempt < 1) attempt = 1;
    long long delay = base_ms;
    for (int i = 1; i < attempt; ++i) {
        if (delay >= cap_ms) break;
        delay *= 2;
    }
    return std::min(delay, cap_ms);
}

// ===== 시작/중지 =====

bool ConnectionSupervisor::start() {
    if (running_.exchange(true)) {
        return false;
    }
    reconnect_thread_ = std::thread(&ConnectionSupervisor::reconnectLoop, this);

    if (!rebuildFeed()) {
        LOG_WARN("Initial feed start failed");
        requestReconnection("initial connection failed");
        return false;
    }
    LOG_INFO("Candle feed started");
    return true;
}

void ConnectionSupervisor::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        reconnect_abort_ = true;
    }
    wake_cv_.notify_all();
    if (reconnect_thread_.joinable()) {
        reconnect_thread_.join();
    }

    std::unique_ptr<network::IMarketFeed> feed;
    {
        std::lock_guard<std::mutex> lock(feed_mutex_);
        feed = std::move(feed_);
    }
    if (feed) {
        feed->stop();
    }
    connected_ = false;

    std::lock_guard<std::mutex> lock(mutex_);
    state_ = ConnectionState::DISCONNECTED;
    LOG_INFO("ConnectionSupervisor stopped");
}

// ===== 피드 콜백 =====

void ConnectionSupervisor::onFeedConnected() {
    connected_ = true;
    last_data_time_ms_ = nowMs();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == ConnectionState::DISCONNECTED) {
            state_ = ConnectionState::CONNECTED;
        }
    }
    wake_cv_.notify_all();
    LOG_INFO("Feed connected");
}

void ConnectionSupervisor::onFeedDisconnected(const std::string& reason) {
    connected_ = false;
    LOG_WARN("Feed disconnected: {}", reason);
    if (!running_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == ConnectionState::RECONNECTING || reconnect_requested_) {
            return;
        }
    }
    requestReconnection(reason);
}

void ConnectionSupervisor::onFeedData() {
    last_data_time_ms_ = nowMs();
}

// ===== 재연결 =====

void ConnectionSupervisor::requestReconnection(const std::string& reason) {
    if (!config_.connection.retry_enabled) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            state_ = ConnectionState::DISCONNECTED;
        }
        notify("feed lost (" + reason + ") and automatic reconnection is disabled");
        if (give_up_handler_) {
            give_up_handler_("feed lost, reconnection disabled");
        }
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        reconnect_requested_ = true;
        reconnect_abort_ = false;
    }
    wake_cv_.notify_all();
}

bool ConnectionSupervisor::forceReconnection() {
    if (!running_) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == ConnectionState::RECONNECTING || reconnect_requested_) {
            LOG_WARN("Reconnection already in progress");
            return false;
        }
        reconnect_requested_ = true;
        reconnect_abort_ = false;
    }
    LOG_INFO("Forced reconnection requested");
    wake_cv_.notify_all();
    return true;
}

void ConnectionSupervisor::stopReconnection() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        reconnect_abort_ = true;
        reconnect_requested_ = false;
    }
    wake_cv_.notify_all();
    LOG_INFO("Reconnection stop requested");
}

void ConnectionSupervisor::reconnectLoop() {
    while (running_) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            wake_cv_.wait(lock, [this]() { return !running_ || reconnect_requested_; });
            if (!running_) {
                break;
            }
            reconnect_requested_ = false;
        }

        try {
            runReconnection();
        } catch (const std::exception& e) {
            LOG_ERROR("Reconnection loop error: {}", e.what());
            std::lock_guard<std::mutex> lock(mutex_);
            state_ = ConnectionState::DISCONNECTED;
        }
    }
}

void ConnectionSupervisor::runReconnection() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = ConnectionState::RECONNECTING;
        attempt_ = 0;
    }
    notify("feed disconnected - reconnecting");

    while (running_) {
        int attempt = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (reconnect_abort_) {
                state_ = ConnectionState::DISCONNECTED;
                LOG_WARN("Reconnection stopped by request");
                return;
            }
            attempt = ++attempt_;
        }

        const int max_retries = config_.connection.max_retries;
        if (max_retries > 0 && attempt > max_retries) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                state_ = ConnectionState::DISCONNECTED;
                attempt_ = max_retries;
            }
            const std::string message = "reconnection failed after " + std::to_string(max_retries) + " attempts";
            LOG_ERROR("{}", message);
            notify(message);
            if (give_up_handler_) {
                give_up_handler_(message);
            }
            return;
        }

        const long long delay = backoffDelay(attempt, config_.connection.retry_interval_ms,
                                             config_.connection.backoff_max_ms);
        LOG_INFO("Reconnection attempt {} in {} ms", attempt, delay);
        pause(delay);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_ || reconnect_abort_) {
                state_ = ConnectionState::DISCONNECTED;
                return;
            }
        }

        if (rebuildFeed() && waitForConnection()) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                total_reconnections_++;
            }
            LOG_INFO("Reconnected after {} attempt(s)", attempt);
            enterSafeMode();
            if (config_.connection.sync_after_reconnection) {
                reconcile();
            }
            return;
        }

        LOG_WARN("Reconnection attempt {} failed", attempt);
    }
}

bool ConnectionSupervisor::rebuildFeed() {
    std::unique_ptr<network::IMarketFeed> old_feed;
    {
        std::lock_guard<std::mutex> lock(feed_mutex_);
        old_feed = std::move(feed_);
    }
    if (old_feed) {
        old_feed->stop();
        old_feed.reset();
    }
    connected_ = false;

    std::unique_ptr<network::IMarketFeed> feed;
    if (feed_factory_) {
        feed = feed_factory_(this);
    }
    if (!feed) {
        LOG_ERROR("Feed factory returned no feed");
        return false;
    }

    const bool started = feed->start();
    {
        std::lock_guard<std::mutex> lock(feed_mutex_);
        feed_ = std::move(feed);
    }
    return started;
}

bool ConnectionSupervisor::waitForConnection() {
    const long long step = std::max(1LL, config_.connection.connect_poll_ms);
    long long waited = 0;

    std::unique_lock<std::mutex> lock(mutex_);
    while (waited < config_.connection.connect_wait_ms) {
        if (connected_ || !running_ || reconnect_abort_) {
            break;
        }
        wake_cv_.wait_for(lock, std::chrono::milliseconds(step));
        waited += step;
    }
    return connected_.load();
}

void ConnectionSupervisor::pause(long long ms) {
    if (sleep_) {
        sleep_(ms);
        return;
    }
    std::unique_lock<std::mutex> lock(mutex_);
    wake_cv_.wait_for(lock, std::chrono::milliseconds(ms),
                      [this]() { return !running_ || reconnect_abort_; });
}

void ConnectionSupervisor::enterSafeMode() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = ConnectionState::SAFE_MODE;
        safe_mode_until_ms_ = nowMs() + config_.connection.safe_mode_duration_ms;
    }
    LOG_WARN("Safe mode for {} s - trade validation double-checks positions",
             config_.connection.safe_mode_duration_ms / 1000);
    notify("reconnected, safe mode active");
}

// ===== 상태 =====

ConnectionState ConnectionSupervisor::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == ConnectionState::SAFE_MODE && nowMs() >= safe_mode_until_ms_) {
        return ConnectionState::CONNECTED;
    }
    return state_;
}

bool ConnectionSupervisor::isInSafeMode() const {
    return state() == ConnectionState::SAFE_MODE;
}

ConnectionStatus ConnectionSupervisor::status() const {
    ConnectionStatus s;
    s.state = state();
    s.feed_connected = connected_.load();
    s.last_data_time_ms = last_data_time_ms_.load();

    std::lock_guard<std::mutex> lock(mutex_);
    s.reconnecting = state_ == ConnectionState::RECONNECTING;
    s.attempt = attempt_;
    s.total_reconnections = total_reconnections_;
    if (s.state == ConnectionState::SAFE_MODE) {
        s.safe_mode_remaining_ms = std::max(0LL, safe_mode_until_ms_ - nowMs());
    }
    s.trading_blocked = trading_blocked_;
    s.block_reason = block_reason_;
    return s;
}

bool ConnectionSupervisor::checkFeedStaleness() {
    if (!running_) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == ConnectionState::RECONNECTING || reconnect_requested_) {
            return false;
        }
    }

    const long long last = last_data_time_ms_.load();
    const bool silent = last > 0 && nowMs() - last > config_.connection.stale_feed_timeout_ms;
    if (!connected_ || silent) {
        LOG_WARN("Feed {} - requesting reconnection", connected_ ? "stale" : "down");
        requestReconnection(connected_ ? "stale feed" : "feed down");
        return true;
    }
    return false;
}

// ===== 거래 검증 =====

Status ConnectionSupervisor::validateTradeConditions() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (trading_blocked_) {
            return Status::fail(Error::validation("TRADING_BLOCKED", block_reason_));
        }
    }

    const ConnectionState current = state();
    if (current == ConnectionState::RECONNECTING || current == ConnectionState::DISCONNECTED) {
        return Status::fail(Error::transient("FEED_UNAVAILABLE",
                                             std::string("feed state ") + toString(current)));
    }

    auto positions = gateway_->getPositions();
    if (!positions) {
        return Status::fail(Error::transient("POSITION_CHECK_FAILED", positions.error().describe()));
    }
    if (!positions.value().empty()) {
        return Status::fail(Error::validation("POSITION_EXISTS", "exchange already holds a position"));
    }

    if (current == ConnectionState::SAFE_MODE) {
        pause(config_.connection.safe_mode_recheck_delay_ms);
        auto recheck = gateway_->getPositions();
        if (!recheck) {
            return Status::fail(Error::transient("POSITION_RECHECK_FAILED", recheck.error().describe()));
        }
        if (!recheck.value().empty()) {
            return Status::fail(Error::validation("POSITION_EXISTS", "position appeared on safe-mode recheck"));
        }
        LOG_DEBUG("Safe mode position double-check passed");
    }

    return Status::ok();
}

bool ConnectionSupervisor::isTradingBlocked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return trading_blocked_;
}

void ConnectionSupervisor::clearTradingBlock() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (trading_blocked_) {
        LOG_WARN("Trading block cleared by operator (was: {})", block_reason_);
    }
    trading_blocked_ = false;
    block_reason_.clear();
}

// ===== 재동기화 =====

ReconciliationReport ConnectionSupervisor::reconcile() {
    ReconciliationReport report;
    LOG_INFO("Reconciliation started");

    auto positions = gateway_->getPositions();
    if (!positions) {
        report.error = positions.error().describe();
        LOG_ERROR("Reconciliation failed: {}", report.error);
        notifyReconciliation("reconciliation failed: " + report.error);
        return report;
    }

    std::vector<Trade> trades;
    if (order_manager_) {
        trades = order_manager_->getActiveTrades();
    }
    report.exchange_positions = static_cast<int>(positions.value().size());
    report.tracked_trades = static_cast<int>(trades.size());

    // 엔진이 모르는 포지션
    for (const auto& position : positions.value()) {
        const bool tracked = std::any_of(trades.begin(), trades.end(), [&](const Trade& t) {
            return t.direction == position.direction();
        });
        if (!tracked) {
            std::ostringstream oss;
            oss << position.symbol << " " << toString(position.direction())
                << " " << position.position_amt << " @ " << position.entry_price;
            report.untracked_positions.push_back(oss.str());
        }
    }

    // 거래소에 포지션이 없는 OPEN 트레이드 (OPENING/CLOSING 은 진행 중이므로 제외)
    for (const auto& trade : trades) {
        if (trade.status != TradeStatus::OPEN) {
            continue;
        }
        const bool live = std::any_of(positions.value().begin(), positions.value().end(),
                                      [&](const ExchangePosition& p) { return p.direction() == trade.direction; });
        if (live) {
            continue;
        }
        auto dropped = order_manager_->dropGhostTrade(trade.id);
        if (dropped) {
            report.ghost_trades.push_back(trade.id);
            notifyReconciliation("ghost trade " + trade.id + " dropped (exchange position is flat)");
        } else {
            LOG_ERROR("[{}] Ghost trade drop failed: {}", trade.id, dropped.error().describe());
        }
    }

    if (!report.untracked_positions.empty()) {
        std::string reason = "untracked exchange position: " + report.untracked_positions.front();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            trading_blocked_ = true;
            block_reason_ = reason;
        }
        LOG_ERROR("{} - new trades blocked until manual handling", reason);
        notifyReconciliation(reason + " - new trades blocked, manual handling required");
    }

    report.success = true;
    LOG_INFO("Reconciliation done - positions {}, tracked {}, ghosts {}, untracked {}",
             report.exchange_positions, report.tracked_trades,
             report.ghost_trades.size(), report.untracked_positions.size());
    return report;
}

void ConnectionSupervisor::notify(const std::string& message) {
    if (notifier_) {
        notifier_->connection(message);
    }
}

void ConnectionSupervisor::notifyReconciliation(const std::string& finding) {
    if (notifier_) {
        notifier_->reconciliation(finding);
    }
}

} // namespace engine
} // namespace triplersi
