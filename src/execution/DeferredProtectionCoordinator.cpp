#include "execution/DeferredProtectionCoordinator.h"

#include "common/Logger.h"
#include "common/TickSizeHelper.h"
#include "common/Timeframe.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>

namespace triplersi {
namespace execution {

const char* toString(ProcessOutcome outcome) {
    switch (outcome) {
        case ProcessOutcome::PLACED: return "PLACED";
        case ProcessOutcome::ALREADY_PLACED: return "ALREADY_PLACED";
        case ProcessOutcome::IN_FLIGHT: return "IN_FLIGHT";
        case ProcessOutcome::STALE_RESET: return "STALE_RESET";
        case ProcessOutcome::NOT_FOUND: return "NOT_FOUND";
        case ProcessOutcome::INACTIVE: return "INACTIVE";
        case ProcessOutcome::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}

DeferredProtectionCoordinator::DeferredProtectionCoordinator(
    std::shared_ptr<IExchangeGateway> gateway,
    const engine::EngineConfig& config,
    IProtectionListener* listener
)
    : gateway_(std::move(gateway))
    , config_(config)
    , listener_(listener)
{
    symbol_info_.symbol = config_.exchange.symbol;
    LOG_INFO("DeferredProtection initialized - offset {:.4f}%, check {} ms, processing window {} ms, min distance {} ticks",
             config_.deferred.price_offset_percent, config_.deferred.check_interval_ms,
             config_.deferred.processing_timeout_ms, config_.deferred.min_distance_ticks);
}

DeferredProtectionCoordinator::~DeferredProtectionCoordinator() {
    stop();
}

void DeferredProtectionCoordinator::setSymbolInfo(const SymbolInfo& info) {
    std::lock_guard<std::mutex> lock(mutex_);
    symbol_info_ = info;
}

void DeferredProtectionCoordinator::start() {
    if (running_.exchange(true)) {
        return;
    }
    monitor_thread_ = std::thread(&DeferredProtectionCoordinator::monitorLoop, this);
    LOG_INFO("Deferred protection monitor started");
}

void DeferredProtectionCoordinator::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    wake_cv_.notify_all();
    if (monitor_thread_.joinable()) {
        monitor_thread_.join();
    }
    LOG_INFO("Deferred protection monitor stopped");
}

void DeferredProtectionCoordinator::monitorLoop() {
    while (running_) {
        try {
            processDue();
            cleanupCompleted();
        } catch (const std::exception& e) {
            LOG_ERROR("Deferred protection monitor error: {}", e.what());
        }

        std::unique_lock<std::mutex> lock(wake_mutex_);
        wake_cv_.wait_for(lock, std::chrono::milliseconds(config_.deferred.check_interval_ms),
                          [this]() { return !running_; });
    }
}

// ===== Registration =====

bool DeferredProtectionCoordinator::registerTrade(const Trade& trade) {
    const Timestamp now = nowMs();
    const Timestamp entry_time = trade.filled_at > 0 ? trade.filled_at : now;

    PendingProtection entry;
    entry.trade_id = trade.id;
    entry.direction = trade.direction;
    entry.quantity = trade.quantity;
    entry.entry_price = trade.entry_price;
    entry.original_stop = trade.stop_loss;
    entry.original_target = trade.take_profit;
    entry.registered_at = now;
    entry.deadline = entry_time + common::timeframeToSeconds(config_.exchange.timeframe) * 1000;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pending_.count(trade.id) > 0) {
            LOG_WARN("[{}] Already registered for deferred protection", trade.id);
            return false;
        }
        pending_[trade.id] = entry;
    }

    LOG_INFO("[{}] Deferred protection registered (SL {:.4f}, TP {:.4f}, due in {} s)",
             trade.id, entry.original_stop, entry.original_target,
             std::max(0LL, (entry.deadline - now) / 1000));
    return true;
}

bool DeferredProtectionCoordinator::cancel(const std::string& trade_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(trade_id);
    if (it == pending_.end()) {
        return false;
    }
    if (it->second.placed) {
        LOG_WARN("[{}] Deferred protection already placed - cannot cancel", trade_id);
        return false;
    }
    if (it->second.processing_started != 0) {
        LOG_WARN("[{}] Deferred protection is being processed - cannot cancel", trade_id);
        return false;
    }
    pending_.erase(it);
    LOG_INFO("[{}] Deferred protection cancelled", trade_id);
    return true;
}

// ===== Processing =====

int DeferredProtectionCoordinator::processDue() {
    const Timestamp now = nowMs();

    std::vector<std::string> due;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& kv : pending_) {
            if (!kv.second.placed && now >= kv.second.deadline) {
                due.push_back(kv.first);
            }
        }
    }

    int placed = 0;
    for (const auto& id : due) {
        const ProcessOutcome outcome = process(id);
        if (outcome == ProcessOutcome::PLACED) {
            placed++;
        } else if (outcome != ProcessOutcome::ALREADY_PLACED) {
            LOG_DEBUG("[{}] Deferred processing: {}", id, toString(outcome));
        }
    }
    return placed;
}

ProcessOutcome DeferredProtectionCoordinator::forceProcess(const std::string& trade_id) {
    LOG_INFO("[{}] Forced deferred protection processing", trade_id);
    return process(trade_id);
}

ProcessOutcome DeferredProtectionCoordinator::process(const std::string& trade_id) {
    // 트레이드가 이미 끝났으면 항목만 정리
    if (listener_ && !listener_->isTradeActive(trade_id)) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(trade_id);
        if (it == pending_.end()) {
            return ProcessOutcome::NOT_FOUND;
        }
        if (it->second.processing_started == 0) {
            LOG_WARN("[{}] Trade no longer active - deferred entry dropped", trade_id);
            pending_.erase(it);
        }
        return ProcessOutcome::INACTIVE;
    }

    PendingProtection entry;
    SymbolInfo info;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(trade_id);
        if (it == pending_.end()) {
            return ProcessOutcome::NOT_FOUND;
        }
        PendingProtection& p = it->second;
        if (p.placed) {
            return ProcessOutcome::ALREADY_PLACED;
        }

        const Timestamp now = nowMs();
        if (p.processing_started != 0) {
            const long long elapsed = now - p.processing_started;
            if (elapsed < config_.deferred.processing_timeout_ms) {
                return ProcessOutcome::IN_FLIGHT;
            }
            // 같은 패스에서 재시도하지 않음
            LOG_WARN("[{}] Deferred processing stuck for {} ms - reset", trade_id, elapsed);
            p.processing_started = 0;
            return ProcessOutcome::STALE_RESET;
        }

        p.processing_started = now;
        p.attempts++;
        entry = p;
        info = symbol_info_;
    }

    // ---- 락 밖: 가격 조회, 재계산, 주문 ----
    auto price = gateway_->getCurrentPrice();
    if (!price) {
        LOG_ERROR("[{}] Deferred protection: price fetch failed: {}", trade_id, price.error().describe());
        releaseClaim(trade_id, nullptr, 0.0);
        return ProcessOutcome::FAILED;
    }

    const double min_distance = std::max(1, config_.deferred.min_distance_ticks) * info.tick_size;
    ProtectionLevels levels = computeLevels(
        entry.direction, entry.original_stop, entry.original_target, price.value(),
        config_.deferred.price_offset_percent, min_distance, info.tick_size);

    if (levels.stop_adjusted) {
        LOG_WARN("[{}] Original stop {:.4f} already breached (price {:.4f}) - stop moved to {:.4f}",
                 trade_id, entry.original_stop, price.value(), levels.stop_loss);
    }
    if (levels.target_adjusted) {
        LOG_INFO("[{}] Original target {:.4f} already crossed (price {:.4f}) - target moved to {:.4f}",
                 trade_id, entry.original_target, price.value(), levels.take_profit);
    }

    const OrderSide side = exitSide(entry.direction);

    Order sl_order = entry.sl_order;
    if (sl_order.exchange_order_id.empty()) {
        auto sl = gateway_->placeStopMarketOrder(side, entry.quantity, levels.stop_loss);
        if (!sl) {
            LOG_ERROR("[{}] Deferred stop loss placement failed: {}", trade_id, sl.error().describe());
            releaseClaim(trade_id, nullptr, 0.0);
            return ProcessOutcome::FAILED;
        }
        sl_order = sl.value();
    } else {
        // 이전 시도에서 SL 은 이미 배치됨
        levels.stop_loss = entry.final_stop;
    }

    auto tp = gateway_->placeLimitOrder(side, entry.quantity, levels.take_profit, true);
    if (!tp) {
        LOG_ERROR("[{}] Deferred take profit placement failed: {} (stop loss {} kept)",
                  trade_id, tp.error().describe(), sl_order.exchange_order_id);
        releaseClaim(trade_id, &sl_order, levels.stop_loss);
        return ProcessOutcome::FAILED;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(trade_id);
        if (it != pending_.end()) {
            PendingProtection& p = it->second;
            p.placed = true;
            p.processing_started = 0;
            p.sl_order = sl_order;
            p.tp_order = tp.value();
            p.final_stop = levels.stop_loss;
            p.final_target = levels.take_profit;
            p.placed_at = nowMs();
        }
    }

    LOG_INFO("[{}] Deferred protection placed: SL {} @ {:.4f}, TP {} @ {:.4f} (attempt {})",
             trade_id, sl_order.exchange_order_id, levels.stop_loss,
             tp.value().exchange_order_id, levels.take_profit, entry.attempts);

    if (listener_) {
        listener_->onProtectionPlaced(trade_id, sl_order, tp.value(), levels.stop_loss, levels.take_profit);
    }
    return ProcessOutcome::PLACED;
}

void DeferredProtectionCoordinator::releaseClaim(
    const std::string& trade_id,
    const Order* sl_order,
    double stop_loss
) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(trade_id);
    if (it == pending_.end()) {
        return;
    }
    it->second.processing_started = 0;
    if (sl_order) {
        it->second.sl_order = *sl_order;
        it->second.final_stop = stop_loss;
    }
}

ProtectionLevels DeferredProtectionCoordinator::computeLevels(
    Direction direction,
    double original_stop,
    double original_target,
    double current_price,
    double offset_percent,
    double min_distance,
    double tick_size
) {
    ProtectionLevels levels;
    const double gap = std::max(std::fabs(current_price * offset_percent / 100.0), min_distance);

    if (direction == Direction::LONG) {
        if (original_stop >= current_price) {
            levels.stop_loss = current_price - gap;
            levels.stop_adjusted = true;
        } else {
            levels.stop_loss = std::min(original_stop, current_price - min_distance);
        }

        if (original_target <= current_price) {
            levels.take_profit = current_price + gap;
            levels.target_adjusted = true;
        } else {
            levels.take_profit = std::max(original_target, current_price + min_distance);
        }

        levels.stop_loss = common::roundDownToTick(levels.stop_loss, tick_size);
        levels.take_profit = common::roundUpToTick(levels.take_profit, tick_size);
    } else {
        if (original_stop <= current_price) {
            levels.stop_loss = current_price + gap;
            levels.stop_adjusted = true;
        } else {
            levels.stop_loss = std::max(original_stop, current_price + min_distance);
        }

        if (original_target >= current_price) {
            levels.take_profit = current_price - gap;
            levels.target_adjusted = true;
        } else {
            levels.take_profit = std::min(original_target, current_price - min_distance);
        }

        levels.stop_loss = common::roundUpToTick(levels.stop_loss, tick_size);
        levels.take_profit = common::roundDownToTick(levels.take_profit, tick_size);
    }

    return levels;
}

// ===== Housekeeping =====

int DeferredProtectionCoordinator::cleanupCompleted() {
    const Timestamp now = nowMs();

    std::vector<std::string> expired;
    std::vector<std::string> candidates;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& kv : pending_) {
            const PendingProtection& p = kv.second;
            if (p.placed && now - p.placed_at > config_.deferred.cleanup_after_ms) {
                expired.push_back(kv.first);
            } else if (p.processing_started == 0) {
                candidates.push_back(kv.first);
            }
        }
    }

    if (listener_) {
        for (const auto& id : candidates) {
            if (!listener_->isTradeActive(id)) {
                expired.push_back(id);
            }
        }
    }

    int removed = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& id : expired) {
            auto it = pending_.find(id);
            if (it != pending_.end() && it->second.processing_started == 0) {
                pending_.erase(it);
                removed++;
            }
        }
    }

    if (removed > 0) {
        LOG_INFO("Deferred protection cleanup: {} entries removed", removed);
    }
    return removed;
}

DeferredStatusReport DeferredProtectionCoordinator::statusReport() const {
    const Timestamp now = nowMs();

    DeferredStatusReport report;
    std::lock_guard<std::mutex> lock(mutex_);
    report.total = pending_.size();

    for (const auto& kv : pending_) {
        const PendingProtection& p = kv.second;
        DeferredStatusEntry e;
        e.trade_id = kv.first;
        e.direction = p.direction;

        if (p.placed) {
            e.state = "completed";
            report.completed++;
        } else if (p.processing_started != 0) {
            e.state = "processing";
            report.processing++;
        } else if (now >= p.deadline) {
            e.state = "ready";
            report.ready++;
        } else {
            e.state = "waiting";
            e.seconds_remaining = (p.deadline - now + 999) / 1000;
            report.waiting++;
        }
        report.entries.push_back(e);
    }
    return report;
}

std::optional<PendingProtection> DeferredProtectionCoordinator::getEntry(const std::string& trade_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(trade_id);
    if (it == pending_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t DeferredProtectionCoordinator::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

} // namespace execution
} // namespace triplersi
