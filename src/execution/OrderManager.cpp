#include "execution/OrderManager.h"
#include "execution/TradeLifecycle.h"

#include "common/Logger.h"
#include "common/TickSizeHelper.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>

namespace triplersi {
namespace execution {

namespace {
constexpr size_t kMaxClosedTrades = 1000;
constexpr double kQtyEpsilon = 1e-9;
} // namespace

OrderManager::OrderManager(
    std::shared_ptr<IExchangeGateway> gateway,
    const engine::EngineConfig& config,
    ITradeLifecycleSink* sink
)
    : gateway_(std::move(gateway))
    , config_(config)
    , sink_(sink)
    , watcher_(gateway_)
{
    symbol_info_.symbol = config_.exchange.symbol;
    LOG_INFO("OrderManager initialized - entry {}, fill timeout {} ms, fallback {}, deferred protection {}",
             config_.orders.entry_order_type == engine::EntryOrderType::LIMIT ? "LIMIT" : "MARKET",
             config_.orders.order_execution_timeout_ms,
             config_.orders.market_fallback_enabled ? "on" : "off",
             config_.orders.deferred_protection ? "on" : "off");
}

OrderManager::~OrderManager() {
    stop();
}

void OrderManager::setProtectionScheduler(IProtectionScheduler* scheduler) {
    scheduler_ = scheduler;
}

void OrderManager::setSymbolInfo(const SymbolInfo& info) {
    std::lock_guard<std::mutex> lock(mutex_);
    symbol_info_ = info;
}

SymbolInfo OrderManager::currentSymbolInfo() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return symbol_info_;
}

void OrderManager::start() {
    if (running_.exchange(true)) {
        return;
    }
    monitor_thread_ = std::thread(&OrderManager::monitorLoop, this);
    LOG_INFO("Order monitor started (interval {} ms)", config_.orders.monitor_interval_ms);
}

void OrderManager::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    wake_cv_.notify_all();
    if (monitor_thread_.joinable()) {
        monitor_thread_.join();
    }
    LOG_INFO("Order monitor stopped");
}

void OrderManager::monitorLoop() {
    while (running_) {
        try {
            monitorOnce();
        } catch (const std::exception& e) {
            LOG_ERROR("Order monitor error: {}", e.what());
        }

        std::unique_lock<std::mutex> lock(wake_mutex_);
        wake_cv_.wait_for(lock, std::chrono::milliseconds(config_.orders.monitor_interval_ms),
                          [this]() { return !running_; });
    }
}

std::string OrderManager::nextTradeId(Direction direction) {
    const long long counter = ++trade_counter_;
    return config_.exchange.symbol + "_" + toString(direction) + "_" +
           std::to_string(counter) + "_" + std::to_string(nowMs() / 1000);
}

// ===== Entry =====

Result<Trade> OrderManager::openTrade(const Signal& signal, const PositionSize& size) {
    if (size.quantity <= 0.0 || size.entry_price_estimate <= 0.0) {
        return Result<Trade>::fail(Error::validation("INVALID_SIZE", "position size must be positive"));
    }

    Trade trade;
    trade.id = nextTradeId(signal.direction);
    trade.symbol = config_.exchange.symbol;
    trade.direction = signal.direction;
    trade.status = TradeStatus::OPENING;
    trade.quantity = size.quantity;
    trade.entry_price = size.entry_price_estimate;
    trade.stop_loss = size.stop_loss;
    trade.take_profit = size.take_profit;
    trade.confidence = signal.confidence;
    trade.created_at = nowMs();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& kv : active_trades_) {
            if (!isTerminal(kv.second.status)) {
                LOG_WARN("Entry refused: trade {} is still {}", kv.first, toString(kv.second.status));
                return Result<Trade>::fail(Error::validation(
                    "POSITION_OPEN", "trade " + kv.first + " is still " + toString(kv.second.status)));
            }
        }
        active_trades_[trade.id] = trade;
    }

    LOG_INFO("[{}] Opening {} {:.6f} (est. {:.4f}, SL {:.4f}, TP {:.4f})",
             trade.id, toString(trade.direction), trade.quantity,
             trade.entry_price, trade.stop_loss, trade.take_profit);

    return executeEntry(trade, size);
}

Result<Trade> OrderManager::executeEntry(Trade trade, const PositionSize& size) {
    const SymbolInfo info = currentSymbolInfo();
    const bool use_limit = config_.orders.entry_order_type == engine::EntryOrderType::LIMIT;

    // 1. 지정가 가격 (매수는 현재가 아래, 매도는 위)
    double limit_price = 0.0;
    if (use_limit) {
        auto price = gateway_->getCurrentPrice();
        if (!price) {
            return failTrade(trade, price.error());
        }
        const double spread = config_.orders.limit_spread_percent / 100.0;
        limit_price = trade.direction == Direction::LONG
            ? common::roundDownToTick(price.value() * (1.0 - spread), info.tick_size)
            : common::roundUpToTick(price.value() * (1.0 + spread), info.tick_size);
    }

    // 2. 진입 주문
    auto placed = placeEntryOrder(trade, limit_price);
    if (!placed) {
        return failTrade(trade, placed.error());
    }
    trade.entry_order = placed.value();
    updateTrade(trade);

    Order entry = placed.value();
    if (entry.status != OrderStatus::FILLED && entry.status != OrderStatus::FAILED) {
        entry = waitForFill(entry.exchange_order_id, entry).order;
    }

    if (entry.status == OrderStatus::FAILED) {
        trade.entry_order = entry;
        return failTrade(trade, Error::validation("ENTRY_REJECTED", "entry order rejected by exchange"));
    }

    double filled_qty = 0.0;
    double avg_price = 0.0;

    if (entry.status == OrderStatus::FILLED) {
        filled_qty = entry.filled_qty > 0.0 ? entry.filled_qty : trade.quantity;
        avg_price = entry.avg_fill_price > 0.0 ? entry.avg_fill_price
                  : (limit_price > 0.0 ? limit_price : trade.entry_price);
    } else {
        // 3. 타임아웃: 잔량 취소 후 최종 상태 재조회 (취소 직전 체결 가능)
        LOG_WARN("[{}] Entry order {} not filled within {} ms", trade.id,
                 entry.exchange_order_id, config_.orders.order_execution_timeout_ms);

        const bool cancelled = cancelOrderWithRetry(entry.exchange_order_id, "Entry");
        auto final_state = gateway_->getOrder(entry.exchange_order_id);
        if (final_state) {
            entry = final_state.value();
        }
        trade.entry_order = entry;

        // 최종 상태 미확인 → 주문이 살아 있을 수 있음. 폴백 금지, 감시 주기에 재확인
        if (!final_state || !isFinal(entry.status)) {
            return holdUnresolvedEntry(trade, cancelled);
        }

        filled_qty = entry.filled_qty;
        avg_price = entry.avg_fill_price > 0.0 ? entry.avg_fill_price : limit_price;

        if (entry.status != OrderStatus::FILLED) {
            const double remainder = common::floorToStep(trade.quantity - filled_qty, info.step_size);

            if (config_.orders.market_fallback_enabled && use_limit && remainder >= info.min_qty) {
                // 4. 시장가 폴백 (잔량)
                auto fallback = gateway_->placeMarketOrder(entrySide(trade.direction), remainder, false);
                if (!fallback) {
                    LOG_ERROR("[{}] Market fallback failed: {}", trade.id, fallback.error().describe());
                    if (filled_qty <= kQtyEpsilon) {
                        return failTrade(trade, fallback.error());
                    }
                } else {
                    Order fb = fallback.value();
                    if (fb.status != OrderStatus::FILLED) {
                        fb = waitForFill(fb.exchange_order_id, fb).order;
                    }
                    const double fb_qty = fb.filled_qty > 0.0 ? fb.filled_qty : remainder;
                    double fb_price = fb.avg_fill_price;
                    if (fb_price <= 0.0) {
                        fb_price = gateway_->getCurrentPrice().valueOr(limit_price);
                    }

                    const double slippage_pct = std::fabs(fb_price - limit_price) / limit_price * 100.0;
                    const double total_qty = filled_qty + fb_qty;
                    avg_price = (filled_qty * avg_price + fb_qty * fb_price) / total_qty;
                    filled_qty = total_qty;
                    trade.degraded_fill = true;
                    trade.quantity = filled_qty;
                    trade.entry_price = avg_price;

                    if (slippage_pct > config_.orders.fallback_max_slippage_pct) {
                        LOG_ERROR("[{}] Fallback slippage {:.4f}% exceeds {:.4f}% - flattening",
                                  trade.id, slippage_pct, config_.orders.fallback_max_slippage_pct);
                        if (!flattenPosition(trade.direction, filled_qty, trade.id) && sink_) {
                            sink_->onTradeAnomaly(trade, "fallback position could not be flattened");
                        }
                        return failTrade(trade, Error::validation(
                            "SLIPPAGE_EXCEEDED", "fallback slippage above ceiling, position flattened"));
                    }

                    LOG_WARN("[{}] Degraded fill via market fallback: {:.6f} @ {:.4f} (slippage {:.4f}%)",
                             trade.id, fb_qty, fb_price, slippage_pct);
                    if (sink_) {
                        sink_->onFallbackFill(trade, slippage_pct);
                    }
                }
            } else if (filled_qty <= kQtyEpsilon) {
                return failTrade(trade, Error::validation(
                    "ENTRY_TIMEOUT", "entry order not filled within timeout"));
            }

            if (filled_qty > kQtyEpsilon && !trade.degraded_fill) {
                LOG_WARN("[{}] Keeping partial fill {:.6f} of {:.6f}", trade.id, filled_qty, trade.quantity);
            }
        }
    }

    // 5. 실제 체결가 기준 SL/TP 재계산
    trade.quantity = filled_qty;
    trade.entry_price = avg_price;
    applyFillToLevels(trade, size);

    auto opened = TradeLifecycle::transition(trade, TradeStatus::OPEN);
    if (!opened) {
        LOG_ERROR("[{}] {}", trade.id, opened.error().describe());
        return Result<Trade>::fail(opened.error());
    }

    const bool defer = config_.orders.deferred_protection && scheduler_ != nullptr;
    trade.deferred_protection = defer;
    updateTrade(trade);

    LOG_INFO("[{}] OPEN {} {:.6f} @ {:.4f} (SL {:.4f}, TP {:.4f}){}",
             trade.id, toString(trade.direction), trade.quantity, trade.entry_price,
             trade.stop_loss, trade.take_profit, trade.degraded_fill ? " [degraded]" : "");
    if (sink_) {
        sink_->onTradeOpened(trade);
    }

    // 6. 보호 주문: 즉시 또는 진입 캔들 마감 후
    if (defer) {
        if (scheduler_->registerTrade(trade)) {
            LOG_INFO("[{}] Protection deferred until entry candle close", trade.id);
        } else {
            LOG_WARN("[{}] Deferred registration refused - placing protection now", trade.id);
            placeProtection(trade);
        }
    } else {
        placeProtection(trade);
    }

    auto latest = getTrade(trade.id);
    return Result<Trade>::ok(latest ? *latest : trade);
}

Result<Order> OrderManager::placeEntryOrder(const Trade& trade, double limit_price) {
    const OrderSide side = entrySide(trade.direction);
    if (config_.orders.entry_order_type == engine::EntryOrderType::LIMIT) {
        return gateway_->placeLimitOrder(side, trade.quantity, limit_price, false);
    }
    return gateway_->placeMarketOrder(side, trade.quantity, false);
}

OrderManager::FillOutcome OrderManager::waitForFill(const std::string& order_id, Order last_known) {
    FillOutcome outcome;
    outcome.order = last_known;

    const Timestamp deadline = nowMs() + config_.orders.order_execution_timeout_ms;
    while (nowMs() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(config_.orders.fill_poll_interval_ms));

        auto state = gateway_->getOrder(order_id);
        if (!state) {
            LOG_WARN("Order {} status poll failed: {}", order_id, state.error().describe());
            continue;
        }

        outcome.order = state.value();
        if (outcome.order.status == OrderStatus::FILLED) {
            outcome.filled = true;
            return outcome;
        }
        if (outcome.order.status == OrderStatus::CANCELLED || outcome.order.status == OrderStatus::FAILED) {
            return outcome;
        }
    }

    outcome.timed_out = true;
    return outcome;
}

bool OrderManager::flattenPosition(Direction direction, double quantity, const std::string& trade_id) {
    const SymbolInfo info = currentSymbolInfo();
    const double qty = common::floorToStep(quantity, info.step_size);
    if (qty <= kQtyEpsilon) {
        return true;
    }

    const int attempts = std::max(1, config_.orders.close_retry_attempts);
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        auto result = gateway_->placeMarketOrder(exitSide(direction), qty, true);
        if (result) {
            LOG_WARN("[{}] Position flattened: {:.6f}", trade_id, qty);
            return true;
        }
        LOG_ERROR("[{}] Flatten attempt {}/{} failed: {}", trade_id, attempt, attempts,
                  result.error().describe());
    }
    LOG_ERROR("[{}] Flatten FAILED - manual intervention required ({:.6f} {})",
              trade_id, qty, toString(direction));
    return false;
}

Result<Trade> OrderManager::holdUnresolvedEntry(Trade trade, bool cancel_acknowledged) {
    trade.entry_unresolved = true;
    updateTrade(trade);

    const std::string detail = cancel_acknowledged
        ? "entry order state unknown after cancel"
        : "entry order cancel not confirmed";
    LOG_ERROR("[{}] {} ({}) - trade held OPENING, late fills will be flattened",
              trade.id, detail, trade.entry_order.exchange_order_id);
    if (sink_) {
        sink_->onTradeAnomaly(trade, detail + " - order may still fill");
    }
    return Result<Trade>::fail(Error::transient("ENTRY_UNRESOLVED", detail));
}

void OrderManager::resolveUnresolvedEntries() {
    std::vector<Trade> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& kv : active_trades_) {
            if (kv.second.status == TradeStatus::OPENING && kv.second.entry_unresolved) {
                pending.push_back(kv.second);
            }
        }
    }

    for (auto& trade : pending) {
        const std::string& order_id = trade.entry_order.exchange_order_id;

        auto state = gateway_->getOrder(order_id);
        if (state && !isFinal(state.value().status)) {
            cancelOrderWithRetry(order_id, "Entry");
            state = gateway_->getOrder(order_id);
        }
        if (!state || !isFinal(state.value().status)) {
            LOG_WARN("[{}] Entry order {} still unresolved", trade.id, order_id);
            continue;
        }

        trade.entry_order = state.value();
        const double late_qty = trade.entry_order.filled_qty;
        if (late_qty > kQtyEpsilon) {
            LOG_ERROR("[{}] Entry order {} filled {:.6f} after timeout - flattening",
                      trade.id, order_id, late_qty);
            if (!flattenPosition(trade.direction, late_qty, trade.id)) {
                // 다음 주기에 재시도 (reduce-only 라 중복 청산 없음)
                continue;
            }
            if (sink_) {
                sink_->onTradeAnomaly(trade, "late entry fill flattened");
            }
        }

        trade.entry_unresolved = false;
        failTrade(trade, Error::validation("ENTRY_TIMEOUT", late_qty > kQtyEpsilon
            ? "entry filled after timeout, position flattened"
            : "entry order not filled within timeout"));
    }
}

Result<Trade> OrderManager::failTrade(Trade trade, const Error& error) {
    trade.exit_reason = ExitReason::ENTRY_FAILED;
    auto transitioned = TradeLifecycle::transition(trade, TradeStatus::FAILED);
    if (!transitioned) {
        LOG_ERROR("[{}] {}", trade.id, transitioned.error().describe());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_trades_.erase(trade.id);
        archive(trade);
    }

    LOG_ERROR("[{}] Entry FAILED: {}", trade.id, error.describe());
    if (sink_) {
        sink_->onTradeFailed(trade, error.describe());
    }
    return Result<Trade>::fail(error);
}

// ===== Protection =====

void OrderManager::applyFillToLevels(Trade& trade, const PositionSize& size) const {
    const double tick = currentSymbolInfo().tick_size;
    const double sl_distance = std::fabs(size.entry_price_estimate - size.stop_loss);
    const double tp_distance = std::fabs(size.take_profit - size.entry_price_estimate);
    const double fill = trade.entry_price;

    if (trade.direction == Direction::LONG) {
        trade.stop_loss = common::roundDownToTick(fill - sl_distance, tick);
        trade.take_profit = common::roundToTick(fill + tp_distance, tick);
    } else {
        trade.stop_loss = common::roundUpToTick(fill + sl_distance, tick);
        trade.take_profit = common::roundToTick(fill - tp_distance, tick);
    }

    if (std::fabs(fill - size.entry_price_estimate) > kQtyEpsilon) {
        LOG_INFO("[{}] Levels shifted by fill {:.4f} (est. {:.4f}): SL {:.4f} -> {:.4f}, TP {:.4f} -> {:.4f}",
                 trade.id, fill, size.entry_price_estimate,
                 size.stop_loss, trade.stop_loss, size.take_profit, trade.take_profit);
    }
}

void OrderManager::placeProtection(Trade trade) {
    auto placed = placeProtectionOrders(trade);
    if (!placed) {
        LOG_ERROR("[{}] Stop loss placement failed ({}) - closing unprotected position",
                  trade.id, placed.error().describe());
        if (sink_) {
            sink_->onTradeAnomaly(trade, "stop loss placement failed: " + placed.error().describe());
        }
        auto closed = closeTrade(trade.id, ExitReason::ANOMALY);
        if (!closed) {
            LOG_ERROR("[{}] Close of unprotected position failed: {}", trade.id, closed.error().describe());
        }
        return;
    }

    std::string stale_sl;
    std::string stale_tp;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_trades_.find(trade.id);
        const bool accepting = it != active_trades_.end() &&
            (it->second.status == TradeStatus::OPEN ||
             (it->second.status == TradeStatus::CLOSING && !it->second.exit_filled));
        if (accepting) {
            it->second.sl_order = trade.sl_order;
            it->second.tp_order = trade.tp_order;
            it->second.protection_placed = true;
        } else {
            stale_sl = trade.sl_order.exchange_order_id;
            stale_tp = trade.tp_order.exchange_order_id;
        }
    }

    if (!stale_sl.empty() || !stale_tp.empty()) {
        LOG_WARN("[{}] Trade closed while protection was placed - cancelling", trade.id);
        if (!stale_sl.empty()) cancelOrderWithRetry(stale_sl, "stale SL");
        if (!stale_tp.empty()) cancelOrderWithRetry(stale_tp, "stale TP");
    }
}

Status OrderManager::placeProtectionOrders(Trade& trade) {
    const OrderSide side = exitSide(trade.direction);

    auto sl = gateway_->placeStopMarketOrder(side, trade.quantity, trade.stop_loss);
    if (!sl) {
        return Status::fail(sl.error());
    }
    trade.sl_order = sl.value();

    auto tp = gateway_->placeLimitOrder(side, trade.quantity, trade.take_profit, true);
    if (!tp) {
        // SL 만으로도 포지션은 보호됨
        LOG_ERROR("[{}] Take profit placement failed: {} (stop loss stays)", trade.id, tp.error().describe());
        if (sink_) {
            sink_->onTradeAnomaly(trade, "take profit placement failed: " + tp.error().describe());
        }
    } else {
        trade.tp_order = tp.value();
    }

    LOG_INFO("[{}] Protection placed: SL {} @ {:.4f}, TP {} @ {:.4f}", trade.id,
             trade.sl_order.exchange_order_id, trade.stop_loss,
             trade.tp_order.exchange_order_id.empty() ? "-" : trade.tp_order.exchange_order_id,
             trade.take_profit);
    return Status::ok();
}

void OrderManager::onProtectionPlaced(
    const std::string& trade_id,
    const Order& sl_order,
    const Order& tp_order,
    double stop_loss,
    double take_profit
) {
    // CLOSING 중에도 붙인다: 청산이 실패하면 OPEN 으로 돌아가 이 주문이 보호를 맡고,
    // 성공하면 closeTrade 가 exit_filled 설정과 함께 읽어 취소한다
    bool attached = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_trades_.find(trade_id);
        const bool accepting = it != active_trades_.end() &&
            (it->second.status == TradeStatus::OPEN ||
             (it->second.status == TradeStatus::CLOSING && !it->second.exit_filled));
        if (accepting) {
            it->second.sl_order = sl_order;
            it->second.tp_order = tp_order;
            it->second.stop_loss = stop_loss;
            it->second.take_profit = take_profit;
            it->second.protection_placed = true;
            attached = true;
        }
    }

    if (attached) {
        LOG_INFO("[{}] Deferred protection attached: SL {:.4f}, TP {:.4f}", trade_id, stop_loss, take_profit);
        return;
    }

    LOG_WARN("[{}] Deferred protection arrived for inactive trade - cancelling", trade_id);
    if (!sl_order.exchange_order_id.empty()) cancelOrderWithRetry(sl_order.exchange_order_id, "orphan SL");
    if (!tp_order.exchange_order_id.empty()) cancelOrderWithRetry(tp_order.exchange_order_id, "orphan TP");
}

bool OrderManager::isTradeActive(const std::string& trade_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_trades_.find(trade_id);
    return it != active_trades_.end() && !isTerminal(it->second.status);
}

// ===== Monitoring =====

void OrderManager::monitorOnce() {
    resolveUnresolvedEntries();

    std::vector<Trade> watched;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& kv : active_trades_) {
            if (kv.second.status == TradeStatus::OPEN && kv.second.protection_placed) {
                watched.push_back(kv.second);
            }
        }
    }
    if (watched.empty()) {
        return;
    }

    auto open_ids = watcher_.fetchOpenOrderIds();
    if (!open_ids) {
        return;
    }

    for (const auto& trade : watched) {
        const auto gone = OrderWatcher::vanished(
            {trade.sl_order.exchange_order_id, trade.tp_order.exchange_order_id}, open_ids.value());
        if (gone.empty()) {
            continue;
        }

        const bool sl_gone = std::find(gone.begin(), gone.end(), trade.sl_order.exchange_order_id) != gone.end();
        const bool tp_gone = std::find(gone.begin(), gone.end(), trade.tp_order.exchange_order_id) != gone.end();
        handleProtectionVanished(trade, sl_gone, tp_gone);
    }
}

void OrderManager::handleProtectionVanished(const Trade& snapshot, bool sl_gone, bool tp_gone) {
    Trade trade;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_trades_.find(snapshot.id);
        if (it == active_trades_.end() || it->second.status != TradeStatus::OPEN) {
            return;
        }
        auto closing = TradeLifecycle::transition(it->second, TradeStatus::CLOSING);
        if (!closing) {
            return;
        }
        trade = it->second;
    }

    // SL 만 있는 트레이드에서 SL 소멸 = 단일 소멸로 처리
    const bool has_tp = !trade.tp_order.exchange_order_id.empty();
    const bool both_gone = sl_gone && tp_gone && has_tp;

    if (!both_gone) {
        const Order& filled = sl_gone ? trade.sl_order : trade.tp_order;
        const Order& sibling = sl_gone ? trade.tp_order : trade.sl_order;
        double exit_price = sl_gone ? trade.stop_loss : trade.take_profit;
        bool confirmed_unfilled = false;

        auto state = gateway_->getOrder(filled.exchange_order_id);
        if (state) {
            const Order& o = state.value();
            if (o.avg_fill_price > 0.0 && o.filled_qty > 0.0) {
                exit_price = o.avg_fill_price;
            } else if ((o.status == OrderStatus::CANCELLED || o.status == OrderStatus::FAILED) &&
                       o.filled_qty <= kQtyEpsilon) {
                confirmed_unfilled = true;
            }
        }

        if (!confirmed_unfilled) {
            LOG_INFO("[{}] {} filled @ {:.4f}", trade.id, sl_gone ? "Stop loss" : "Take profit", exit_price);
            if (!sibling.exchange_order_id.empty()) {
                cancelOrderWithRetry(sibling.exchange_order_id, sl_gone ? "TP" : "SL");
            }
            finalizeClose(trade.id, exit_price, sl_gone ? ExitReason::STOP_LOSS : ExitReason::TAKE_PROFIT);
            return;
        }

        // 체결 없이 취소된 보호 주문 → 보호 없는 포지션
        LOG_ERROR("[{}] {} order {} was cancelled without fill - force closing",
                  trade.id, sl_gone ? "Stop loss" : "Take profit", filled.exchange_order_id);
        if (sink_) {
            sink_->onTradeAnomaly(trade, "protection order cancelled externally");
        }
        if (!sibling.exchange_order_id.empty()) {
            cancelOrderWithRetry(sibling.exchange_order_id, sl_gone ? "TP" : "SL");
        }
    } else {
        LOG_ERROR("[{}] CRITICAL: SL and TP both vanished from open orders - force closing", trade.id);
        if (sink_) {
            sink_->onTradeAnomaly(trade, "stop loss and take profit vanished simultaneously");
        }
    }

    // 강제 청산 (거래소에 남은 포지션만)
    double exit_price = 0.0;
    if (both_gone) {
        auto sl_state = gateway_->getOrder(trade.sl_order.exchange_order_id);
        if (sl_state && sl_state.value().status == OrderStatus::FILLED && sl_state.value().avg_fill_price > 0.0) {
            exit_price = sl_state.value().avg_fill_price;
        } else {
            auto tp_state = gateway_->getOrder(trade.tp_order.exchange_order_id);
            if (tp_state && tp_state.value().status == OrderStatus::FILLED && tp_state.value().avg_fill_price > 0.0) {
                exit_price = tp_state.value().avg_fill_price;
            }
        }
    }

    auto closed = closeAtMarket(trade);
    if (!closed) {
        // 다음 감시 주기에 재시도
        LOG_ERROR("[{}] Force close failed: {} - will retry", trade.id, closed.error().describe());
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_trades_.find(trade.id);
        if (it != active_trades_.end()) {
            auto reverted = TradeLifecycle::transition(it->second, TradeStatus::OPEN);
            if (!reverted) {
                LOG_ERROR("[{}] {}", trade.id, reverted.error().describe());
            }
        }
        return;
    }

    if (closed.value().filled_qty > kQtyEpsilon && closed.value().avg_fill_price > 0.0) {
        exit_price = closed.value().avg_fill_price;
    }
    if (exit_price <= 0.0) {
        exit_price = fallbackExitPrice(trade);
    }
    finalizeClose(trade.id, exit_price, ExitReason::ANOMALY);
}

bool OrderManager::cancelOrderWithRetry(const std::string& order_id, const std::string& label) {
    const int attempts = std::max(1, config_.orders.close_retry_attempts);
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        auto result = gateway_->cancelOrder(order_id);
        if (result) {
            LOG_INFO("{} order {} cancelled", label, order_id);
            return true;
        }
        LOG_WARN("{} order {} cancel attempt {}/{} failed: {}", label, order_id, attempt, attempts,
                 result.error().describe());
    }
    LOG_ERROR("{} order {} could not be cancelled - check exchange", label, order_id);
    return false;
}

// ===== Exit =====

Result<Order> OrderManager::closeAtMarket(const Trade& trade) {
    const SymbolInfo info = currentSymbolInfo();
    double quantity = trade.quantity;

    auto positions = gateway_->getPositions();
    if (positions) {
        double amount = 0.0;
        for (const auto& p : positions.value()) {
            if (p.symbol == trade.symbol) {
                amount += p.position_amt;
            }
        }
        if (std::fabs(amount) <= kQtyEpsilon) {
            LOG_WARN("[{}] No exchange position left to close", trade.id);
            return Result<Order>::ok(Order());
        }
        quantity = common::floorToStep(std::fabs(amount), info.step_size);
    } else {
        LOG_WARN("[{}] Position check failed ({}) - closing tracked quantity",
                 trade.id, positions.error().describe());
    }

    Error last_error = Error::transient("CLOSE_FAILED", "market close not attempted");
    const int attempts = std::max(1, config_.orders.close_retry_attempts);
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        auto result = gateway_->placeMarketOrder(exitSide(trade.direction), quantity, true);
        if (result) {
            Order order = result.value();
            if (order.status != OrderStatus::FILLED && !order.exchange_order_id.empty()) {
                auto state = gateway_->getOrder(order.exchange_order_id);
                if (state) {
                    order = state.value();
                }
            }
            return Result<Order>::ok(order);
        }
        last_error = result.error();
        LOG_WARN("[{}] Market close attempt {}/{} failed: {}", trade.id, attempt, attempts,
                 last_error.describe());
    }
    return Result<Order>::fail(last_error);
}

Status OrderManager::closeTrade(const std::string& trade_id, ExitReason reason) {
    Trade trade;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_trades_.find(trade_id);
        if (it == active_trades_.end()) {
            return Status::fail(Error::validation("UNKNOWN_TRADE", "no active trade " + trade_id));
        }
        if (it->second.status != TradeStatus::OPEN) {
            return Status::fail(Error::validation(
                "NOT_OPEN", trade_id + " is " + toString(it->second.status)));
        }
        auto closing = TradeLifecycle::transition(it->second, TradeStatus::CLOSING);
        if (!closing) {
            return closing;
        }
        trade = it->second;
    }

    LOG_INFO("[{}] Closing ({})", trade_id, toString(reason));

    bool deferred_cancelled = false;
    if (trade.deferred_protection && !trade.protection_placed && scheduler_) {
        deferred_cancelled = scheduler_->cancel(trade_id);
    }

    auto closed = closeAtMarket(trade);
    if (!closed) {
        LOG_ERROR("[{}] Close FAILED: {} - trade stays OPEN", trade_id, closed.error().describe());
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = active_trades_.find(trade_id);
            if (it != active_trades_.end()) {
                auto reverted = TradeLifecycle::transition(it->second, TradeStatus::OPEN);
                if (!reverted) {
                    LOG_ERROR("[{}] {}", trade_id, reverted.error().describe());
                }
            }
        }
        if (deferred_cancelled && !scheduler_->registerTrade(trade)) {
            LOG_ERROR("[{}] Deferred protection could not be re-registered", trade_id);
        }
        return Status::fail(closed.error());
    }

    // 청산 중 붙은 지연 보호 주문까지 포함해 최신 상태로
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_trades_.find(trade_id);
        if (it != active_trades_.end()) {
            it->second.exit_filled = true;
            trade.sl_order = it->second.sl_order;
            trade.tp_order = it->second.tp_order;
        }
    }

    // 형제 보호 주문 정리 후 CLOSED
    if (!trade.sl_order.exchange_order_id.empty()) {
        cancelOrderWithRetry(trade.sl_order.exchange_order_id, "SL");
    }
    if (!trade.tp_order.exchange_order_id.empty()) {
        cancelOrderWithRetry(trade.tp_order.exchange_order_id, "TP");
    }

    double exit_price = closed.value().avg_fill_price;
    if (exit_price <= 0.0) {
        exit_price = fallbackExitPrice(trade);
    }
    finalizeClose(trade_id, exit_price, reason);
    return Status::ok();
}

int OrderManager::closeAllTrades(ExitReason reason) {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& kv : active_trades_) {
            if (kv.second.status == TradeStatus::OPEN) {
                ids.push_back(kv.first);
            } else if (!isTerminal(kv.second.status)) {
                LOG_WARN("[{}] {} - skipped by close-all (in progress)", kv.first, toString(kv.second.status));
            }
        }
    }

    int closed = 0;
    for (const auto& id : ids) {
        auto result = closeTrade(id, reason);
        if (result) {
            closed++;
        } else {
            LOG_ERROR("[{}] Close-all failed: {}", id, result.error().describe());
        }
    }
    return closed;
}

void OrderManager::finalizeClose(const std::string& trade_id, double exit_price, ExitReason reason) {
    Trade closed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_trades_.find(trade_id);
        if (it == active_trades_.end()) {
            return;
        }
        Trade& t = it->second;
        t.exit_price = exit_price;
        t.exit_reason = reason;
        t.pnl = calculatePnl(t.direction, t.entry_price, exit_price, t.quantity);

        auto transitioned = TradeLifecycle::transition(t, TradeStatus::CLOSED);
        if (!transitioned) {
            LOG_ERROR("[{}] {}", trade_id, transitioned.error().describe());
            return;
        }
        closed = t;
        archive(t);
        active_trades_.erase(it);
    }

    LOG_INFO("[{}] CLOSED {} @ {:.4f} ({}) pnl {:+.4f}", closed.id, toString(closed.direction),
             closed.exit_price, toString(closed.exit_reason), closed.pnl);
    Logger::getInstance().logTrade(closed);
    if (sink_) {
        sink_->onTradeClosed(closed);
    }
}

double OrderManager::fallbackExitPrice(const Trade& trade) {
    auto price = gateway_->getCurrentPrice();
    if (price) {
        return price.value();
    }
    LOG_WARN("[{}] Exit price unknown - using entry price", trade.id);
    return trade.entry_price;
}

double OrderManager::calculatePnl(Direction direction, double entry, double exit, double quantity) {
    return direction == Direction::LONG
        ? (exit - entry) * quantity
        : (entry - exit) * quantity;
}

// ===== Reconciliation =====

Status OrderManager::dropGhostTrade(const std::string& trade_id) {
    Trade trade;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_trades_.find(trade_id);
        if (it == active_trades_.end()) {
            return Status::fail(Error::validation("UNKNOWN_TRADE", "no active trade " + trade_id));
        }
        if (it->second.status == TradeStatus::OPENING) {
            return Status::fail(Error::validation("ENTRY_IN_PROGRESS", trade_id + " is still opening"));
        }
        trade = it->second;
    }

    if (trade.deferred_protection && !trade.protection_placed && scheduler_) {
        scheduler_->cancel(trade_id);
    }
    if (!trade.sl_order.exchange_order_id.empty()) {
        cancelOrderWithRetry(trade.sl_order.exchange_order_id, "ghost SL");
    }
    if (!trade.tp_order.exchange_order_id.empty()) {
        cancelOrderWithRetry(trade.tp_order.exchange_order_id, "ghost TP");
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_trades_.find(trade_id);
        if (it == active_trades_.end()) {
            return Status::ok();
        }
        Trade& t = it->second;
        t.exit_reason = ExitReason::GHOST;
        t.pnl = 0.0;
        auto transitioned = TradeLifecycle::transition(t, TradeStatus::CLOSED);
        if (!transitioned) {
            return transitioned;
        }
        archive(t);
        active_trades_.erase(it);
    }

    LOG_WARN("[{}] Ghost trade dropped (no exchange position)", trade_id);
    return Status::ok();
}

// ===== Queries =====

bool OrderManager::hasActiveTrade() const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& kv : active_trades_) {
        if (!isTerminal(kv.second.status)) {
            return true;
        }
    }
    return false;
}

std::vector<Trade> OrderManager::getActiveTrades() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Trade> trades;
    for (const auto& kv : active_trades_) {
        trades.push_back(kv.second);
    }
    return trades;
}

std::optional<Trade> OrderManager::getTrade(const std::string& trade_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_trades_.find(trade_id);
    if (it != active_trades_.end()) {
        return it->second;
    }
    for (auto rit = closed_trades_.rbegin(); rit != closed_trades_.rend(); ++rit) {
        if (rit->id == trade_id) {
            return *rit;
        }
    }
    return std::nullopt;
}

std::vector<Trade> OrderManager::getClosedTrades() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<Trade>(closed_trades_.begin(), closed_trades_.end());
}

PerformanceStats OrderManager::getPerformanceStats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    PerformanceStats stats;
    double gross_win = 0.0;
    double gross_loss = 0.0;

    for (const auto& t : closed_trades_) {
        if (t.status != TradeStatus::CLOSED || t.exit_reason == ExitReason::GHOST) {
            continue;
        }
        stats.total_trades++;
        stats.total_pnl += t.pnl;
        if (t.pnl > 0.0) {
            stats.winning_trades++;
            gross_win += t.pnl;
        } else if (t.pnl < 0.0) {
            stats.losing_trades++;
            gross_loss += -t.pnl;
        }
    }

    if (stats.total_trades > 0) {
        stats.win_rate = static_cast<double>(stats.winning_trades) / stats.total_trades;
    }
    if (stats.winning_trades > 0) {
        stats.avg_win = gross_win / stats.winning_trades;
    }
    if (stats.losing_trades > 0) {
        stats.avg_loss = gross_loss / stats.losing_trades;
    }
    if (gross_loss > 0.0) {
        stats.profit_factor = gross_win / gross_loss;
    }
    return stats;
}

bool OrderManager::updateTrade(const Trade& trade) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_trades_.find(trade.id);
    if (it == active_trades_.end()) {
        return false;
    }
    it->second = trade;
    return true;
}

void OrderManager::archive(const Trade& trade) {
    closed_trades_.push_back(trade);
    while (closed_trades_.size() > kMaxClosedTrades) {
        closed_trades_.pop_front();
    }
}

} // namespace execution
} // namespace triplersi
