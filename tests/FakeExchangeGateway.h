#pragma once

// 테스트용 인메모리 거래소
//  - 시장가: 즉시 체결, 포지션 반영
//  - 지정가: fill_entry_limits 이면 즉시 체결 (reduce-only 지정가는 항상 대기)
//  - 스탑마켓: 대기. triggerOrder() 로 체결 처리

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "execution/IExchangeGateway.h"

namespace triplersi {
namespace test {

class FakeExchangeGateway : public execution::IExchangeGateway {
public:
    FakeExchangeGateway() {
        symbol_info_.symbol = "BTCUSDC";
    }

    // ===== 시나리오 제어 =====

    void setPrice(double price) {
        std::lock_guard<std::mutex> lock(mutex_);
        price_ = price;
    }

    void setBalance(double balance) {
        std::lock_guard<std::mutex> lock(mutex_);
        balance_ = balance;
    }

    void setPosition(double amount, double entry_price) {
        std::lock_guard<std::mutex> lock(mutex_);
        position_amt_ = amount;
        position_entry_ = entry_price;
    }

    double positionAmount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return position_amt_;
    }

    void setKlines(std::vector<Candle> klines) {
        std::lock_guard<std::mutex> lock(mutex_);
        klines_ = std::move(klines);
    }

    std::atomic<bool> fill_entry_limits{true};
    std::atomic<bool> fail_ping{false};
    std::atomic<bool> fail_positions{false};
    std::atomic<bool> fail_market_orders{false};
    std::atomic<int> fail_next_limit_orders{0};
    std::atomic<int> fail_next_stop_orders{0};
    std::atomic<int> fail_next_cancels{0};
    std::atomic<long long> stop_order_delay_ms{0};
    std::atomic<long long> market_order_delay_ms{0};

    std::atomic<int> market_order_calls{0};
    std::atomic<int> limit_order_calls{0};
    std::atomic<int> stop_order_calls{0};
    std::atomic<int> cancel_calls{0};

    // 대기 주문 체결 (SL/TP 발동)
    bool triggerOrder(const std::string& order_id, double fill_price) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = orders_.find(order_id);
        if (it == orders_.end() || !isOpen(it->second)) {
            return false;
        }
        fill(it->second, fill_price);
        return true;
    }

    // 체결 없이 사라진 주문 (외부 취소)
    bool vanishOrder(const std::string& order_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = orders_.find(order_id);
        if (it == orders_.end()) {
            return false;
        }
        it->second.status = OrderStatus::CANCELLED;
        return true;
    }

    std::optional<Order> findOrder(const std::string& order_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = orders_.find(order_id);
        if (it == orders_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    // ===== IExchangeGateway =====

    Result<double> getBalance() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return Result<double>::ok(balance_);
    }

    Result<SymbolInfo> getSymbolInfo() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return Result<SymbolInfo>::ok(symbol_info_);
    }

    Result<double> getCurrentPrice() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return Result<double>::ok(price_);
    }

    Result<std::vector<Candle>> getKlines(int limit) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Candle> out = klines_;
        if (limit > 0 && static_cast<int>(out.size()) > limit) {
            out.erase(out.begin(), out.end() - limit);
        }
        return Result<std::vector<Candle>>::ok(out);
    }

    Result<Order> placeMarketOrder(OrderSide side, double quantity, bool reduce_only) override {
        market_order_calls++;
        if (market_order_delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(market_order_delay_ms.load()));
        }
        if (fail_market_orders) {
            return Result<Order>::fail(Error::transient("FAKE", "market order rejected"));
        }
        std::lock_guard<std::mutex> lock(mutex_);
        Order order = newOrder(side, OrderType::MARKET, quantity, 0.0, reduce_only);
        fill(order, price_);
        orders_[order.exchange_order_id] = order;
        return Result<Order>::ok(order);
    }

    Result<Order> placeLimitOrder(OrderSide side, double quantity, double price, bool reduce_only) override {
        limit_order_calls++;
        if (consume(fail_next_limit_orders)) {
            return Result<Order>::fail(Error::transient("FAKE", "limit order rejected"));
        }
        std::lock_guard<std::mutex> lock(mutex_);
        Order order = newOrder(side, OrderType::LIMIT, quantity, price, reduce_only);
        if (!reduce_only && fill_entry_limits) {
            fill(order, price);
        }
        orders_[order.exchange_order_id] = order;
        return Result<Order>::ok(order);
    }

    Result<Order> placeStopMarketOrder(OrderSide side, double quantity, double stop_price) override {
        stop_order_calls++;
        if (stop_order_delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(stop_order_delay_ms.load()));
        }
        if (consume(fail_next_stop_orders)) {
            return Result<Order>::fail(Error::transient("FAKE", "stop order rejected"));
        }
        std::lock_guard<std::mutex> lock(mutex_);
        Order order = newOrder(side, OrderType::STOP_MARKET, quantity, 0.0, true);
        order.stop_price = stop_price;
        orders_[order.exchange_order_id] = order;
        return Result<Order>::ok(order);
    }

    Result<Order> getOrder(const std::string& order_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = orders_.find(order_id);
        if (it == orders_.end()) {
            return Result<Order>::fail(Error::validation("UNKNOWN_ORDER", order_id));
        }
        return Result<Order>::ok(it->second);
    }

    Status cancelOrder(const std::string& order_id) override {
        cancel_calls++;
        if (consume(fail_next_cancels)) {
            return Status::fail(Error::transient("FAKE", "cancel timed out"));
        }
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = orders_.find(order_id);
        if (it != orders_.end() && isOpen(it->second)) {
            it->second.status = OrderStatus::CANCELLED;
        }
        return Status::ok();
    }

    Result<std::vector<Order>> getOpenOrders() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Order> open;
        for (const auto& kv : orders_) {
            if (isOpen(kv.second)) {
                open.push_back(kv.second);
            }
        }
        return Result<std::vector<Order>>::ok(open);
    }

    Result<std::vector<ExchangePosition>> getPositions() override {
        if (fail_positions) {
            return Result<std::vector<ExchangePosition>>::fail(Error::transient("FAKE", "positions unavailable"));
        }
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<ExchangePosition> positions;
        if (std::fabs(position_amt_) > 1e-12) {
            ExchangePosition p;
            p.symbol = symbol_info_.symbol;
            p.position_amt = position_amt_;
            p.entry_price = position_entry_;
            positions.push_back(p);
        }
        return Result<std::vector<ExchangePosition>>::ok(positions);
    }

    Result<long long> ping() override {
        if (fail_ping) {
            return Result<long long>::fail(Error::transient("FAKE", "ping failed"));
        }
        return Result<long long>::ok(5);
    }

private:
    mutable std::mutex mutex_;
    SymbolInfo symbol_info_;
    std::map<std::string, Order> orders_;
    long long next_id_ = 1;

    double price_ = 100.0;
    double balance_ = 1000.0;
    double position_amt_ = 0.0;
    double position_entry_ = 0.0;
    std::vector<Candle> klines_;

    static bool consume(std::atomic<int>& counter) {
        int current = counter.load();
        while (current > 0) {
            if (counter.compare_exchange_weak(current, current - 1)) {
                return true;
            }
        }
        return false;
    }

    static bool isOpen(const Order& order) {
        return order.status == OrderStatus::PENDING || order.status == OrderStatus::PARTIALLY_FILLED;
    }

    Order newOrder(OrderSide side, OrderType type, double quantity, double price, bool reduce_only) {
        Order order;
        order.exchange_order_id = std::to_string(next_id_++);
        order.side = side;
        order.type = type;
        order.quantity = quantity;
        order.price = price;
        order.reduce_only = reduce_only;
        order.status = OrderStatus::PENDING;
        order.update_time = nowMs();
        return order;
    }

    void fill(Order& order, double price) {
        double qty = order.quantity;
        const double signed_qty = order.side == OrderSide::BUY ? qty : -qty;

        if (order.reduce_only) {
            // 포지션 반대 방향으로만, 포지션 크기까지만
            if (position_amt_ * signed_qty >= 0.0) {
                qty = 0.0;
            } else {
                qty = std::min(qty, std::fabs(position_amt_));
            }
        }

        const double delta = order.side == OrderSide::BUY ? qty : -qty;
        if (position_amt_ * delta >= 0.0 && qty > 0.0) {
            const double total = std::fabs(position_amt_) + qty;
            position_entry_ = (std::fabs(position_amt_) * position_entry_ + qty * price) / total;
        }
        position_amt_ += delta;
        if (std::fabs(position_amt_) < 1e-12) {
            position_amt_ = 0.0;
            position_entry_ = 0.0;
        }

        order.status = OrderStatus::FILLED;
        order.filled_qty = qty > 0.0 ? qty : order.quantity;
        order.avg_fill_price = price;
        order.update_time = nowMs();
    }
};

} // namespace test
} // namespace triplersi
