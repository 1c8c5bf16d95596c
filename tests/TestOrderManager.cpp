#include "execution/OrderManager.h"
#include "FakeExchangeGateway.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace triplersi;
using execution::OrderManager;
using test::FakeExchangeGateway;

namespace {

bool near(double a, double b, double eps = 1e-6) {
    return std::fabs(a - b) < eps;
}

class RecordingSink : public execution::ITradeLifecycleSink {
public:
    void onTradeOpened(const Trade& trade) override {
        std::lock_guard<std::mutex> lock(mutex);
        opened.push_back(trade);
    }
    void onTradeClosed(const Trade& trade) override {
        std::lock_guard<std::mutex> lock(mutex);
        closed.push_back(trade);
    }
    void onTradeFailed(const Trade& trade, const std::string& reason) override {
        std::lock_guard<std::mutex> lock(mutex);
        failed.push_back(trade);
        fail_reasons.push_back(reason);
    }
    void onFallbackFill(const Trade& trade, double slippage_pct) override {
        std::lock_guard<std::mutex> lock(mutex);
        (void)trade;
        fallback_slippage.push_back(slippage_pct);
    }
    void onTradeAnomaly(const Trade& trade, const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex);
        (void)trade;
        anomalies.push_back(message);
    }

    std::mutex mutex;
    std::vector<Trade> opened;
    std::vector<Trade> closed;
    std::vector<Trade> failed;
    std::vector<std::string> fail_reasons;
    std::vector<double> fallback_slippage;
    std::vector<std::string> anomalies;
};

engine::EngineConfig testConfig() {
    engine::EngineConfig cfg;
    cfg.orders.order_execution_timeout_ms = 50;
    cfg.orders.fill_poll_interval_ms = 5;
    cfg.orders.deferred_protection = false;
    return cfg;
}

Signal longSignal() {
    Signal s;
    s.direction = Direction::LONG;
    s.confidence = 1.0;
    s.indicators.close = 100.0;
    return s;
}

PositionSize longSize() {
    PositionSize ps;
    ps.quantity = 10.0;
    ps.entry_price_estimate = 100.0;
    ps.stop_loss = 99.0;
    ps.take_profit = 101.2;
    ps.notional = 1000.0;
    ps.risk_amount = 10.0;
    return ps;
}

} // namespace

int main() {
    // 지정가 진입 → 체결가 기준 SL/TP 재계산 → SL 발동 → TP 취소, STOP_LOSS
    {
        auto gateway = std::make_shared<FakeExchangeGateway>();
        RecordingSink sink;
        OrderManager om(gateway, testConfig(), &sink);

        auto opened = om.openTrade(longSignal(), longSize());
        assert(opened);
        const Trade trade = opened.value();
        assert(trade.status == TradeStatus::OPEN);
        assert(near(trade.entry_price, 99.99));
        assert(near(trade.stop_loss, 98.99));
        assert(near(trade.take_profit, 101.19));
        assert(trade.protection_placed);
        assert(!trade.sl_order.exchange_order_id.empty());
        assert(!trade.tp_order.exchange_order_id.empty());
        assert(near(gateway->positionAmount(), 10.0));
        assert(sink.opened.size() == 1);
        assert(om.hasActiveTrade());

        // 보호 주문 그대로면 변화 없음
        om.monitorOnce();
        assert(om.getTrade(trade.id)->status == TradeStatus::OPEN);

        assert(gateway->triggerOrder(trade.sl_order.exchange_order_id, 98.99));
        om.monitorOnce();

        auto closed = om.getTrade(trade.id);
        assert(closed);
        assert(closed->status == TradeStatus::CLOSED);
        assert(closed->exit_reason == ExitReason::STOP_LOSS);
        assert(near(closed->exit_price, 98.99));
        assert(near(closed->pnl, -10.0));
        assert(gateway->findOrder(trade.tp_order.exchange_order_id)->status == OrderStatus::CANCELLED);
        assert(!om.hasActiveTrade());
        assert(sink.closed.size() == 1);

        auto stats = om.getPerformanceStats();
        assert(stats.total_trades == 1);
        assert(stats.losing_trades == 1);
        assert(stats.win_rate == 0.0);
    }

    // TP 체결 → SL 취소, 수익
    {
        auto gateway = std::make_shared<FakeExchangeGateway>();
        RecordingSink sink;
        OrderManager om(gateway, testConfig(), &sink);

        auto opened = om.openTrade(longSignal(), longSize());
        assert(opened);
        const Trade trade = opened.value();
        assert(gateway->triggerOrder(trade.tp_order.exchange_order_id, 101.19));
        om.monitorOnce();

        auto closed = om.getTrade(trade.id);
        assert(closed->exit_reason == ExitReason::TAKE_PROFIT);
        assert(near(closed->pnl, 12.0));
        assert(gateway->findOrder(trade.sl_order.exchange_order_id)->status == OrderStatus::CANCELLED);
        assert(near(om.getPerformanceStats().win_rate, 1.0));
    }

    // 지정가 타임아웃, 폴백 없음 → FAILED, 포지션 없음
    {
        auto gateway = std::make_shared<FakeExchangeGateway>();
        gateway->fill_entry_limits = false;
        RecordingSink sink;
        auto cfg = testConfig();
        cfg.orders.market_fallback_enabled = false;
        OrderManager om(gateway, cfg, &sink);

        auto opened = om.openTrade(longSignal(), longSize());
        assert(!opened);
        assert(opened.error().code == "ENTRY_TIMEOUT");
        assert(!om.hasActiveTrade());
        assert(near(gateway->positionAmount(), 0.0));
        assert(gateway->market_order_calls == 0);
        assert(sink.failed.size() == 1);
        assert(sink.failed[0].status == TradeStatus::FAILED);
        assert(sink.failed[0].exit_reason == ExitReason::ENTRY_FAILED);

        auto history = om.getClosedTrades();
        assert(history.size() == 1);
        assert(history[0].status == TradeStatus::FAILED);
    }

    // 타임아웃 후 진입 주문 취소 실패 → OPENING 유지, 늦은 체결은 청산 후 FAILED
    {
        auto gateway = std::make_shared<FakeExchangeGateway>();
        gateway->fill_entry_limits = false;
        gateway->fail_next_cancels = 1000;
        RecordingSink sink;
        auto cfg = testConfig();
        cfg.orders.market_fallback_enabled = false;
        OrderManager om(gateway, cfg, &sink);

        auto opened = om.openTrade(longSignal(), longSize());
        assert(!opened);
        assert(opened.error().code == "ENTRY_UNRESOLVED");
        assert(om.hasActiveTrade());
        assert(sink.failed.empty());
        assert(sink.anomalies.size() == 1);
        assert(gateway->market_order_calls == 0);

        auto active = om.getActiveTrades();
        assert(active.size() == 1);
        const Trade held = active[0];
        assert(held.status == TradeStatus::OPENING);
        assert(held.entry_unresolved);
        const std::string entry_id = held.entry_order.exchange_order_id;
        assert(!entry_id.empty());
        assert(gateway->findOrder(entry_id)->status == OrderStatus::PENDING);

        // 미해결 동안 신규 진입 불가
        auto second = om.openTrade(longSignal(), longSize());
        assert(!second);
        assert(second.error().code == "POSITION_OPEN");

        // 아직 살아 있음 → 계속 대기
        om.monitorOnce();
        assert(om.getTrade(held.id)->status == TradeStatus::OPENING);

        // 늦은 체결 → 다음 감시에서 청산
        assert(gateway->triggerOrder(entry_id, 99.99));
        assert(near(gateway->positionAmount(), 10.0));
        om.monitorOnce();

        assert(!om.hasActiveTrade());
        assert(near(gateway->positionAmount(), 0.0));
        assert(gateway->market_order_calls == 1);
        auto failed = om.getTrade(held.id);
        assert(failed->status == TradeStatus::FAILED);
        assert(failed->exit_reason == ExitReason::ENTRY_FAILED);
        assert(sink.failed.size() == 1);
        assert(sink.fail_reasons[0].find("flattened") != std::string::npos);
        assert(sink.anomalies.size() == 2);
    }

    // 취소가 다음 감시에서 확인됨 → 체결 없음, FAILED
    {
        auto gateway = std::make_shared<FakeExchangeGateway>();
        gateway->fill_entry_limits = false;
        gateway->fail_next_cancels = 3;
        RecordingSink sink;
        auto cfg = testConfig();
        cfg.orders.market_fallback_enabled = false;
        OrderManager om(gateway, cfg, &sink);

        auto opened = om.openTrade(longSignal(), longSize());
        assert(!opened);
        assert(opened.error().code == "ENTRY_UNRESOLVED");
        const Trade held = om.getActiveTrades().at(0);

        om.monitorOnce();
        assert(!om.hasActiveTrade());
        assert(gateway->findOrder(held.entry_order.exchange_order_id)->status == OrderStatus::CANCELLED);
        assert(om.getTrade(held.id)->status == TradeStatus::FAILED);
        assert(near(gateway->positionAmount(), 0.0));
        assert(gateway->market_order_calls == 0);
        assert(sink.failed.size() == 1);
    }

    // 지정가 타임아웃 → 시장가 폴백 (degraded fill)
    {
        auto gateway = std::make_shared<FakeExchangeGateway>();
        gateway->fill_entry_limits = false;
        RecordingSink sink;
        OrderManager om(gateway, testConfig(), &sink);

        auto opened = om.openTrade(longSignal(), longSize());
        assert(opened);
        const Trade trade = opened.value();
        assert(trade.status == TradeStatus::OPEN);
        assert(trade.degraded_fill);
        assert(near(trade.entry_price, 100.0));
        assert(near(trade.stop_loss, 99.0));
        assert(sink.fallback_slippage.size() == 1);
        assert(sink.fallback_slippage[0] < 0.03);
        assert(sink.failed.empty());
    }

    // 폴백 슬리피지 초과 → 즉시 청산 후 FAILED
    {
        auto gateway = std::make_shared<FakeExchangeGateway>();
        gateway->fill_entry_limits = false;
        RecordingSink sink;
        auto cfg = testConfig();
        cfg.orders.limit_spread_percent = 0.1;
        OrderManager om(gateway, cfg, &sink);

        auto opened = om.openTrade(longSignal(), longSize());
        assert(!opened);
        assert(opened.error().code == "SLIPPAGE_EXCEEDED");
        assert(near(gateway->positionAmount(), 0.0));
        assert(gateway->market_order_calls == 2);
        assert(!om.hasActiveTrade());
        assert(sink.failed.size() == 1);
    }

    // 동시 진입 → 하나만 성공
    {
        auto gateway = std::make_shared<FakeExchangeGateway>();
        auto cfg = testConfig();
        cfg.orders.entry_order_type = engine::EntryOrderType::MARKET;
        OrderManager om(gateway, cfg);

        std::atomic<int> successes{0};
        std::atomic<int> refusals{0};
        std::vector<std::thread> threads;
        for (int i = 0; i < 4; ++i) {
            threads.emplace_back([&]() {
                auto r = om.openTrade(longSignal(), longSize());
                if (r) {
                    successes++;
                } else if (r.error().code == "POSITION_OPEN") {
                    refusals++;
                }
            });
        }
        for (auto& t : threads) {
            t.join();
        }
        assert(successes == 1);
        assert(refusals == 3);
        assert(om.getActiveTrades().size() == 1);
        assert(near(gateway->positionAmount(), 10.0));
    }

    // SL/TP 동시 소멸 → ANOMALY 강제 청산
    {
        auto gateway = std::make_shared<FakeExchangeGateway>();
        RecordingSink sink;
        OrderManager om(gateway, testConfig(), &sink);

        auto opened = om.openTrade(longSignal(), longSize());
        assert(opened);
        const Trade trade = opened.value();

        gateway->vanishOrder(trade.sl_order.exchange_order_id);
        gateway->vanishOrder(trade.tp_order.exchange_order_id);
        om.monitorOnce();

        auto closed = om.getTrade(trade.id);
        assert(closed->status == TradeStatus::CLOSED);
        assert(closed->exit_reason == ExitReason::ANOMALY);
        assert(near(gateway->positionAmount(), 0.0));
        assert(sink.anomalies.size() == 1);
    }

    // SL 배치 실패 → 보호 없는 포지션 청산
    {
        auto gateway = std::make_shared<FakeExchangeGateway>();
        gateway->fail_next_stop_orders = 1;
        RecordingSink sink;
        OrderManager om(gateway, testConfig(), &sink);

        auto opened = om.openTrade(longSignal(), longSize());
        assert(opened);
        assert(opened.value().status == TradeStatus::CLOSED);
        assert(opened.value().exit_reason == ExitReason::ANOMALY);
        assert(near(gateway->positionAmount(), 0.0));
        assert(!sink.anomalies.empty());
    }

    // 수동 청산
    {
        auto gateway = std::make_shared<FakeExchangeGateway>();
        RecordingSink sink;
        OrderManager om(gateway, testConfig(), &sink);

        auto opened = om.openTrade(longSignal(), longSize());
        assert(opened);
        const Trade trade = opened.value();

        gateway->setPrice(101.0);
        assert(om.closeTrade(trade.id, ExitReason::MANUAL));

        auto closed = om.getTrade(trade.id);
        assert(closed->status == TradeStatus::CLOSED);
        assert(closed->exit_reason == ExitReason::MANUAL);
        assert(near(closed->exit_price, 101.0));
        assert(near(closed->pnl, (101.0 - 99.99) * 10.0));
        assert(gateway->findOrder(trade.sl_order.exchange_order_id)->status == OrderStatus::CANCELLED);
        assert(gateway->findOrder(trade.tp_order.exchange_order_id)->status == OrderStatus::CANCELLED);
        assert(near(gateway->positionAmount(), 0.0));

        auto again = om.closeTrade(trade.id, ExitReason::MANUAL);
        assert(!again && again.error().code == "UNKNOWN_TRADE");
    }

    // 거래소 포지션 없는 트레이드 정리 (ghost)
    {
        auto gateway = std::make_shared<FakeExchangeGateway>();
        RecordingSink sink;
        OrderManager om(gateway, testConfig(), &sink);

        auto opened = om.openTrade(longSignal(), longSize());
        assert(opened);
        const Trade trade = opened.value();

        gateway->setPosition(0.0, 0.0);
        assert(om.dropGhostTrade(trade.id));

        auto dropped = om.getTrade(trade.id);
        assert(dropped->status == TradeStatus::CLOSED);
        assert(dropped->exit_reason == ExitReason::GHOST);
        assert(dropped->pnl == 0.0);
        assert(gateway->findOrder(trade.sl_order.exchange_order_id)->status == OrderStatus::CANCELLED);
        assert(sink.closed.empty());
        assert(om.getPerformanceStats().total_trades == 0);
        assert(!om.hasActiveTrade());
    }

    assert(near(OrderManager::calculatePnl(Direction::SHORT, 100.0, 98.0, 2.0), 4.0));
    assert(near(OrderManager::calculatePnl(Direction::LONG, 100.0, 98.0, 2.0), -4.0));

    std::cout << "[TEST] OrderManager PASSED\n";
    return 0;
}
