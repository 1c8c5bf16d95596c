#include "engine/ConnectionSupervisor.h"
#include "FakeExchangeGateway.h"
#include "FakeMarketFeed.h"
#include "RecordingNotifier.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace triplersi;
using engine::ConnectionState;
using engine::ConnectionSupervisor;
using test::FakeExchangeGateway;
using test::FakeMarketFeed;
using test::RecordingNotifier;

namespace {

// 생성 순서(1부터)별로 연결 성공 여부를 정하는 팩토리
struct FeedScript {
    std::function<bool(int)> connects;
    std::atomic<int> created{0};

    network::MarketFeedFactory factory() {
        return [this](network::IFeedListener* listener) {
            const int n = ++created;
            return std::unique_ptr<network::IMarketFeed>(
                new FakeMarketFeed(listener, nullptr, connects(n)));
        };
    }
};

bool waitUntil(const std::function<bool()>& predicate, int timeout_ms = 3000) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

engine::EngineConfig testConfig() {
    engine::EngineConfig cfg;
    cfg.connection.retry_interval_ms = 100;
    cfg.connection.backoff_max_ms = 250;
    cfg.connection.connect_wait_ms = 500;
    cfg.connection.connect_poll_ms = 10;
    cfg.connection.safe_mode_recheck_delay_ms = 1;
    cfg.orders.entry_order_type = engine::EntryOrderType::MARKET;
    cfg.orders.deferred_protection = false;
    return cfg;
}

} // namespace

int main() {
    // 지수 백오프 + 상한
    {
        assert(ConnectionSupervisor::backoffDelay(1, 30000, 300000) == 30000);
        assert(ConnectionSupervisor::backoffDelay(2, 30000, 300000) == 60000);
        assert(ConnectionSupervisor::backoffDelay(3, 30000, 300000) == 120000);
        assert(ConnectionSupervisor::backoffDelay(4, 30000, 300000) == 240000);
        assert(ConnectionSupervisor::backoffDelay(5, 30000, 300000) == 300000);
        assert(ConnectionSupervisor::backoffDelay(40, 30000, 300000) == 300000);
        assert(ConnectionSupervisor::backoffDelay(0, 30000, 300000) == 30000);
    }

    // 3번째 시도에서 재연결 → 안전 모드 + 재동기화 (ghost 정리, 보호 주문 취소)
    {
        auto gateway = std::make_shared<FakeExchangeGateway>();
        const auto cfg = testConfig();
        execution::OrderManager om(gateway, cfg);
        RecordingNotifier notifier;

        Signal signal;
        signal.direction = Direction::LONG;
        PositionSize size;
        size.quantity = 1.0;
        size.entry_price_estimate = 100.0;
        size.stop_loss = 99.0;
        size.take_profit = 101.2;
        auto opened = om.openTrade(signal, size);
        assert(opened);
        const Trade trade = opened.value();

        // 1: 최초 연결, 2~3: 실패, 4: 성공
        FeedScript script;
        script.connects = [](int n) { return n == 1 || n >= 4; };

        ConnectionSupervisor sup(cfg, gateway, &om, script.factory(), &notifier);
        std::mutex delays_mutex;
        std::vector<long long> delays;
        sup.setSleepFunction([&](long long ms) {
            std::lock_guard<std::mutex> lock(delays_mutex);
            delays.push_back(ms);
        });

        assert(sup.start());
        assert(sup.isFeedConnected());
        assert(sup.state() == ConnectionState::CONNECTED);

        // 연결이 끊긴 동안 포지션이 외부에서 정리됨
        gateway->setPosition(0.0, 0.0);
        sup.onFeedDisconnected("socket closed");

        assert(waitUntil([&]() { return sup.state() == ConnectionState::SAFE_MODE; }));
        assert(waitUntil([&]() { return !om.hasActiveTrade(); }));

        {
            std::lock_guard<std::mutex> lock(delays_mutex);
            assert(delays.size() == 3);
            assert(delays[0] == 100);
            assert(delays[1] == 200);
            assert(delays[2] == 250);
        }
        assert(script.created == 4);

        auto status = sup.status();
        assert(status.feed_connected);
        assert(status.total_reconnections == 1);
        assert(status.attempt == 3);
        assert(status.safe_mode_remaining_ms > 0);
        assert(sup.isInSafeMode());

        auto dropped = om.getTrade(trade.id);
        assert(dropped->exit_reason == ExitReason::GHOST);
        assert(gateway->findOrder(trade.sl_order.exchange_order_id)->status == OrderStatus::CANCELLED);
        assert(gateway->findOrder(trade.tp_order.exchange_order_id)->status == OrderStatus::CANCELLED);
        assert(notifier.contains(notifier.reconciliations, "ghost"));
        assert(notifier.contains(notifier.connections, "safe mode"));

        // 안전 모드: 포지션 2회 확인 후 허용
        assert(sup.validateTradeConditions());

        sup.stop();
        assert(sup.state() == ConnectionState::DISCONNECTED);
    }

    // 엔진이 모르는 포지션 → 거래 차단, 운영자 해제
    {
        auto gateway = std::make_shared<FakeExchangeGateway>();
        const auto cfg = testConfig();
        execution::OrderManager om(gateway, cfg);
        RecordingNotifier notifier;

        FeedScript script;
        script.connects = [](int) { return true; };
        ConnectionSupervisor sup(cfg, gateway, &om, script.factory(), &notifier);
        assert(sup.start());
        assert(sup.validateTradeConditions());

        gateway->setPosition(-0.5, 101.0);
        auto report = sup.reconcile();
        assert(report.success);
        assert(report.exchange_positions == 1);
        assert(report.untracked_positions.size() == 1);
        assert(report.ghost_trades.empty());
        assert(sup.isTradingBlocked());
        assert(notifier.contains(notifier.reconciliations, "untracked"));

        auto blocked = sup.validateTradeConditions();
        assert(!blocked);
        assert(blocked.error().code == "TRADING_BLOCKED");

        sup.clearTradingBlock();
        assert(!sup.isTradingBlocked());

        auto exists = sup.validateTradeConditions();
        assert(!exists && exists.error().code == "POSITION_EXISTS");

        gateway->setPosition(0.0, 0.0);
        gateway->fail_positions = true;
        auto unknown = sup.validateTradeConditions();
        assert(!unknown && unknown.error().kind == ErrorKind::TRANSIENT);

        gateway->fail_positions = false;
        assert(sup.validateTradeConditions());

        // 재동기화 실패는 보고만
        gateway->fail_positions = true;
        auto failed = sup.reconcile();
        assert(!failed.success);
        assert(!failed.error.empty());
        sup.stop();
    }

    // 재시도 한도 초과 → 포기 콜백
    {
        auto gateway = std::make_shared<FakeExchangeGateway>();
        auto cfg = testConfig();
        cfg.connection.max_retries = 2;

        FeedScript script;
        script.connects = [](int n) { return n == 1; };
        ConnectionSupervisor sup(cfg, gateway, nullptr, script.factory());
        sup.setSleepFunction([](long long) {});

        std::atomic<bool> gave_up{false};
        std::mutex reason_mutex;
        std::string give_up_reason;
        sup.setGiveUpHandler([&](const std::string& reason) {
            std::lock_guard<std::mutex> lock(reason_mutex);
            give_up_reason = reason;
            gave_up = true;
        });

        assert(sup.start());
        sup.onFeedDisconnected("network down");
        assert(waitUntil([&]() { return gave_up.load(); }));

        assert(sup.state() == ConnectionState::DISCONNECTED);
        assert(script.created == 3);
        {
            std::lock_guard<std::mutex> lock(reason_mutex);
            assert(give_up_reason.find("2 attempts") != std::string::npos);
        }
        auto unavailable = sup.validateTradeConditions();
        assert(!unavailable && unavailable.error().code == "FEED_UNAVAILABLE");
        sup.stop();
    }

    // 자동 재연결 꺼짐 → 즉시 포기
    {
        auto gateway = std::make_shared<FakeExchangeGateway>();
        auto cfg = testConfig();
        cfg.connection.retry_enabled = false;

        FeedScript script;
        script.connects = [](int) { return true; };
        ConnectionSupervisor sup(cfg, gateway, nullptr, script.factory());
        std::atomic<int> give_ups{0};
        sup.setGiveUpHandler([&](const std::string&) { give_ups++; });

        assert(sup.start());
        sup.onFeedDisconnected("closed");
        assert(give_ups == 1);
        assert(sup.state() == ConnectionState::DISCONNECTED);
        assert(script.created == 1);
        sup.stop();
    }

    // 최초 연결 실패 → 재연결 루프에서 복구, 강제 재연결
    {
        auto gateway = std::make_shared<FakeExchangeGateway>();
        const auto cfg = testConfig();

        FeedScript script;
        script.connects = [](int n) { return n >= 2; };
        ConnectionSupervisor sup(cfg, gateway, nullptr, script.factory());
        sup.setSleepFunction([](long long) {});

        assert(!sup.start());
        assert(waitUntil([&]() { return sup.state() == ConnectionState::SAFE_MODE; }));
        assert(script.created == 2);

        assert(sup.forceReconnection());
        assert(waitUntil([&]() { return script.created == 3 && sup.isFeedConnected(); }));
        assert(waitUntil([&]() { return sup.status().total_reconnections == 2; }));
        sup.stop();
        assert(!sup.forceReconnection());
    }

    // 데이터가 끊긴 피드 → 재연결 요청
    {
        auto gateway = std::make_shared<FakeExchangeGateway>();
        auto cfg = testConfig();
        cfg.connection.stale_feed_timeout_ms = 20;

        FeedScript script;
        script.connects = [](int n) { return n != 2; };
        ConnectionSupervisor sup(cfg, gateway, nullptr, script.factory());
        sup.setSleepFunction([](long long) {});
        assert(sup.start());

        sup.onFeedData();
        assert(sup.lastDataTimeMs() > 0);
        assert(!sup.checkFeedStaleness());

        std::this_thread::sleep_for(std::chrono::milliseconds(40));
        assert(sup.checkFeedStaleness());
        assert(waitUntil([&]() { return sup.state() == ConnectionState::SAFE_MODE; }));
        assert(script.created == 3);

        sup.stop();
        assert(!sup.checkFeedStaleness());
    }

    std::cout << "[TEST] ConnectionSupervisor PASSED\n";
    return 0;
}
