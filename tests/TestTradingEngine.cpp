#include "engine/TradingEngine.h"
#include "FakeExchangeGateway.h"
#include "FakeMarketFeed.h"
#include "RecordingNotifier.h"

#include <atomic>
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <memory>

using namespace triplersi;
using engine::TradingEngine;
using test::FakeExchangeGateway;
using test::FakeMarketFeed;
using test::RecordingNotifier;

namespace {

bool near(double a, double b, double eps = 1e-6) {
    return std::fabs(a - b) < eps;
}

engine::EngineConfig testConfig() {
    engine::EngineConfig cfg;
    cfg.health_check_interval_ms = 60000;
    cfg.orders.entry_order_type = engine::EntryOrderType::MARKET;
    cfg.orders.deferred_protection = false;
    cfg.orders.monitor_interval_ms = 60000;
    return cfg;
}

// 마지막으로 만들어진 피드를 잡아두는 팩토리
struct FeedHolder {
    std::atomic<FakeMarketFeed*> last{nullptr};

    engine::CandleFeedFactory factory() {
        return [this](network::IFeedListener* listener, network::IMarketFeed::CandleHandler handler) {
            auto* feed = new FakeMarketFeed(listener, std::move(handler), true);
            last = feed;
            return std::unique_ptr<network::IMarketFeed>(feed);
        };
    }
};

Signal longSignal() {
    Signal s;
    s.direction = Direction::LONG;
    s.confidence = 1.0;
    s.indicators.close = 100.0;
    s.indicators.ha_lowest_low = 99.5;
    s.indicators.ha_highest_high = 100.5;
    return s;
}

} // namespace

int main() {
    // 손절 기준: HA 극값 ± 버퍼
    {
        Signal s = longSignal();
        auto stop = TradingEngine::calculateStopLoss(s, 0.002);
        assert(stop && near(stop.value(), 99.301));

        s.direction = Direction::SHORT;
        s.indicators.ha_highest_high = 101.0;
        stop = TradingEngine::calculateStopLoss(s, 0.002);
        assert(stop && near(stop.value(), 101.202));

        s.indicators.ha_highest_high = std::numeric_limits<double>::quiet_NaN();
        stop = TradingEngine::calculateStopLoss(s, 0.002);
        assert(!stop && stop.error().code == "NO_STOP_REFERENCE");
    }

    // 신호 → 진입, 보유 중 신호 무시, 수동 청산, 비상 정지 / 해제
    {
        auto gateway = std::make_shared<FakeExchangeGateway>();
        auto notifier = std::make_shared<RecordingNotifier>();
        FeedHolder feeds;
        TradingEngine engine(testConfig(), gateway, feeds.factory(), notifier);

        assert(engine.start());
        assert(engine.isRunning());
        assert(!engine.start());
        assert(engine.connectionSupervisor().isFeedConnected());

        engine.onSignal(longSignal());
        assert(notifier->count(notifier->opened) == 1);
        auto trades = engine.orderManager().getActiveTrades();
        assert(trades.size() == 1);
        const Trade trade = trades[0];
        assert(trade.status == TradeStatus::OPEN);
        assert(near(trade.quantity, 10.0));         // 명목가 상한 1000 / 100
        assert(near(trade.stop_loss, 99.30));
        assert(near(trade.take_profit, 100.84));
        assert(near(gateway->positionAmount(), 10.0));

        // 보유 중 신호는 거절이 아니라 무시
        engine.onSignal(longSignal());
        assert(notifier->count(notifier->rejections) == 0);
        assert(engine.orderManager().getActiveTrades().size() == 1);
        assert(gateway->market_order_calls == 1);

        auto health = engine.healthSnapshot();
        assert(health.running);
        assert(health.active_trades == 1);
        assert(near(health.balance, 1000.0));
        assert(health.connection_state == engine::ConnectionState::CONNECTED);

        gateway->setPrice(101.0);
        assert(engine.closePosition("operator"));
        assert(notifier->count(notifier->closed) == 1);
        assert(near(gateway->positionAmount(), 0.0));
        auto risk = engine.riskManager().getRiskState();
        assert(risk.total_trades == 1);
        assert(risk.winning_trades == 1);

        auto none = engine.closePosition("again");
        assert(!none && none.error().code == "NO_POSITION");

        // 비상 정지 → 알림 1회, 신호 거절
        engine.emergencyStop("operator test");
        engine.emergencyStop("operator test");
        assert(notifier->count(notifier->emergencies) == 1);

        engine.onSignal(longSignal());
        assert(notifier->contains(notifier->rejections, "emergency"));
        assert(!engine.orderManager().hasActiveTrade());

        assert(engine.manualOverride("resume"));
        assert(!engine.manualOverride("resume"));

        engine.onSignal(longSignal());
        assert(engine.orderManager().hasActiveTrade());

        // 보유 중 비상 정지 → 전량 청산
        engine.emergencyStop("second stop");
        assert(notifier->count(notifier->emergencies) == 2);
        assert(!engine.orderManager().hasActiveTrade());
        auto closed = engine.orderManager().getClosedTrades();
        assert(closed.back().exit_reason == ExitReason::EMERGENCY);
        assert(near(gateway->positionAmount(), 0.0));

        engine.stop();
        assert(!engine.isRunning());
    }

    // 마감 캔들 → 지표 → 신호 → 진입
    {
        auto gateway = std::make_shared<FakeExchangeGateway>();
        auto notifier = std::make_shared<RecordingNotifier>();
        FeedHolder feeds;
        TradingEngine engine(testConfig(), gateway, feeds.factory(), notifier);
        assert(engine.start());

        FakeMarketFeed* feed = feeds.last.load();
        assert(feed != nullptr);

        // 40 개 연속 하락 → RSI 전부 과매도 (HA 음봉)
        const Timestamp start = 1700000000000LL;
        for (int i = 0; i < 40; ++i) {
            const double open = 200.0 - i;
            const double close = open - 1.0;
            Candle c(start + i * 300000LL, open, open + 0.2, close - 0.2, close, 5.0);
            c.close_time = c.open_time + 299999;
            feed->push(c);
        }
        assert(engine.signalDetector().status().pending_long);
        assert(!engine.orderManager().hasActiveTrade());

        // 미마감 캔들은 무시
        Candle forming(start + 40 * 300000LL, 160.0, 175.5, 159.8, 175.0, 5.0);
        forming.closed = false;
        feed->push(forming);
        assert(!engine.orderManager().hasActiveTrade());

        // 장대 양봉 → HA 양봉 확인
        gateway->setPrice(175.0);
        Candle green = forming;
        green.closed = true;
        green.close_time = green.open_time + 299999;
        feed->push(green);

        assert(notifier->count(notifier->opened) == 1);
        auto trades = engine.orderManager().getActiveTrades();
        assert(trades.size() == 1);
        assert(trades[0].direction == Direction::LONG);
        assert(trades[0].stop_loss < 160.0);
        assert(trades[0].take_profit > 175.0);
        assert(!engine.signalDetector().status().pending_long);
        assert(engine.healthSnapshot().last_data_time_ms > 0);

        engine.stop();
    }

    // API 연속 실패 → 비상 정지, 거래 비활성 → 신호 거절
    {
        auto gateway = std::make_shared<FakeExchangeGateway>();
        auto notifier = std::make_shared<RecordingNotifier>();
        FeedHolder feeds;
        auto cfg = testConfig();
        cfg.trading_enabled = false;
        TradingEngine engine(cfg, gateway, feeds.factory(), notifier);
        assert(engine.start());

        engine.onSignal(longSignal());
        assert(notifier->contains(notifier->rejections, "disabled"));

        gateway->fail_ping = true;
        engine.runHealthCheck();
        engine.runHealthCheck();
        assert(notifier->count(notifier->emergencies) == 0);
        engine.runHealthCheck();
        assert(notifier->count(notifier->emergencies) == 1);

        auto health = engine.healthSnapshot();
        assert(health.emergency_stop);
        assert(health.api_failures == 3);
        assert(health.latency_ms == -1);

        gateway->fail_ping = false;
        assert(engine.manualOverride("api back"));
        engine.runHealthCheck();
        assert(engine.healthSnapshot().api_failures == 0);
        assert(!engine.healthSnapshot().emergency_stop);
        engine.stop();
    }

    // 거래소 연결 불가 → 시작 실패
    {
        auto gateway = std::make_shared<FakeExchangeGateway>();
        gateway->fail_ping = true;
        FeedHolder feeds;
        TradingEngine engine(testConfig(), gateway, feeds.factory());
        assert(!engine.start());
        assert(!engine.isRunning());
        assert(feeds.last.load() == nullptr);
    }

    std::cout << "[TEST] TradingEngine PASSED\n";
    return 0;
}
