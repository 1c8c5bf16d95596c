#include "risk/RiskManager.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace triplersi;
using risk::RiskManager;
using risk::TradeResult;

namespace {
bool near(double a, double b, double eps = 1e-6) {
    return std::fabs(a - b) < eps;
}

Signal signalAt(Direction direction, double close, double confidence = 1.0) {
    Signal s;
    s.direction = direction;
    s.indicators.close = close;
    s.confidence = confidence;
    return s;
}
} // namespace

int main() {
    // 잔고 1000, 위험 2%, 진입 100 / 손절 99 → 20개, TP 101.2
    {
        engine::RiskConfig cfg;
        cfg.max_position_notional = 5000.0;
        RiskManager rm(cfg);

        auto r = rm.size(signalAt(Direction::LONG, 100.0), 1000.0, 99.0);
        assert(r);
        assert(near(r.value().quantity, 20.0));
        assert(near(r.value().take_profit, 101.2));
        assert(near(r.value().risk_amount, 20.0));
        assert(near(r.value().notional, 2000.0));

        auto s = rm.size(signalAt(Direction::SHORT, 100.0), 1000.0, 101.0);
        assert(s);
        assert(near(s.value().take_profit, 98.8));
    }

    // 명목가 상한으로 축소
    {
        engine::RiskConfig cfg;
        RiskManager rm(cfg);
        auto r = rm.size(signalAt(Direction::LONG, 100.0), 1000.0, 99.0);
        assert(r);
        assert(near(r.value().quantity, 10.0));
        assert(near(r.value().notional, 1000.0));
    }

    // FIXED_PERCENT 목표가
    {
        engine::RiskConfig cfg;
        cfg.tp_mode = engine::TakeProfitMode::FIXED_PERCENT;
        RiskManager rm(cfg);
        assert(near(rm.calculateTakeProfit(Direction::LONG, 100.0, 99.0), 100.15));
        assert(near(rm.calculateTakeProfit(Direction::SHORT, 100.0, 101.0), 99.85));
    }

    // 거절 사유
    {
        engine::RiskConfig cfg;
        cfg.min_position_notional = 100.0;
        RiskManager rm(cfg);

        auto wrong_side = rm.size(signalAt(Direction::LONG, 100.0), 1000.0, 101.0);
        assert(!wrong_side);
        assert(wrong_side.error().code == "INVALID_STOP");

        // 위험 20 / 거리 50 → 0.4개, 명목가 40
        auto too_small = rm.size(signalAt(Direction::LONG, 100.0), 1000.0, 50.0);
        assert(!too_small);
        assert(too_small.error().code == "NOTIONAL_TOO_SMALL");
        assert(too_small.error().kind == ErrorKind::VALIDATION);

        // 거래소 최소 수량 미달 (스텝 내림 후)
        SymbolInfo info;
        info.step_size = 1.0;
        info.min_qty = 1.0;
        rm.setSymbolInfo(info);
        auto below_min = rm.size(signalAt(Direction::LONG, 1000.0), 1000.0, 950.0);
        assert(!below_min);
        assert(below_min.error().code == "NOTIONAL_TOO_SMALL");
    }

    // 진입 전 검증
    {
        engine::RiskConfig cfg;
        RiskManager rm(cfg);
        assert(rm.validateTrade(signalAt(Direction::LONG, 100.0), 1000.0, 50));
        assert(rm.validateTrade(signalAt(Direction::LONG, 100.0), 1000.0, -1));

        auto low_conf = rm.validateTrade(signalAt(Direction::LONG, 100.0, 0.5), 1000.0, 50);
        assert(!low_conf && low_conf.error().code == "LOW_CONFIDENCE");

        auto low_balance = rm.validateTrade(signalAt(Direction::LONG, 100.0), 5.0, 50);
        assert(!low_balance && low_balance.error().code == "LOW_BALANCE");

        auto slow = rm.validateTrade(signalAt(Direction::LONG, 100.0), 1000.0, 2000);
        assert(!slow && slow.error().kind == ErrorKind::TRANSIENT);
    }

    // 연속 손실 한도
    {
        engine::RiskConfig cfg;
        cfg.max_daily_loss = 1000.0;
        RiskManager rm(cfg);
        rm.updateBalance(1000.0);
        for (int i = 0; i < cfg.max_consecutive_losses; ++i) {
            rm.recordOutcome(Direction::LONG, 100.0, 1.0, TradeResult::LOSS, -1.0);
        }
        assert(rm.isDailyLimitReached());
        auto r = rm.size(signalAt(Direction::LONG, 100.0), 1000.0, 99.0);
        assert(!r && r.error().code == "DAILY_LIMIT");

        rm.recordOutcome(Direction::LONG, 100.0, 1.0, TradeResult::WIN, 2.0);
        auto state = rm.getRiskState();
        assert(state.consecutive_losses == 0);
        assert(state.total_trades == 6);
        assert(state.winning_trades == 1);
        assert(state.losing_trades == 5);
        assert(near(state.balance, 997.0));
    }

    // 비상 정지: 단방향 래치, 수동 해제 후에도 카운터 유지
    {
        engine::RiskConfig cfg;
        RiskManager rm(cfg);
        rm.updateBalance(1000.0);
        rm.recordOutcome(Direction::SHORT, 100.0, 6.0, TradeResult::LOSS, -600.0);
        assert(rm.isEmergencyStopped());

        auto r = rm.size(signalAt(Direction::LONG, 100.0), 1000.0, 99.0);
        assert(!r);
        assert(r.error().kind == ErrorKind::SYSTEMIC);

        // 이후 기록으로 해제되지 않음
        rm.recordOutcome(Direction::LONG, 100.0, 1.0, TradeResult::WIN, 50.0);
        assert(rm.isEmergencyStopped());

        assert(rm.overrideEmergencyStop("operator"));
        assert(!rm.isEmergencyStopped());
        assert(!rm.overrideEmergencyStop("again"));

        auto state = rm.getRiskState();
        assert(near(state.total_pnl, -550.0));
        assert(state.max_drawdown >= 600.0 - 1e-9);

        // 일일 손실 한도는 그대로
        auto after = rm.size(signalAt(Direction::LONG, 100.0), 1000.0, 99.0);
        assert(!after && after.error().code == "DAILY_LIMIT");
    }

    {
        engine::RiskConfig cfg;
        RiskManager rm(cfg);
        rm.triggerEmergencyStop("manual");
        assert(rm.getRiskSummary().find("EMERGENCY") != std::string::npos);
    }

    std::cout << "[TEST] RiskManager PASSED\n";
    return 0;
}
