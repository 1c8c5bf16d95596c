#pragma once

#include "common/Result.h"
#include "common/Types.h"
#include "engine/EngineConfig.h"
#include <string>
#include <mutex>

namespace triplersi {
namespace risk {

enum class TradeResult {
    WIN,
    LOSS,
    BREAKEVEN
};

inline const char* toString(TradeResult r) {
    switch (r) {
        case TradeResult::WIN: return "WIN";
        case TradeResult::LOSS: return "LOSS";
        case TradeResult::BREAKEVEN: return "BREAKEVEN";
    }
    return "UNKNOWN";
}

// 프로세스 수명 동안 유지되는 리스크 상태
struct RiskState {
    double balance;
    double initial_balance;
    double peak_balance;
    double max_drawdown;        // 고점 대비 최대 하락 (금액)

    double daily_pnl;
    int daily_trade_count;
    int consecutive_losses;
    long long trading_day;      // UTC YYYYMMDD

    int total_trades;
    int winning_trades;
    int losing_trades;
    double total_pnl;

    bool emergency_stop;
    std::string stop_reason;

    RiskState()
        : balance(0), initial_balance(0), peak_balance(0), max_drawdown(0)
        , daily_pnl(0), daily_trade_count(0), consecutive_losses(0), trading_day(0)
        , total_trades(0), winning_trades(0), losing_trades(0), total_pnl(0)
        , emergency_stop(false)
    {}
};

// Risk Manager - 포지션 사이징 및 서킷 브레이커
class RiskManager {
public:
    explicit RiskManager(const engine::RiskConfig& config);

    // 수량 스텝 / 최소 명목가 (거래소 규칙)
    void setSymbolInfo(const SymbolInfo& info);

    // ===== 포지션 사이징 =====

    // quantity = balance × max_balance_risk / |entry - stop|, 명목가 상한으로 축소
    // 거절: 비상 정지(SYSTEMIC), 일일 한도 / 잘못된 손절 / 최소 명목가 미달(VALIDATION)
    Result<PositionSize> size(const Signal& signal, double balance, double stop);

    // 진입 전 검증 (신뢰도, 최소 잔고, 지연, 한도). latency_ms < 0 이면 지연 검사 생략
    Status validateTrade(const Signal& signal, double balance, long long latency_ms);

    double calculateTakeProfit(Direction direction, double entry, double stop) const;

    // ===== 결과 기록 =====

    void recordOutcome(Direction direction, double entry, double quantity,
                       TradeResult result, double pnl);
    void recordTrade(const Trade& trade);

    // 실제 잔고 동기화 (고점/낙폭 갱신)
    void updateBalance(double balance);

    // ===== 서킷 브레이커 =====

    bool isDailyLimitReached();
    void resetDailyLimits();

    // 단방향 래치. 해제는 overrideEmergencyStop 으로만
    void triggerEmergencyStop(const std::string& reason);
    // 카운터는 지우지 않음. 해제되면 true
    bool overrideEmergencyStop(const std::string& reason);
    bool isEmergencyStopped() const;

    RiskState getRiskState() const;
    std::string getRiskSummary() const;

private:
    engine::RiskConfig config_;
    SymbolInfo symbol_info_;
    RiskState state_;

    mutable std::recursive_mutex mutex_;

    void resetDailyIfNeeded();
    void applyBalance(double balance);
    void checkEmergencyLimits();
    static long long currentUtcDay();
};

} // namespace risk
} // namespace triplersi
