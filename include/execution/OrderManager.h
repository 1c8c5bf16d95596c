#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "common/Result.h"
#include "common/Types.h"
#include "engine/EngineConfig.h"
#include "execution/IExchangeGateway.h"
#include "execution/IProtectionScheduler.h"
#include "execution/ITradeLifecycleSink.h"
#include "execution/OrderWatcher.h"

namespace triplersi {
namespace execution {

struct PerformanceStats {
    int total_trades = 0;
    int winning_trades = 0;
    int losing_trades = 0;
    double win_rate = 0.0;
    double total_pnl = 0.0;
    double avg_win = 0.0;
    double avg_loss = 0.0;
    double profit_factor = 0.0;
};

// 트레이드 수명 관리: 진입 → 보호 주문 → 청산
//
// 활성 트레이드 레지스트리는 mutex_ 하나로 보호. 네트워크 호출은 락 밖에서,
// 필요한 값은 먼저 복사해 둔다. 동시에 비종료 트레이드는 최대 1개.
class OrderManager : public IProtectionListener {
public:
    OrderManager(
        std::shared_ptr<IExchangeGateway> gateway,
        const engine::EngineConfig& config,
        ITradeLifecycleSink* sink = nullptr
    );
    ~OrderManager() override;

    void setProtectionScheduler(IProtectionScheduler* scheduler);
    void setSymbolInfo(const SymbolInfo& info);

    // 보호 주문 감시 스레드
    void start();
    void stop();
    bool isRunning() const { return running_; }

    // 진입부터 보호 주문 배치(또는 지연 등록)까지 동기 실행
    Result<Trade> openTrade(const Signal& signal, const PositionSize& size);

    // 수동/비상 청산 (시장가 reduce-only → 보호 주문 취소 → CLOSED)
    Status closeTrade(const std::string& trade_id, ExitReason reason);
    // 청산된 개수
    int closeAllTrades(ExitReason reason);

    // 감시 1회 (스레드가 주기적으로 호출)
    void monitorOnce();

    // 재동기화에서 거래소 포지션이 없는 트레이드 정리
    Status dropGhostTrade(const std::string& trade_id);

    bool hasActiveTrade() const;
    std::vector<Trade> getActiveTrades() const;
    std::optional<Trade> getTrade(const std::string& trade_id) const;
    std::vector<Trade> getClosedTrades() const;
    PerformanceStats getPerformanceStats() const;

    // IProtectionListener
    void onProtectionPlaced(const std::string& trade_id,
                            const Order& sl_order,
                            const Order& tp_order,
                            double stop_loss,
                            double take_profit) override;
    bool isTradeActive(const std::string& trade_id) const override;

    static double calculatePnl(Direction direction, double entry, double exit, double quantity);

private:
    struct FillOutcome {
        Order order;
        bool filled = false;
        bool timed_out = false;
    };

    std::shared_ptr<IExchangeGateway> gateway_;
    engine::EngineConfig config_;
    ITradeLifecycleSink* sink_;
    IProtectionScheduler* scheduler_ = nullptr;
    OrderWatcher watcher_;

    mutable std::mutex mutex_;
    std::map<std::string, Trade> active_trades_;
    std::deque<Trade> closed_trades_;
    SymbolInfo symbol_info_;

    std::atomic<long long> trade_counter_{0};

    std::atomic<bool> running_{false};
    std::thread monitor_thread_;
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;

    void monitorLoop();

    std::string nextTradeId(Direction direction);
    SymbolInfo currentSymbolInfo() const;

    // 진입 단계
    Result<Trade> executeEntry(Trade trade, const PositionSize& size);
    FillOutcome waitForFill(const std::string& order_id, Order last_known);
    Result<Order> placeEntryOrder(const Trade& trade, double limit_price);
    bool flattenPosition(Direction direction, double quantity, const std::string& trade_id);
    // 취소 미확인 진입 주문: OPENING 유지, 감시 주기에 최종 상태 확인
    Result<Trade> holdUnresolvedEntry(Trade trade, bool cancel_acknowledged);
    void resolveUnresolvedEntries();
    Result<Trade> failTrade(Trade trade, const Error& error);
    double fallbackExitPrice(const Trade& trade);

    // 보호 주문
    void applyFillToLevels(Trade& trade, const PositionSize& size) const;
    void placeProtection(Trade trade);
    Status placeProtectionOrders(Trade& trade);

    // 청산 단계
    void handleProtectionVanished(const Trade& trade, bool sl_gone, bool tp_gone);
    bool cancelOrderWithRetry(const std::string& order_id, const std::string& label);
    Result<Order> closeAtMarket(const Trade& trade);
    void finalizeClose(const std::string& trade_id, double exit_price, ExitReason reason);

    bool updateTrade(const Trade& trade);
    void archive(const Trade& trade);
};

} // namespace execution
} // namespace triplersi
