#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "analytics/CandleSeries.h"
#include "common/Result.h"
#include "common/Types.h"
#include "engine/ConnectionSupervisor.h"
#include "engine/EngineConfig.h"
#include "engine/INotifier.h"
#include "execution/DeferredProtectionCoordinator.h"
#include "execution/IExchangeGateway.h"
#include "execution/ITradeLifecycleSink.h"
#include "execution/OrderManager.h"
#include "network/IMarketFeed.h"
#include "risk/RiskManager.h"
#include "strategy/ISignalSink.h"
#include "strategy/SignalDetector.h"

namespace triplersi {
namespace engine {

// 캔들 피드 생성기: 연결 콜백 수신자 + 마감 캔들 처리기
using CandleFeedFactory = std::function<std::unique_ptr<network::IMarketFeed>(
    network::IFeedListener*, network::IMarketFeed::CandleHandler)>;

struct HealthSnapshot {
    bool running = false;
    double balance = 0.0;
    int active_trades = 0;
    bool feed_connected = false;
    ConnectionState connection_state = ConnectionState::DISCONNECTED;
    long long latency_ms = -1;
    int api_failures = 0;
    bool emergency_stop = false;
    bool trading_blocked = false;
    size_t pending_protections = 0;
    long long last_data_time_ms = 0;
    execution::PerformanceStats performance;
};

// Trading Engine - 신호 → 리스크 → 주문 → 보호 → 청산 조율
class TradingEngine : public strategy::ISignalSink, public execution::ITradeLifecycleSink {
public:
    TradingEngine(
        const EngineConfig& config,
        std::shared_ptr<execution::IExchangeGateway> gateway,
        CandleFeedFactory feed_factory,
        std::shared_ptr<INotifier> notifier = nullptr
    );
    ~TradingEngine() override;

    // ===== 엔진 제어 =====

    bool start();
    void stop();
    bool isRunning() const { return running_; }

    // ===== 피드 입력 =====

    void onCandle(const Candle& candle);

    // ===== 콜백 =====

    void onSignal(const Signal& signal) override;
    void onTradeOpened(const Trade& trade) override;
    void onTradeClosed(const Trade& trade) override;
    void onTradeFailed(const Trade& trade, const std::string& reason) override;
    void onFallbackFill(const Trade& trade, double slippage_pct) override;
    void onTradeAnomaly(const Trade& trade, const std::string& message) override;

    // ===== 운영자 제어 =====

    void emergencyStop(const std::string& reason);
    bool manualOverride(const std::string& reason);
    Status closePosition(const std::string& reason);

    // 헬스 체크 1회 (스레드가 주기적으로 호출)
    void runHealthCheck();
    HealthSnapshot healthSnapshot() const;

    // LONG: HA 저가 × (1 - buffer), SHORT: HA 고가 × (1 + buffer)
    static Result<double> calculateStopLoss(const Signal& signal, double buffer_pct);

    // 구성 요소 접근 (운영 도구, 테스트)
    execution::OrderManager& orderManager() { return *order_manager_; }
    risk::RiskManager& riskManager() { return *risk_manager_; }
    ConnectionSupervisor& connectionSupervisor() { return *supervisor_; }
    execution::DeferredProtectionCoordinator& deferredProtection() { return *deferred_; }
    strategy::SignalDetector& signalDetector() { return detector_; }

private:
    EngineConfig config_;
    std::shared_ptr<execution::IExchangeGateway> gateway_;
    CandleFeedFactory feed_factory_;
    std::shared_ptr<INotifier> notifier_;

    analytics::CandleSeries candles_;
    strategy::SignalDetector detector_;
    std::unique_ptr<risk::RiskManager> risk_manager_;
    std::unique_ptr<execution::OrderManager> order_manager_;
    std::unique_ptr<execution::DeferredProtectionCoordinator> deferred_;
    std::unique_ptr<ConnectionSupervisor> supervisor_;

    std::atomic<bool> running_{false};
    std::thread health_thread_;
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;

    // 신호 처리 직렬화 (피드 스레드 / 수동 호출)
    std::mutex signal_mutex_;

    mutable std::mutex state_mutex_;
    double balance_ = 0.0;

    std::atomic<long long> last_latency_ms_{-1};
    std::atomic<int> api_failures_{0};
    std::atomic<bool> emergency_handled_{false};

    void healthLoop();
    void rejectSignal(const Signal& signal, const std::string& reason);
    double refreshBalance();
    void handleEmergencyTransition();
    void logPerformance() const;
};

} // namespace engine
} // namespace triplersi
