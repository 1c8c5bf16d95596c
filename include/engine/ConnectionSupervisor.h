#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "common/Result.h"
#include "common/Types.h"
#include "engine/EngineConfig.h"
#include "engine/INotifier.h"
#include "execution/IExchangeGateway.h"
#include "execution/OrderManager.h"
#include "network/IMarketFeed.h"

namespace triplersi {
namespace engine {

enum class ConnectionState {
    DISCONNECTED,   // 시작 전, 또는 재시도 한도 초과
    CONNECTED,
    RECONNECTING,
    SAFE_MODE       // 재연결 직후, 거래 검증 2중 확인
};

const char* toString(ConnectionState state);

struct ConnectionStatus {
    ConnectionState state = ConnectionState::DISCONNECTED;
    bool feed_connected = false;
    bool reconnecting = false;
    int attempt = 0;
    int total_reconnections = 0;
    long long last_data_time_ms = 0;
    long long safe_mode_remaining_ms = 0;
    bool trading_blocked = false;
    std::string block_reason;
};

struct ReconciliationReport {
    bool success = false;
    int exchange_positions = 0;
    int tracked_trades = 0;
    std::vector<std::string> ghost_trades;        // 거래소에 포지션 없음 → 정리됨
    std::vector<std::string> untracked_positions; // 엔진이 모르는 포지션 → 거래 차단
    std::string error;
};

// 캔들 피드 연결 감시 + 재연결 + 재동기화
//
// 피드 콜백은 피드 스레드에서 오므로 여기서는 플래그만 바꾸고,
// 피드 재생성/대기/재동기화는 reconnect_thread_ 가 한다.
class ConnectionSupervisor : public network::IFeedListener {
public:
    using SleepFunction = std::function<void(long long)>;
    using GiveUpHandler = std::function<void(const std::string&)>;

    ConnectionSupervisor(
        const EngineConfig& config,
        std::shared_ptr<execution::IExchangeGateway> gateway,
        execution::OrderManager* order_manager,
        network::MarketFeedFactory feed_factory,
        INotifier* notifier = nullptr
    );
    ~ConnectionSupervisor() override;

    // 백오프 대기 교체 (테스트)
    void setSleepFunction(SleepFunction sleep);
    // 재시도 한도 초과 시 호출
    void setGiveUpHandler(GiveUpHandler handler);

    // 첫 피드 생성 + 재연결 스레드 시작. 첫 연결 실패 시 재연결 루프로 넘어감
    bool start();
    void stop();

    // IFeedListener
    void onFeedConnected() override;
    void onFeedDisconnected(const std::string& reason) override;
    void onFeedData() override;

    bool forceReconnection();
    void stopReconnection();

    ConnectionStatus status() const;
    ConnectionState state() const;
    bool isFeedConnected() const { return connected_.load(); }
    long long lastDataTimeMs() const { return last_data_time_ms_.load(); }
    bool isInSafeMode() const;

    // 피드가 stale_feed_timeout 이상 조용하면 재연결 요청
    bool checkFeedStaleness();

    // 새 거래 허용 여부 (안전 모드에서는 포지션 재확인)
    Status validateTradeConditions();
    bool isTradingBlocked() const;
    void clearTradingBlock();

    // 거래소 포지션 ↔ 추적 중 트레이드 대조
    ReconciliationReport reconcile();

    // min(base × 2^(attempt-1), cap)
    static long long backoffDelay(int attempt, long long base_ms, long long cap_ms);

private:
    EngineConfig config_;
    std::shared_ptr<execution::IExchangeGateway> gateway_;
    execution::OrderManager* order_manager_;
    network::MarketFeedFactory feed_factory_;
    INotifier* notifier_;

    SleepFunction sleep_;
    GiveUpHandler give_up_handler_;

    mutable std::mutex mutex_;
    ConnectionState state_ = ConnectionState::DISCONNECTED;
    int attempt_ = 0;
    int total_reconnections_ = 0;
    long long safe_mode_until_ms_ = 0;
    bool trading_blocked_ = false;
    std::string block_reason_;
    bool reconnect_requested_ = false;
    bool reconnect_abort_ = false;

    std::mutex feed_mutex_;
    std::unique_ptr<network::IMarketFeed> feed_;

    std::atomic<bool> connected_{false};
    std::atomic<long long> last_data_time_ms_{0};

    std::atomic<bool> running_{false};
    std::thread reconnect_thread_;
    std::condition_variable wake_cv_;

    void reconnectLoop();
    void runReconnection();
    bool rebuildFeed();
    bool waitForConnection();
    void pause(long long ms);
    void enterSafeMode();
    void requestReconnection(const std::string& reason);
    void notify(const std::string& message);
    void notifyReconciliation(const std::string& finding);
};

} // namespace engine
} // namespace triplersi
