#pragma once

#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "common/Types.h"
#include "engine/EngineConfig.h"
#include "execution/IExchangeGateway.h"
#include "execution/IProtectionScheduler.h"

namespace triplersi {
namespace execution {

// 진입 캔들 마감까지 SL/TP 배치를 미루는 트레이드 1건
struct PendingProtection {
    std::string trade_id;
    Direction direction = Direction::LONG;
    double quantity = 0.0;
    double entry_price = 0.0;
    double original_stop = 0.0;
    double original_target = 0.0;

    Timestamp registered_at = 0;
    Timestamp deadline = 0;            // 진입 캔들 마감 시각

    bool placed = false;
    Timestamp processing_started = 0;  // 0 = 처리 중 아님
    int attempts = 0;

    Order sl_order;                    // 부분 진행 기록 (TP 실패 후 재시도 시 SL 중복 방지)
    Order tp_order;
    double final_stop = 0.0;
    double final_target = 0.0;
    Timestamp placed_at = 0;
};

struct ProtectionLevels {
    double stop_loss = 0.0;
    double take_profit = 0.0;
    bool stop_adjusted = false;
    bool target_adjusted = false;
};

enum class ProcessOutcome {
    PLACED,
    ALREADY_PLACED,
    IN_FLIGHT,       // 다른 처리가 진행 중 (타임아웃 이내)
    STALE_RESET,     // 타임아웃 지난 처리 표시 해제, 다음 주기에 재시도
    NOT_FOUND,
    INACTIVE,        // 트레이드가 더 이상 활성 아님 → 항목 제거
    FAILED
};

const char* toString(ProcessOutcome outcome);

struct DeferredStatusEntry {
    std::string trade_id;
    Direction direction = Direction::LONG;
    std::string state;             // waiting | ready | processing | completed
    long long seconds_remaining = 0;
};

struct DeferredStatusReport {
    size_t total = 0;
    size_t waiting = 0;
    size_t ready = 0;
    size_t processing = 0;
    size_t completed = 0;
    std::vector<DeferredStatusEntry> entries;
};

// 지연 보호 주문 코디네이터
//
// 레지스트리는 mutex_ 로 보호하고, 처리 시작/종료 기록만 락 안에서 한다.
// 가격 조회와 주문 배치는 락 밖에서 실행된다. processing_started 가 있는 항목은
// 다른 호출자가 건너뛰므로 타이머와 강제 처리가 경합해도 배치는 1회뿐이다.
class DeferredProtectionCoordinator : public IProtectionScheduler {
public:
    DeferredProtectionCoordinator(
        std::shared_ptr<IExchangeGateway> gateway,
        const engine::EngineConfig& config,
        IProtectionListener* listener
    );
    ~DeferredProtectionCoordinator() override;

    void setSymbolInfo(const SymbolInfo& info);

    void start();
    void stop();
    bool isRunning() const { return running_; }

    // IProtectionScheduler
    bool registerTrade(const Trade& trade) override;
    bool cancel(const std::string& trade_id) override;

    // 마감 지난 항목 처리. 배치 성공 건수 반환
    int processDue();
    // 마감 무시하고 즉시 처리
    ProcessOutcome forceProcess(const std::string& trade_id);

    // 배치 후 cleanup_after 경과 항목, 비활성 트레이드 항목 제거
    int cleanupCompleted();

    DeferredStatusReport statusReport() const;
    std::optional<PendingProtection> getEntry(const std::string& trade_id) const;
    size_t size() const;

    // 현재가 기준 보호 가격 재계산
    //   손절가가 이미 돌파됨 → 현재가에서 max(offset, min_distance) 만큼 떨어진 곳
    //   목표가를 이미 넘어섬 → 현재가에서 같은 거리만큼 유리한 쪽
    //   그 외 → 원래 가격 (현재가와 최소 거리 보장)
    static ProtectionLevels computeLevels(
        Direction direction,
        double original_stop,
        double original_target,
        double current_price,
        double offset_percent,
        double min_distance,
        double tick_size
    );

private:
    std::shared_ptr<IExchangeGateway> gateway_;
    engine::EngineConfig config_;
    IProtectionListener* listener_;

    mutable std::mutex mutex_;
    std::map<std::string, PendingProtection> pending_;
    SymbolInfo symbol_info_;

    std::atomic<bool> running_{false};
    std::thread monitor_thread_;
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;

    void monitorLoop();
    ProcessOutcome process(const std::string& trade_id);
    void releaseClaim(const std::string& trade_id, const Order* sl_order, double stop_loss);
};

} // namespace execution
} // namespace triplersi
