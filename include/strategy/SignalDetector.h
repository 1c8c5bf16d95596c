#pragma once

#include <mutex>
#include <optional>

#include "common/Types.h"
#include "engine/EngineConfig.h"
#include "strategy/ISignalSink.h"

namespace triplersi {
namespace strategy {

struct SignalDetectorStatus {
    bool pending_long = false;
    bool pending_short = false;
    Timestamp long_armed_at = 0;
    Timestamp short_armed_at = 0;
    long long latches_armed = 0;
    long long latches_dropped = 0;    // 반대 방향 무장 또는 RECONFIRM 해제
    long long signals_detected = 0;
};

// RSI 과매도/과매수 → 대기(latch) → 확인 필터 통과 시 신호
//
// 방향별 IDLE/PENDING 두 상태. 한쪽을 무장하면 반대쪽 대기는 해제된다.
// 포지션 보유 여부는 보지 않는다 (엔진이 무시).
class SignalDetector {
public:
    explicit SignalDetector(const engine::SignalConfig& config, ISignalSink* sink = nullptr);

    // 마감 캔들 스냅샷 1건 처리. 확정 시 sink 에도 전달
    std::optional<Signal> update(const IndicatorSnapshot& snapshot);

    void reset();
    SignalDetectorStatus status() const;

    // NaN/빈 입력이면 false
    static bool rsiCondition(const IndicatorSnapshot& snapshot, Direction direction,
                             const engine::SignalConfig& config);
    static bool haConfirmation(const IndicatorSnapshot& snapshot, Direction direction);
    static bool trendFilter(const IndicatorSnapshot& snapshot, Direction direction);
    static bool mtfRsiFilter(const IndicatorSnapshot& snapshot, Direction direction);

private:
    engine::SignalConfig config_;
    ISignalSink* sink_;

    mutable std::mutex mutex_;
    SignalDetectorStatus state_;

    void arm(Direction direction, Timestamp at);
    std::optional<Signal> tryConfirm(const IndicatorSnapshot& snapshot, Direction direction,
                                     Timestamp armed_at, Timestamp now);
};

} // namespace strategy
} // namespace triplersi
