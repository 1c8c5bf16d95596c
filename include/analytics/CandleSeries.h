#pragma once

#include <deque>
#include <mutex>
#include <vector>

#include "common/Types.h"
#include "engine/EngineConfig.h"

namespace triplersi {
namespace analytics {

// 마감 캔들 롤링 버퍼 + 지표 스냅샷 계산
class CandleSeries {
public:
    explicit CandleSeries(const engine::IndicatorConfig& config);

    // REST 로 받은 과거 캔들로 초기화 (미마감 캔들은 제외)
    void seed(const std::vector<Candle>& candles);

    // 마감 캔들만 반영. open_time 이 같으면 마지막 캔들 교체
    // 반환: 버퍼가 갱신되었는지
    bool update(const Candle& candle);

    size_t size() const;
    std::vector<Candle> snapshotCandles() const;

    // sl_lookback: 손절 기준 HA 저가/고가를 볼 최근 캔들 수
    IndicatorSnapshot buildSnapshot(int sl_lookback = 1) const;

private:
    engine::IndicatorConfig config_;

    mutable std::mutex mutex_;
    std::deque<Candle> candles_;
};

} // namespace analytics
} // namespace triplersi
