#pragma once

#include "common/Result.h"
#include "common/Types.h"

namespace triplersi {
namespace execution {

// 트레이드 상태 전이 규칙
//   OPENING -> OPEN | FAILED
//   OPEN    -> CLOSING | CLOSED (ghost 정리) | FAILED
//   CLOSING -> CLOSED | OPEN (청산 실패 시 복귀) | FAILED
//   CLOSED, FAILED 는 종료 상태
class TradeLifecycle {
public:
    static bool canTransition(TradeStatus from, TradeStatus to);

    // 허용되면 상태와 타임스탬프 갱신, 아니면 VALIDATION 오류 (trade 는 그대로)
    static Status transition(Trade& trade, TradeStatus to, Timestamp now = 0);
};

} // namespace execution
} // namespace triplersi
