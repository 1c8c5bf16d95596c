#pragma once

#include <string>

#include "common/Types.h"

namespace triplersi {
namespace execution {

// 트레이드 이벤트 수신자 (엔진: 리스크 기록, 알림)
class ITradeLifecycleSink {
public:
    virtual ~ITradeLifecycleSink() = default;

    virtual void onTradeOpened(const Trade& trade) = 0;
    virtual void onTradeClosed(const Trade& trade) = 0;

    virtual void onTradeFailed(const Trade& trade, const std::string& reason) { (void)trade; (void)reason; }
    virtual void onFallbackFill(const Trade& trade, double slippage_pct) { (void)trade; (void)slippage_pct; }
    virtual void onTradeAnomaly(const Trade& trade, const std::string& message) { (void)trade; (void)message; }
};

} // namespace execution
} // namespace triplersi
