#pragma once

#include <string>

#include "common/Types.h"

namespace triplersi {
namespace execution {

// 진입 캔들 마감 후 SL/TP 배치를 맡는 쪽 (DeferredProtectionCoordinator)
class IProtectionScheduler {
public:
    virtual ~IProtectionScheduler() = default;

    // OPEN 상태 트레이드 등록. 이미 있으면 false
    virtual bool registerTrade(const Trade& trade) = 0;
    // 배치 전이면 제거. 이미 배치되었으면 false
    virtual bool cancel(const std::string& trade_id) = 0;
};

// 배치 결과를 돌려받는 쪽 (OrderManager)
class IProtectionListener {
public:
    virtual ~IProtectionListener() = default;

    virtual void onProtectionPlaced(const std::string& trade_id,
                                    const Order& sl_order,
                                    const Order& tp_order,
                                    double stop_loss,
                                    double take_profit) = 0;

    virtual bool isTradeActive(const std::string& trade_id) const = 0;
};

} // namespace execution
} // namespace triplersi
