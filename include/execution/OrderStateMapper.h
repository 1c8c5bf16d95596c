#pragma once

#include "common/Types.h"
#include <string>

namespace triplersi {
namespace execution {

struct ExchangeOrderStateResult {
    OrderStatus status = OrderStatus::PENDING;
    double filled_qty = 0.0;
    bool terminal = false;
};

// 거래소 주문 상태 문자열(NEW, PARTIALLY_FILLED, FILLED, CANCELED, EXPIRED, REJECTED)
// → 내부 OrderStatus
class OrderStateMapper {
public:
    static ExchangeOrderStateResult map(
        const std::string& exchange_status,
        double executed_qty,
        double orig_qty
    );
};

} // namespace execution
} // namespace triplersi
