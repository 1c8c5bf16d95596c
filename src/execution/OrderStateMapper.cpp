#include "execution/OrderStateMapper.h"

#include <algorithm>
#include <cctype>

namespace triplersi {
namespace execution {

namespace {
std::string normalizeStatus(std::string status) {
    std::transform(status.begin(), status.end(), status.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return status;
}

constexpr double kQtyEpsilon = 1e-9;
} // namespace

ExchangeOrderStateResult OrderStateMapper::map(
    const std::string& exchange_status,
    double executed_qty,
    double orig_qty
) {
    ExchangeOrderStateResult result;
    result.filled_qty = std::max(0.0, executed_qty);

    const std::string status = normalizeStatus(exchange_status);

    if (status == "FILLED") {
        result.status = OrderStatus::FILLED;
        result.filled_qty = (result.filled_qty > 0.0) ? result.filled_qty : orig_qty;
        result.terminal = true;
        return result;
    }

    // 취소/만료되었어도 일부 체결분은 유지
    if (status == "CANCELED" || status == "CANCELLED" || status == "EXPIRED" ||
        status == "EXPIRED_IN_MATCH") {
        result.status = OrderStatus::CANCELLED;
        result.terminal = true;
        return result;
    }

    if (status == "REJECTED") {
        result.status = OrderStatus::FAILED;
        result.terminal = true;
        return result;
    }

    if (status == "PARTIALLY_FILLED") {
        if (orig_qty > 0.0 && result.filled_qty >= orig_qty - kQtyEpsilon) {
            result.status = OrderStatus::FILLED;
            result.terminal = true;
        } else {
            result.status = OrderStatus::PARTIALLY_FILLED;
        }
        return result;
    }

    // NEW 및 알 수 없는 상태
    result.status = (result.filled_qty > 0.0) ? OrderStatus::PARTIALLY_FILLED : OrderStatus::PENDING;
    return result;
}

} // namespace execution
} // namespace triplersi
