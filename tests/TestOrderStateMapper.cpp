#include "execution/OrderStateMapper.h"

#include <cassert>
#include <iostream>

using triplersi::OrderStatus;
using triplersi::execution::OrderStateMapper;

int main() {
    {
        auto r = OrderStateMapper::map("FILLED", 0.0, 1.0);
        assert(r.status == OrderStatus::FILLED);
        assert(r.terminal);
        assert(r.filled_qty == 1.0);
    }

    {
        auto r = OrderStateMapper::map("PARTIALLY_FILLED", 0.4, 2.0);
        assert(r.status == OrderStatus::PARTIALLY_FILLED);
        assert(!r.terminal);
        assert(r.filled_qty > 0.39 && r.filled_qty < 0.41);
    }

    // 잔량이 epsilon 이내면 체결 완료
    {
        auto r = OrderStateMapper::map("PARTIALLY_FILLED", 2.0, 2.0);
        assert(r.status == OrderStatus::FILLED);
        assert(r.terminal);
    }

    {
        auto r = OrderStateMapper::map("CANCELED", 0.2, 1.0);
        assert(r.status == OrderStatus::CANCELLED);
        assert(r.terminal);
        assert(r.filled_qty == 0.2);
    }

    {
        auto r = OrderStateMapper::map("expired", 0.0, 1.0);
        assert(r.status == OrderStatus::CANCELLED);
        assert(r.terminal);
    }

    {
        auto r = OrderStateMapper::map("REJECTED", 0.0, 1.0);
        assert(r.status == OrderStatus::FAILED);
        assert(r.terminal);
    }

    {
        auto r = OrderStateMapper::map("NEW", 0.0, 1.0);
        assert(r.status == OrderStatus::PENDING);
        assert(!r.terminal);
    }

    std::cout << "[TEST] OrderStateMapper PASSED\n";
    return 0;
}
