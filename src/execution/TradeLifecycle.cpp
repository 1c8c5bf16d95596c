#include "execution/TradeLifecycle.h"

namespace triplersi {
namespace execution {

bool TradeLifecycle::canTransition(TradeStatus from, TradeStatus to) {
    switch (from) {
        case TradeStatus::OPENING:
            return to == TradeStatus::OPEN || to == TradeStatus::FAILED;
        case TradeStatus::OPEN:
            return to == TradeStatus::CLOSING || to == TradeStatus::CLOSED || to == TradeStatus::FAILED;
        case TradeStatus::CLOSING:
            return to == TradeStatus::CLOSED || to == TradeStatus::OPEN || to == TradeStatus::FAILED;
        case TradeStatus::CLOSED:
        case TradeStatus::FAILED:
            return false;
    }
    return false;
}

Status TradeLifecycle::transition(Trade& trade, TradeStatus to, Timestamp now) {
    if (!canTransition(trade.status, to)) {
        return Status::fail(Error::validation(
            "INVALID_TRANSITION",
            trade.id + ": " + toString(trade.status) + " -> " + toString(to)));
    }

    const Timestamp ts = now > 0 ? now : nowMs();
    if (to == TradeStatus::OPEN && trade.filled_at == 0) {
        trade.filled_at = ts;
    }
    if (to == TradeStatus::CLOSED || to == TradeStatus::FAILED) {
        trade.closed_at = ts;
    }

    trade.status = to;
    return Status::ok();
}

} // namespace execution
} // namespace triplersi
