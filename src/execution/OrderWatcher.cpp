#include "execution/OrderWatcher.h"
#include "common/Logger.h"

namespace triplersi {
namespace execution {

OrderWatcher::OrderWatcher(std::shared_ptr<IExchangeGateway> gateway)
    : gateway_(std::move(gateway))
{
}

Result<std::set<std::string>> OrderWatcher::fetchOpenOrderIds() {
    poll_count_++;

    auto orders = gateway_->getOpenOrders();
    if (!orders) {
        failed_poll_count_++;
        LOG_WARN("Open orders poll failed: {}", orders.error().describe());
        return Result<std::set<std::string>>::fail(orders.error());
    }

    std::set<std::string> ids;
    for (const auto& order : orders.value()) {
        if (!order.exchange_order_id.empty()) {
            ids.insert(order.exchange_order_id);
        }
    }
    return Result<std::set<std::string>>::ok(std::move(ids));
}

std::vector<std::string> OrderWatcher::vanished(
    const std::vector<std::string>& watched,
    const std::set<std::string>& open_ids
) {
    std::vector<std::string> gone;
    for (const auto& id : watched) {
        if (!id.empty() && open_ids.find(id) == open_ids.end()) {
            gone.push_back(id);
        }
    }
    return gone;
}

} // namespace execution
} // namespace triplersi
