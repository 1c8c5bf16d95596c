#include "execution/RetryPolicy.h"

namespace triplersi {
namespace execution {

const char* toString(OperationType op) {
    switch (op) {
        case OperationType::DEFAULT: return "DEFAULT";
        case OperationType::ORDER_PLACEMENT: return "ORDER_PLACEMENT";
        case OperationType::ORDER_STATUS: return "ORDER_STATUS";
        case OperationType::ORDER_CANCELLATION: return "ORDER_CANCELLATION";
        case OperationType::MARKET_DATA: return "MARKET_DATA";
        case OperationType::ACCOUNT: return "ACCOUNT";
    }
    return "UNKNOWN";
}

RetryPolicy::RetryPolicy(engine::RetryConfig config, SleepFunction sleeper)
    : config_(std::move(config))
    , sleeper_(std::move(sleeper))
{
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

const engine::RetrySettings& RetryPolicy::settingsFor(OperationType op) const {
    switch (op) {
        case OperationType::ORDER_PLACEMENT: return config_.order_placement;
        case OperationType::ORDER_STATUS: return config_.order_status;
        case OperationType::ORDER_CANCELLATION: return config_.order_cancellation;
        case OperationType::MARKET_DATA: return config_.market_data;
        case OperationType::ACCOUNT: return config_.account;
        case OperationType::DEFAULT: break;
    }
    return config_.defaults;
}

long long RetryPolicy::delayForRetry(OperationType op, int retry_index) const {
    const auto& settings = settingsFor(op);
    if (retry_index < 1) retry_index = 1;
    const double factor = std::pow(settings.backoff_multiplier, retry_index - 1);
    return static_cast<long long>(static_cast<double>(settings.delay_ms) * factor);
}

RetryPolicy::Stats RetryPolicy::getStats() const {
    Stats stats;
    stats.total_calls = total_calls_.load();
    stats.total_retries = total_retries_.load();
    stats.total_failures = total_failures_.load();
    return stats;
}

} // namespace execution
} // namespace triplersi
