#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <functional>
#include <string>
#include <thread>
#include <utility>

#include "common/Logger.h"
#include "engine/EngineConfig.h"
#include "network/ExchangeError.h"

namespace triplersi {
namespace execution {

enum class OperationType {
    DEFAULT,
    ORDER_PLACEMENT,
    ORDER_STATUS,
    ORDER_CANCELLATION,
    MARKET_DATA,
    ACCOUNT
};

const char* toString(OperationType op);

// 작업 종류별 재시도 (일시적 오류만 재시도, 나머지는 즉시 전파)
class RetryPolicy {
public:
    using SleepFunction = std::function<void(std::chrono::milliseconds)>;

    explicit RetryPolicy(engine::RetryConfig config, SleepFunction sleeper = SleepFunction());

    const engine::RetrySettings& settingsFor(OperationType op) const;

    // retry_index 번째 재시도 전 대기 (1부터): delay × multiplier^(retry_index-1)
    long long delayForRetry(OperationType op, int retry_index) const;

    // fn(attempt) 호출, attempt 는 1부터
    template<typename Fn>
    auto execute(OperationType op, const std::string& name, Fn&& fn) -> decltype(fn(1)) {
        const auto& settings = settingsFor(op);
        const int max_attempts = 1 + std::max(0, settings.max_retries);

        total_calls_++;
        for (int attempt = 1; ; ++attempt) {
            try {
                return fn(attempt);
            } catch (const network::ExchangeError& e) {
                if (!e.isTransient()) {
                    total_failures_++;
                    throw;
                }
                if (attempt >= max_attempts) {
                    total_failures_++;
                    LOG_ERROR("{} [{}] failed after {} attempts: {}", name, toString(op), attempt, e.what());
                    throw;
                }

                const long long delay_ms = delayForRetry(op, attempt);
                total_retries_++;
                LOG_WARN("{} [{}] transient failure (attempt {}/{}): {} - retry in {} ms",
                         name, toString(op), attempt, max_attempts, e.what(), delay_ms);
                sleeper_(std::chrono::milliseconds(delay_ms));
            }
        }
    }

    struct Stats {
        long long total_calls;
        long long total_retries;
        long long total_failures;
    };
    Stats getStats() const;

private:
    engine::RetryConfig config_;
    SleepFunction sleeper_;

    std::atomic<long long> total_calls_{0};
    std::atomic<long long> total_retries_{0};
    std::atomic<long long> total_failures_{0};
};

} // namespace execution
} // namespace triplersi
