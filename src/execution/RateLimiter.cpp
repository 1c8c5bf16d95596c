#include "execution/RateLimiter.h"
#include "common/Logger.h"
#include <algorithm>

namespace triplersi {
namespace execution {

RateLimiter::RateLimiter()
    : total_requests_(0)
    , rejected_requests_(0)
    , forced_waits_(0)
    , last_used_weight_(0)
    , total_wait_time_(std::chrono::milliseconds(0))
    , is_blocked_(false)
{
    configs_.emplace("market_data", RateLimitConfig("market_data", 20));  // 시세/캔들/심볼 정보
    configs_.emplace("account", RateLimitConfig("account", 10));          // 잔고/포지션
    configs_.emplace("order", RateLimitConfig("order", 10));              // 주문 생성/조회/취소
    configs_.emplace("default", RateLimitConfig("default", 20));

    LOG_DEBUG("RateLimiter initialized (groups: market_data=20/s, account=10/s, order=10/s)");
}

RateLimitConfig& RateLimiter::configFor(const std::string& group) {
    auto it = configs_.find(group);
    if (it == configs_.end()) it = configs_.find("default");
    return it->second;
}

bool RateLimiter::tryAcquire(const std::string& group) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (is_blocked_) {
        if (std::chrono::steady_clock::now() < block_end_time_) {
            rejected_requests_++;
            return false;
        }
        is_blocked_ = false;
        cv_.notify_all();
    }

    auto& config = configFor(group);
    resetWindowIfNeeded(config);

    if (config.current_count < config.max_per_second) {
        config.current_count++;
        total_requests_++;
        return true;
    }

    rejected_requests_++;
    return false;
}

void RateLimiter::acquire(const std::string& group) {
    std::unique_lock<std::mutex> lock(mutex_);

    auto& config = configFor(group);

    while (true) {
        if (is_blocked_) {
            const auto wait_start = std::chrono::steady_clock::now();
            auto status = cv_.wait_until(lock, block_end_time_);
            total_wait_time_ += std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - wait_start
            );
            if (status == std::cv_status::timeout) {
                is_blocked_ = false;
            } else {
                continue;
            }
        }

        resetWindowIfNeeded(config);

        if (config.current_count < config.max_per_second) {
            config.current_count++;
            total_requests_++;
            return;
        }

        // 다음 윈도우 시작까지 대기
        auto wake_time = config.window_start + std::chrono::seconds(1) + std::chrono::milliseconds(1);

        forced_waits_++;
        auto wait_start = std::chrono::steady_clock::now();
        cv_.wait_until(lock, wake_time);
        total_wait_time_ += std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - wait_start
        );
    }
}

int RateLimiter::getRemainingRequests(const std::string& group) {
    std::unique_lock<std::mutex> lock(mutex_);

    auto& config = configFor(group);
    resetWindowIfNeeded(config);

    return std::max(0, config.max_per_second - config.current_count);
}

void RateLimiter::updateUsedWeight(int used_weight_1m) {
    std::unique_lock<std::mutex> lock(mutex_);
    last_used_weight_ = used_weight_1m;

    if (used_weight_1m < kWeightLimitPerMinute - kWeightSafetyMargin) {
        return;
    }

    // weight 는 분 단위로 초기화됨
    const auto now = std::chrono::system_clock::now();
    const auto ms_into_minute = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 60000;
    const auto remaining = std::chrono::milliseconds(60000 - ms_into_minute + 100);

    LOG_WARN("Request weight {} near limit {} - pausing requests for {} ms",
             used_weight_1m, kWeightLimitPerMinute, remaining.count());
    blockFor(remaining);
}

void RateLimiter::handleRateLimitError(int status_code, int retry_after_sec) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (status_code == 429) {
        const int seconds = retry_after_sec > 0 ? retry_after_sec : 1;
        LOG_WARN("429 Too Many Requests - pausing all requests for {}s", seconds);
        forced_waits_++;
        blockFor(std::chrono::seconds(seconds));
    } else if (status_code == 418) {
        const int seconds = retry_after_sec > 0 ? retry_after_sec : 60;
        LOG_ERROR("418 IP ban detected - pausing all requests for {}s", seconds);
        forced_waits_++;
        blockFor(std::chrono::seconds(seconds));
    }
}

bool RateLimiter::isBlocked() const {
    std::unique_lock<std::mutex> lock(mutex_);
    return is_blocked_ && std::chrono::steady_clock::now() < block_end_time_;
}

RateLimiter::Stats RateLimiter::getStats() const {
    std::unique_lock<std::mutex> lock(mutex_);

    Stats stats;
    stats.total_requests = total_requests_;
    stats.rejected_requests = rejected_requests_;
    stats.forced_waits = forced_waits_;
    stats.last_used_weight = last_used_weight_;
    stats.total_wait_time = total_wait_time_;

    return stats;
}

void RateLimiter::blockFor(std::chrono::milliseconds duration) {
    const auto end = std::chrono::steady_clock::now() + duration;
    // 기존 차단이 더 길면 유지
    if (!is_blocked_ || end > block_end_time_) {
        block_end_time_ = end;
    }
    is_blocked_ = true;
    cv_.notify_all();
}

void RateLimiter::resetWindowIfNeeded(RateLimitConfig& config) {
    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        now - config.window_start
    );

    if (elapsed.count() >= 1000) {
        config.current_count = 0;
        config.window_start = now;
        cv_.notify_all();
    }
}

} // namespace execution
} // namespace triplersi
