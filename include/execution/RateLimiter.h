#pragma once

#include <string>
#include <map>
#include <chrono>
#include <mutex>
#include <condition_variable>

namespace triplersi {
namespace execution {

// Rate Limit 그룹별 설정
struct RateLimitConfig {
    std::string group_name;
    int max_per_second;           // 초당 최대 요청 수
    int current_count;            // 현재 초의 요청 수
    std::chrono::steady_clock::time_point window_start;

    RateLimitConfig(const std::string& name, int max_req)
        : group_name(name)
        , max_per_second(max_req)
        , current_count(0)
        , window_start(std::chrono::steady_clock::now())
    {}
};

// 선물 REST 요청 제한 (그룹별 초당 요청 수 + 분당 weight)
class RateLimiter {
public:
    RateLimiter();

    // Non-blocking
    bool tryAcquire(const std::string& group);

    // 필요시 대기 (Blocking)
    void acquire(const std::string& group);

    int getRemainingRequests(const std::string& group);

    // X-MBX-USED-WEIGHT-1M 헤더 반영 (한도 근접 시 다음 분까지 차단)
    void updateUsedWeight(int used_weight_1m);

    // 429 → 1초 (또는 Retry-After), 418 → 1분 차단
    void handleRateLimitError(int status_code, int retry_after_sec = 0);

    bool isBlocked() const;

    struct Stats {
        int total_requests;
        int rejected_requests;
        int forced_waits;
        int last_used_weight;
        std::chrono::milliseconds total_wait_time;
    };
    Stats getStats() const;

    static constexpr int kWeightLimitPerMinute = 2400;
    static constexpr int kWeightSafetyMargin = 200;

private:
    std::map<std::string, RateLimitConfig> configs_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    // 통계
    int total_requests_;
    int rejected_requests_;
    int forced_waits_;
    int last_used_weight_;
    std::chrono::milliseconds total_wait_time_;

    // 차단 상태
    bool is_blocked_;
    std::chrono::steady_clock::time_point block_end_time_;

    RateLimitConfig& configFor(const std::string& group);
    void resetWindowIfNeeded(RateLimitConfig& config);
    void blockFor(std::chrono::milliseconds duration);
};

} // namespace execution
} // namespace triplersi
