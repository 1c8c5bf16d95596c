#pragma once

#include <atomic>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "common/Result.h"
#include "execution/IExchangeGateway.h"

namespace triplersi {
namespace execution {

// 미체결 주문 목록 diff 로 보호 주문 체결(소멸) 감지
class OrderWatcher {
public:
    explicit OrderWatcher(std::shared_ptr<IExchangeGateway> gateway);

    // 미체결 주문 ID 집합 1회 조회
    Result<std::set<std::string>> fetchOpenOrderIds();

    // watched 중 open 에 없는 ID (빈 ID 는 무시)
    static std::vector<std::string> vanished(
        const std::vector<std::string>& watched,
        const std::set<std::string>& open_ids
    );

    long long getPollCount() const { return poll_count_.load(); }
    long long getFailedPollCount() const { return failed_poll_count_.load(); }

private:
    std::shared_ptr<IExchangeGateway> gateway_;
    std::atomic<long long> poll_count_{0};
    std::atomic<long long> failed_poll_count_{0};
};

} // namespace execution
} // namespace triplersi
