#include "execution/RetryPolicy.h"

#include <cassert>
#include <iostream>
#include <vector>

using namespace triplersi;
using execution::OperationType;
using execution::RetryPolicy;

int main() {
    std::vector<long long> sleeps;
    RetryPolicy policy(engine::RetryConfig{}, [&sleeps](std::chrono::milliseconds d) {
        sleeps.push_back(d.count());
    });

    // 일시적 오류 2회 후 성공 → 대기 5000, 6000
    {
        int calls = 0;
        int value = policy.execute(OperationType::ORDER_PLACEMENT, "placeOrder", [&](int attempt) {
            calls++;
            if (attempt < 3) {
                throw network::ExchangeError::transport("timeout");
            }
            return 42;
        });
        assert(value == 42);
        assert(calls == 3);
        assert(sleeps.size() == 2);
        assert(sleeps[0] == 5000);
        assert(sleeps[1] == 6000);
    }

    // 영구 오류는 재시도 없이 전파
    {
        sleeps.clear();
        int calls = 0;
        bool thrown = false;
        try {
            policy.execute(OperationType::ORDER_PLACEMENT, "placeOrder", [&](int) -> int {
                calls++;
                throw network::ExchangeError("insufficient margin", 400, -2019, false);
            });
        } catch (const network::ExchangeError& e) {
            thrown = true;
            assert(e.exchangeCode() == -2019);
        }
        assert(thrown);
        assert(calls == 1);
        assert(sleeps.empty());
    }

    // 재시도 소진: max_retries 3 → 총 4회 시도
    {
        sleeps.clear();
        int calls = 0;
        bool thrown = false;
        try {
            policy.execute(OperationType::ORDER_STATUS, "getOrder", [&](int) -> int {
                calls++;
                throw network::ExchangeError("server busy", 503, -1008, true);
            });
        } catch (const network::ExchangeError& e) {
            thrown = true;
            assert(e.isTransient());
        }
        assert(thrown);
        assert(calls == 4);
        assert(sleeps.size() == 3);
        assert(sleeps[0] == 2000);
    }

    assert(policy.delayForRetry(OperationType::DEFAULT, 1) == 10000);
    assert(policy.delayForRetry(OperationType::DEFAULT, 2) == 12000);
    assert(policy.settingsFor(OperationType::ACCOUNT).max_retries == 5);

    const auto stats = policy.getStats();
    assert(stats.total_calls == 3);
    assert(stats.total_retries == 5);
    assert(stats.total_failures == 2);

    assert(network::ExchangeError::isTransientCode(-1021));
    assert(!network::ExchangeError::isTransientCode(-2010));

    std::cout << "[TEST] RetryPolicy PASSED\n";
    return 0;
}
