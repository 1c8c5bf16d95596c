#pragma once

// 테스트용 캔들 피드: start() 에서 즉시 연결 성공/실패
//  - 연결 성공 시 listener->onFeedConnected() 를 호출 스레드에서 바로 호출
//  - push() 로 캔들 주입

#include <atomic>
#include <functional>
#include <memory>
#include <string>

#include "network/IMarketFeed.h"

namespace triplersi {
namespace test {

class FakeMarketFeed : public network::IMarketFeed {
public:
    FakeMarketFeed(network::IFeedListener* listener, CandleHandler handler, bool will_connect)
        : listener_(listener)
        , handler_(std::move(handler))
        , will_connect_(will_connect)
    {}

    bool start() override {
        if (!will_connect_) {
            return false;
        }
        connected_ = true;
        last_message_ms_ = nowMs();
        if (listener_) {
            listener_->onFeedConnected();
        }
        return true;
    }

    void stop() override {
        connected_ = false;
    }

    bool isConnected() const override { return connected_; }
    long long getLastMessageTimeMs() const override { return last_message_ms_; }

    void push(const Candle& candle) {
        last_message_ms_ = nowMs();
        if (listener_) {
            listener_->onFeedData();
        }
        if (handler_) {
            handler_(candle);
        }
    }

    // 서버 측 연결 종료
    void drop(const std::string& reason) {
        connected_ = false;
        if (listener_) {
            listener_->onFeedDisconnected(reason);
        }
    }

private:
    network::IFeedListener* listener_;
    CandleHandler handler_;
    bool will_connect_;
    std::atomic<bool> connected_{false};
    std::atomic<long long> last_message_ms_{0};
};

} // namespace test
} // namespace triplersi
