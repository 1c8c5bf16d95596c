#pragma once

#include <functional>
#include <memory>
#include <string>

#include "common/Types.h"

namespace triplersi {
namespace network {

// 스트림 연결 상태 콜백
class IFeedListener {
public:
    virtual ~IFeedListener() = default;

    virtual void onFeedConnected() = 0;
    virtual void onFeedDisconnected(const std::string& reason) = 0;
    virtual void onFeedData() = 0;
};

// 캔들 스트림 1회 세션. 끊기면 재연결하지 않고 listener 에 알린 뒤 종료
class IMarketFeed {
public:
    using CandleHandler = std::function<void(const Candle&)>;

    virtual ~IMarketFeed() = default;

    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual bool isConnected() const = 0;
    virtual long long getLastMessageTimeMs() const = 0;
};

using MarketFeedFactory = std::function<std::unique_ptr<IMarketFeed>(IFeedListener*)>;

} // namespace network
} // namespace triplersi
