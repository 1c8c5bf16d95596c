#pragma once

#include <atomic>
#include <mutex>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "network/IMarketFeed.h"

namespace triplersi {
namespace network {

// <symbol>@kline_<interval> 스트림 클라이언트
class KlineWebSocketClient : public IMarketFeed {
public:
    KlineWebSocketClient(
        std::string host,
        std::string port,
        std::string symbol,
        std::string interval,
        IFeedListener* listener,
        CandleHandler candle_handler
    );
    ~KlineWebSocketClient() override;

    bool start() override;
    void stop() override;

    bool isConnected() const override { return connected_.load(); }
    long long getLastMessageTimeMs() const override { return last_message_time_ms_.load(); }

    // kline 이벤트 → Candle (kline 이벤트가 아니면 false)
    static bool parseKlineMessage(const nlohmann::json& message, Candle& out);

private:
    void runSession();
    void connectAndReadLoop();
    void dispatchMessage(const std::string& payload);

    std::string host_;
    std::string port_;
    std::string symbol_;
    std::string interval_;
    IFeedListener* listener_;

    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::atomic<long long> last_message_time_ms_{0};
    std::thread worker_thread_;

    mutable std::mutex handler_mutex_;
    CandleHandler candle_handler_;
};

} // namespace network
} // namespace triplersi
