#include "common/Config.h"
#include "common/Logger.h"
#include "engine/TradingEngine.h"
#include "execution/ExchangeGateway.h"
#include "network/BinanceHttpClient.h"
#include "network/KlineWebSocketClient.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace triplersi;

namespace {

// 시그널 핸들러에서는 플래그만 세우고, 종료는 메인 스레드에서
std::atomic<bool> g_shutdown_requested{false};

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown_requested = true;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        const std::string config_path = argc > 1 ? argv[1] : "config/config.json";

        auto& config = Config::getInstance();
        config.load(config_path);
        const engine::EngineConfig& engine_config = config.getEngineConfig();

        Logger::getInstance().initialize(engine_config.log_dir, engine_config.log_level);

        const auto errors = config.validate();
        if (!errors.empty()) {
            for (const auto& e : errors) {
                LOG_ERROR("Config error: {}", e);
                std::cerr << "Config error: " << e << std::endl;
            }
            return 1;
        }

        if (config.getApiKey().empty() || config.getApiSecret().empty()) {
            LOG_ERROR("BINANCE_API_KEY / BINANCE_API_SECRET not set");
            return 1;
        }

        LOG_INFO("========================================");
        LOG_INFO("TripleRSI 선물 봇 시작 ({} {}, {})",
                 engine_config.exchange.symbol, engine_config.exchange.timeframe,
                 engine_config.mode == engine::TradingMode::LIVE ? "LIVE" : "TESTNET");
        LOG_INFO("========================================");

        auto http_client = std::make_shared<network::BinanceHttpClient>(
            config.getApiKey(),
            config.getApiSecret(),
            engine_config.exchange.rest_base_url,
            engine_config.exchange.recv_window_ms,
            engine_config.exchange.http_timeout_ms
        );
        auto gateway = std::make_shared<execution::ExchangeGateway>(http_client, engine_config);

        engine::CandleFeedFactory feed_factory =
            [&engine_config](network::IFeedListener* listener, network::IMarketFeed::CandleHandler handler) {
                std::unique_ptr<network::IMarketFeed> feed = std::make_unique<network::KlineWebSocketClient>(
                    engine_config.exchange.ws_host,
                    engine_config.exchange.ws_port,
                    engine_config.exchange.symbol,
                    engine_config.exchange.timeframe,
                    listener,
                    std::move(handler)
                );
                return feed;
            };

        engine::TradingEngine trading_engine(engine_config, gateway, feed_factory);

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        if (!trading_engine.start()) {
            LOG_ERROR("엔진 시작 실패");
            return 1;
        }

        while (trading_engine.isRunning() && !g_shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
        }

        if (g_shutdown_requested) {
            LOG_INFO("종료 신호 수신");
        }
        trading_engine.stop();
        return 0;
    } catch (const std::exception& e) {
        LOG_ERROR("치명적 오류: {}", e.what());
        std::cerr << "Fatal: " << e.what() << std::endl;
        return 1;
    }
}
