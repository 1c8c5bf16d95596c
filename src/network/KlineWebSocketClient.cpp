#include "network/KlineWebSocketClient.h"

#include "common/JsonUtils.h"
#include "common/Logger.h"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/ssl.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>
#include <utility>

namespace triplersi {
namespace network {

KlineWebSocketClient::KlineWebSocketClient(
    std::string host,
    std::string port,
    std::string symbol,
    std::string interval,
    IFeedListener* listener,
    CandleHandler candle_handler
)
    : host_(std::move(host))
    , port_(std::move(port))
    , symbol_(std::move(symbol))
    , interval_(std::move(interval))
    , listener_(listener)
    , candle_handler_(std::move(candle_handler))
{
    std::transform(symbol_.begin(), symbol_.end(), symbol_.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
}

KlineWebSocketClient::~KlineWebSocketClient() {
    stop();
}

bool KlineWebSocketClient::start() {
    if (running_.load()) {
        return false;
    }
    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }

    running_ = true;
    worker_thread_ = std::thread(&KlineWebSocketClient::runSession, this);
    return true;
}

void KlineWebSocketClient::stop() {
    running_ = false;
    connected_ = false;

    if (worker_thread_.joinable() && worker_thread_.get_id() != std::this_thread::get_id()) {
        worker_thread_.join();
    }
}

void KlineWebSocketClient::runSession() {
    std::string reason = "stopped";
    try {
        connectAndReadLoop();
    } catch (const std::exception& e) {
        reason = e.what();
        LOG_WARN("Kline WS session ended: {}", reason);
    }

    const bool was_running = running_.exchange(false);
    connected_ = false;

    // stop() 에 의한 정상 종료는 끊김으로 보고하지 않음
    if (was_running && listener_) {
        listener_->onFeedDisconnected(reason);
    }
}

void KlineWebSocketClient::connectAndReadLoop() {
    namespace beast = boost::beast;
    namespace websocket = beast::websocket;
    namespace net = boost::asio;
    namespace ssl = boost::asio::ssl;
    using tcp = boost::asio::ip::tcp;

    net::io_context ioc;
    ssl::context ssl_ctx(ssl::context::tlsv12_client);
    ssl_ctx.set_default_verify_paths();
    ssl_ctx.set_verify_mode(ssl::verify_peer);

    websocket::stream<beast::ssl_stream<tcp::socket>> ws(ioc, ssl_ctx);
    ws.set_option(websocket::stream_base::timeout{
        std::chrono::seconds(15),   // handshake timeout
        std::chrono::seconds(30),   // idle timeout
        true                        // send ping automatically
    });

    const std::string target = "/ws/" + symbol_ + "@kline_" + interval_;

    tcp::resolver resolver(ioc);
    auto results = resolver.resolve(host_, port_);
    net::connect(ws.next_layer().next_layer(), results.begin(), results.end());
    if (!SSL_set_tlsext_host_name(ws.next_layer().native_handle(), host_.c_str())) {
        throw std::runtime_error("Kline WS SNI setup failed");
    }
    ws.next_layer().set_verify_callback(ssl::host_name_verification(host_));
    ws.next_layer().handshake(ssl::stream_base::client);

    ws.set_option(websocket::stream_base::decorator(
        [](websocket::request_type& req) {
            req.set(boost::beast::http::field::user_agent, "triplersi/1.0");
        }
    ));

    ws.handshake(host_, target);

    connected_ = true;
    last_message_time_ms_ = nowMs();
    LOG_INFO("Kline WS connected: {}{}", host_, target);

    if (listener_) {
        listener_->onFeedConnected();
    }

    ws.control_callback([this](websocket::frame_type kind, beast::string_view) {
        if (kind == websocket::frame_type::pong || kind == websocket::frame_type::ping) {
            last_message_time_ms_ = nowMs();
        }
    });

    beast::flat_buffer buffer;

    while (running_.load()) {
        boost::system::error_code ec;
        ws.read(buffer, ec);
        if (!ec) {
            const std::string payload = beast::buffers_to_string(buffer.cdata());
            buffer.consume(buffer.size());
            last_message_time_ms_ = nowMs();
            if (listener_) {
                listener_->onFeedData();
            }
            dispatchMessage(payload);
        } else if (ec == boost::asio::error::operation_aborted && !running_.load()) {
            break;
        } else if (ec == beast::error::timeout) {
            throw std::runtime_error("Kline WS timed out");
        } else if (ec == websocket::error::closed) {
            throw std::runtime_error("Kline WS closed by server");
        } else {
            throw std::runtime_error("Kline WS read failed: " + ec.message());
        }
    }

    boost::system::error_code close_ec;
    ws.close(websocket::close_code::normal, close_ec);
    connected_ = false;
    if (close_ec && close_ec != websocket::error::closed) {
        LOG_WARN("Kline WS close warning: {}", close_ec.message());
    } else {
        LOG_INFO("Kline WS stopped");
    }
}

bool KlineWebSocketClient::parseKlineMessage(const nlohmann::json& message, Candle& out) {
    if (!message.is_object() || message.value("e", "") != "kline" || !message.contains("k")) {
        return false;
    }

    const auto& k = message["k"];
    if (!k.is_object()) {
        return false;
    }

    out.open_time = k.value("t", 0LL);
    out.close_time = k.value("T", 0LL);
    out.open = common::parseJsonNumber(k, "o");
    out.high = common::parseJsonNumber(k, "h");
    out.low = common::parseJsonNumber(k, "l");
    out.close = common::parseJsonNumber(k, "c");
    out.volume = common::parseJsonNumber(k, "v");
    out.closed = k.value("x", false);
    return true;
}

void KlineWebSocketClient::dispatchMessage(const std::string& payload) {
    try {
        const auto message = nlohmann::json::parse(payload);

        Candle candle;
        if (!parseKlineMessage(message, candle)) {
            return;
        }

        CandleHandler handler_copy;
        {
            std::lock_guard<std::mutex> lock(handler_mutex_);
            handler_copy = candle_handler_;
        }
        if (handler_copy) {
            handler_copy(candle);
        }
    } catch (const std::exception& e) {
        LOG_WARN("Failed to handle kline WS message: {}", e.what());
    }
}

} // namespace network
} // namespace triplersi
