#include "common/Config.h"
#include "common/PathUtils.h"
#include "common/Timeframe.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace triplersi {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string toLowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string readEnvVar(const char* name) {
    const char* value = std::getenv(name);
    return value ? trimCopy(value) : "";
}

// JSON 은 초 단위, 구조체는 ms
long long secondsToMs(const nlohmann::json& section, const char* key, long long default_ms) {
    if (!section.contains(key)) {
        return default_ms;
    }
    const double seconds = section[key].get<double>();
    return static_cast<long long>(seconds * 1000.0);
}

void readRetry(const nlohmann::json& r, const char* key, engine::RetrySettings& out) {
    if (!r.contains(key)) {
        return;
    }
    const auto& s = r[key];
    out.max_retries = s.value("max_retries", out.max_retries);
    out.delay_ms = secondsToMs(s, "delay_sec", out.delay_ms);
    out.backoff_multiplier = s.value("backoff_multiplier", out.backoff_multiplier);
}
} // namespace

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

bool Config::load(const std::string& path) {
    const std::filesystem::path config_path = utils::PathUtils::resolveRelativePath(path);

    std::cout << "Config path: " << config_path << std::endl;

    api_key_ = readEnvVar("BINANCE_API_KEY");
    api_secret_ = readEnvVar("BINANCE_API_SECRET");
    if (api_key_.empty() || api_secret_.empty()) {
        std::cout << "Warning: BINANCE_API_KEY or BINANCE_API_SECRET is empty." << std::endl;
    }

    if (!std::filesystem::exists(config_path)) {
        std::cout << "Warning: config file not found: " << config_path << std::endl;
        std::cout << "Using defaults." << std::endl;
        return false;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        std::cout << "Warning: cannot open config file." << std::endl;
        return false;
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        std::cout << "Warning: config parse error: " << e.what() << std::endl;
        return false;
    }

    loadFromJson(j);
    return true;
}

void Config::loadFromJson(const nlohmann::json& j) {
    engine::EngineConfig& c = engine_config_;

    if (j.contains("api")) {
        const std::string file_key = trimCopy(j["api"].value("api_key", ""));
        const std::string file_secret = trimCopy(j["api"].value("api_secret", ""));
        if (!file_key.empty() || !file_secret.empty()) {
            std::cout << "Warning: api keys in config are ignored. Use BINANCE_API_KEY/BINANCE_API_SECRET."
                      << std::endl;
        }
    }

    if (j.contains("engine")) {
        const auto& e = j["engine"];
        const std::string mode_str = e.value("mode", "TESTNET");
        c.mode = (mode_str == "LIVE") ? engine::TradingMode::LIVE : engine::TradingMode::TESTNET;
        c.trading_enabled = e.value("trading_enabled", c.trading_enabled);
        c.health_check_interval_ms = secondsToMs(e, "health_check_interval_sec", c.health_check_interval_ms);
        c.max_api_failures = e.value("max_api_failures", c.max_api_failures);
    }

    // 테스트넷 모드 기본 엔드포인트 (exchange 섹션에서 덮어쓸 수 있음)
    if (c.mode == engine::TradingMode::TESTNET) {
        c.exchange.rest_base_url = "https://testnet.binancefuture.com";
        c.exchange.ws_host = "stream.binancefuture.com";
    }

    if (j.contains("exchange")) {
        const auto& x = j["exchange"];
        c.exchange.rest_base_url = x.value("rest_base_url", c.exchange.rest_base_url);
        c.exchange.ws_host = x.value("ws_host", c.exchange.ws_host);
        c.exchange.ws_port = x.value("ws_port", c.exchange.ws_port);
        c.exchange.symbol = x.value("symbol", c.exchange.symbol);
        c.exchange.balance_asset = x.value("balance_asset", c.exchange.balance_asset);
        c.exchange.timeframe = x.value("timeframe", c.exchange.timeframe);
        c.exchange.recv_window_ms = x.value("recv_window_ms", c.exchange.recv_window_ms);
        c.exchange.http_timeout_ms = secondsToMs(x, "http_timeout_sec", c.exchange.http_timeout_ms);
        c.exchange.initial_klines = x.value("initial_klines", c.exchange.initial_klines);
    }

    if (j.contains("indicators")) {
        const auto& i = j["indicators"];
        if (i.contains("rsi_periods") && i["rsi_periods"].is_array()) {
            c.indicators.rsi_periods = i["rsi_periods"].get<std::vector<int>>();
        }
        c.indicators.rsi_mtf_period = i.value("rsi_mtf_period", c.indicators.rsi_mtf_period);
        c.indicators.mtf_factor = i.value("mtf_factor", c.indicators.mtf_factor);
        c.indicators.ema_period = i.value("ema_period", c.indicators.ema_period);
        c.indicators.ema_slope_lookback = i.value("ema_slope_lookback", c.indicators.ema_slope_lookback);
        c.indicators.double_heikin_ashi = i.value("double_heikin_ashi", c.indicators.double_heikin_ashi);
        c.indicators.max_candles = i.value("max_candles", c.indicators.max_candles);
    }

    if (j.contains("signal")) {
        const auto& s = j["signal"];
        c.signal.rsi_oversold = s.value("rsi_oversold", c.signal.rsi_oversold);
        c.signal.rsi_overbought = s.value("rsi_overbought", c.signal.rsi_overbought);
        c.signal.filter_ha = s.value("filter_ha", c.signal.filter_ha);
        c.signal.filter_trend = s.value("filter_trend", c.signal.filter_trend);
        c.signal.filter_mtf_rsi = s.value("filter_mtf_rsi", c.signal.filter_mtf_rsi);
        const std::string policy = toLowerCopy(s.value("latch_policy", std::string("latched")));
        c.signal.latch_policy = (policy == "reconfirm")
            ? engine::SignalLatchPolicy::RECONFIRM
            : engine::SignalLatchPolicy::LATCHED;
    }

    if (j.contains("risk")) {
        const auto& r = j["risk"];
        c.risk.max_balance_risk = r.value("max_balance_risk", c.risk.max_balance_risk);
        c.risk.min_position_notional = r.value("min_position_notional", c.risk.min_position_notional);
        c.risk.max_position_notional = r.value("max_position_notional", c.risk.max_position_notional);
        c.risk.min_balance = r.value("min_balance", c.risk.min_balance);
        c.risk.min_confidence = r.value("min_confidence", c.risk.min_confidence);
        c.risk.sl_buffer_pct = r.value("sl_buffer_pct", c.risk.sl_buffer_pct);
        c.risk.sl_lookback_candles = r.value("sl_lookback_candles", c.risk.sl_lookback_candles);
        const std::string tp_mode = toLowerCopy(r.value("tp_mode", std::string("ratio")));
        c.risk.tp_mode = (tp_mode == "fixed_percent")
            ? engine::TakeProfitMode::FIXED_PERCENT
            : engine::TakeProfitMode::RATIO;
        c.risk.tp_ratio = r.value("tp_ratio", c.risk.tp_ratio);
        c.risk.tp_percent = r.value("tp_percent", c.risk.tp_percent);
        c.risk.max_daily_trades = r.value("max_daily_trades", c.risk.max_daily_trades);
        c.risk.max_daily_loss = r.value("max_daily_loss", c.risk.max_daily_loss);
        c.risk.max_consecutive_losses = r.value("max_consecutive_losses", c.risk.max_consecutive_losses);
        c.risk.emergency_stop_loss = r.value("emergency_stop_loss", c.risk.emergency_stop_loss);
        c.risk.max_latency_ms = r.value("max_latency_ms", c.risk.max_latency_ms);
    }

    if (j.contains("orders")) {
        const auto& o = j["orders"];
        const std::string entry_type = o.value("entry_order_type", std::string("LIMIT"));
        c.orders.entry_order_type = (entry_type == "MARKET")
            ? engine::EntryOrderType::MARKET
            : engine::EntryOrderType::LIMIT;
        c.orders.limit_spread_percent = o.value("limit_spread_percent", c.orders.limit_spread_percent);
        c.orders.order_execution_timeout_ms =
            secondsToMs(o, "order_execution_timeout_sec", c.orders.order_execution_timeout_ms);
        c.orders.fill_poll_interval_ms = secondsToMs(o, "fill_poll_interval_sec", c.orders.fill_poll_interval_ms);
        c.orders.market_fallback_enabled = o.value("market_fallback_enabled", c.orders.market_fallback_enabled);
        c.orders.fallback_max_slippage_pct = o.value("fallback_max_slippage_pct", c.orders.fallback_max_slippage_pct);
        c.orders.monitor_interval_ms = secondsToMs(o, "monitor_interval_sec", c.orders.monitor_interval_ms);
        c.orders.deferred_protection = o.value("deferred_protection", c.orders.deferred_protection);
        c.orders.close_retry_attempts = o.value("close_retry_attempts", c.orders.close_retry_attempts);
    }

    if (j.contains("deferred_protection")) {
        const auto& d = j["deferred_protection"];
        c.deferred.price_offset_percent = d.value("price_offset_percent", c.deferred.price_offset_percent);
        c.deferred.check_interval_ms = secondsToMs(d, "check_interval_sec", c.deferred.check_interval_ms);
        c.deferred.processing_timeout_ms = secondsToMs(d, "processing_timeout_sec", c.deferred.processing_timeout_ms);
        c.deferred.min_distance_ticks = d.value("min_distance_ticks", c.deferred.min_distance_ticks);
        c.deferred.cleanup_after_ms = secondsToMs(d, "cleanup_after_sec", c.deferred.cleanup_after_ms);
    }

    if (j.contains("connection")) {
        const auto& n = j["connection"];
        c.connection.retry_enabled = n.value("retry_enabled", c.connection.retry_enabled);
        c.connection.retry_interval_ms = secondsToMs(n, "retry_interval_sec", c.connection.retry_interval_ms);
        c.connection.max_retries = n.value("max_retries", c.connection.max_retries);
        c.connection.backoff_max_ms = secondsToMs(n, "backoff_max_sec", c.connection.backoff_max_ms);
        c.connection.connect_wait_ms = secondsToMs(n, "connect_wait_sec", c.connection.connect_wait_ms);
        c.connection.connect_poll_ms = secondsToMs(n, "connect_poll_sec", c.connection.connect_poll_ms);
        c.connection.safe_mode_duration_ms = secondsToMs(n, "safe_mode_duration_sec", c.connection.safe_mode_duration_ms);
        c.connection.safe_mode_recheck_delay_ms =
            secondsToMs(n, "safe_mode_recheck_delay_sec", c.connection.safe_mode_recheck_delay_ms);
        c.connection.sync_after_reconnection = n.value("sync_after_reconnection", c.connection.sync_after_reconnection);
        c.connection.stale_feed_timeout_ms = secondsToMs(n, "stale_feed_timeout_sec", c.connection.stale_feed_timeout_ms);
    }

    if (j.contains("retry")) {
        const auto& r = j["retry"];
        readRetry(r, "default", c.retry.defaults);
        readRetry(r, "order_placement", c.retry.order_placement);
        readRetry(r, "order_status", c.retry.order_status);
        readRetry(r, "order_cancellation", c.retry.order_cancellation);
        readRetry(r, "market_data", c.retry.market_data);
        readRetry(r, "account", c.retry.account);
    }

    if (j.contains("logging")) {
        const auto& l = j["logging"];
        c.log_dir = l.value("dir", c.log_dir);
        c.log_level = l.value("level", c.log_level);
    }
}

std::vector<std::string> Config::validate() const {
    return validate(engine_config_);
}

std::vector<std::string> Config::validate(const engine::EngineConfig& c) {
    std::vector<std::string> errors;

    if (c.exchange.symbol.empty()) {
        errors.push_back("exchange.symbol is empty");
    }
    if (!common::isKnownTimeframe(c.exchange.timeframe)) {
        errors.push_back("exchange.timeframe is not a known interval: " + c.exchange.timeframe);
    }
    if (c.indicators.rsi_periods.empty()) {
        errors.push_back("indicators.rsi_periods is empty");
    }
    for (int period : c.indicators.rsi_periods) {
        if (period < 2) {
            errors.push_back("indicators.rsi_periods entries must be >= 2");
            break;
        }
    }
    if (c.indicators.mtf_factor < 1) {
        errors.push_back("indicators.mtf_factor must be >= 1");
    }
    if (c.signal.rsi_oversold >= c.signal.rsi_overbought) {
        errors.push_back("signal.rsi_oversold must be below signal.rsi_overbought");
    }
    if (c.risk.max_balance_risk <= 0.0 || c.risk.max_balance_risk > 1.0) {
        errors.push_back("risk.max_balance_risk must be in (0, 1]");
    }
    if (c.risk.min_position_notional <= 0.0 ||
        c.risk.min_position_notional > c.risk.max_position_notional) {
        errors.push_back("risk.min_position_notional must be positive and <= max_position_notional");
    }
    if (c.risk.tp_mode == engine::TakeProfitMode::RATIO && c.risk.tp_ratio <= 0.0) {
        errors.push_back("risk.tp_ratio must be positive");
    }
    if (c.risk.tp_mode == engine::TakeProfitMode::FIXED_PERCENT && c.risk.tp_percent <= 0.0) {
        errors.push_back("risk.tp_percent must be positive");
    }
    if (c.risk.sl_buffer_pct < 0.0 || c.risk.sl_buffer_pct >= 1.0) {
        errors.push_back("risk.sl_buffer_pct must be in [0, 1)");
    }
    if (c.risk.sl_lookback_candles < 1) {
        errors.push_back("risk.sl_lookback_candles must be >= 1");
    }
    if (c.risk.emergency_stop_loss <= 0.0) {
        errors.push_back("risk.emergency_stop_loss must be positive");
    }
    if (c.orders.order_execution_timeout_ms <= 0 || c.orders.fill_poll_interval_ms <= 0) {
        errors.push_back("orders timeouts must be positive");
    }
    if (c.orders.fallback_max_slippage_pct < 0.0) {
        errors.push_back("orders.fallback_max_slippage_pct must be >= 0");
    }
    if (c.deferred.price_offset_percent < 0.0) {
        errors.push_back("deferred_protection.price_offset_percent must be >= 0");
    }
    if (c.deferred.processing_timeout_ms <= 0 || c.deferred.check_interval_ms <= 0) {
        errors.push_back("deferred_protection intervals must be positive");
    }
    if (c.connection.retry_interval_ms <= 0 || c.connection.backoff_max_ms < c.connection.retry_interval_ms) {
        errors.push_back("connection.backoff_max_sec must be >= retry_interval_sec > 0");
    }
    if (c.connection.max_retries < 0) {
        errors.push_back("connection.max_retries must be >= 0");
    }

    return errors;
}

} // namespace triplersi
