#pragma once

#include <string>
#include <vector>

namespace triplersi {
namespace engine {

// 거래 모드
enum class TradingMode {
    LIVE,           // 실전 (fapi.binance.com)
    TESTNET         // 테스트넷 (testnet.binancefuture.com)
};

enum class EntryOrderType {
    MARKET,
    LIMIT
};

enum class TakeProfitMode {
    FIXED_PERCENT,  // entry × (1 ± tp_percent/100)
    RATIO           // entry ± |entry - stop| × tp_ratio
};

// 대기 신호(latch) 유지 정책
enum class SignalLatchPolicy {
    LATCHED,        // 무장 후 RSI 조건 재확인 없음
    RECONFIRM       // 매 캔들 RSI 조건 재확인, 깨지면 해제
};

struct ExchangeConfig {
    std::string rest_base_url = "https://fapi.binance.com";
    std::string ws_host = "fstream.binance.com";
    std::string ws_port = "443";
    std::string symbol = "BTCUSDC";
    std::string balance_asset = "USDC";
    std::string timeframe = "5m";
    long long recv_window_ms = 5000;
    long long http_timeout_ms = 30000;
    int initial_klines = 500;
};

struct IndicatorConfig {
    std::vector<int> rsi_periods{5, 14, 21};
    int rsi_mtf_period = 14;
    int mtf_factor = 3;             // 상위 타임프레임 = timeframe × mtf_factor
    int ema_period = 200;
    int ema_slope_lookback = 5;
    bool double_heikin_ashi = false;
    int max_candles = 1000;
};

struct SignalConfig {
    double rsi_oversold = 30.0;
    double rsi_overbought = 70.0;
    bool filter_ha = true;
    bool filter_trend = false;
    bool filter_mtf_rsi = false;
    SignalLatchPolicy latch_policy = SignalLatchPolicy::LATCHED;
};

struct RiskConfig {
    double max_balance_risk = 0.02;       // 트레이드당 잔고 대비 위험 비율
    double min_position_notional = 10.0;
    double max_position_notional = 1000.0;
    double min_balance = 10.0;
    double min_confidence = 0.6;

    double sl_buffer_pct = 0.002;         // HA 저가/고가 대비 손절 버퍼 (비율)
    int sl_lookback_candles = 1;
    TakeProfitMode tp_mode = TakeProfitMode::RATIO;
    double tp_ratio = 1.2;
    double tp_percent = 0.15;             // FIXED_PERCENT 모드 (%)

    int max_daily_trades = 50;
    double max_daily_loss = 100.0;
    int max_consecutive_losses = 5;
    double emergency_stop_loss = 500.0;   // 누적 손실 / 최대 낙폭 한도
    long long max_latency_ms = 1000;
};

struct OrderConfig {
    EntryOrderType entry_order_type = EntryOrderType::LIMIT;
    double limit_spread_percent = 0.01;   // %
    long long order_execution_timeout_ms = 60000;
    long long fill_poll_interval_ms = 1000;
    bool market_fallback_enabled = true;
    double fallback_max_slippage_pct = 0.03;  // %
    long long monitor_interval_ms = 5000;
    bool deferred_protection = true;      // 진입 캔들 마감 후 SL/TP 배치
    int close_retry_attempts = 3;
};

struct DeferredProtectionConfig {
    double price_offset_percent = 0.01;   // %
    long long check_interval_ms = 10000;
    long long processing_timeout_ms = 30000;
    int min_distance_ticks = 1;
    long long cleanup_after_ms = 24LL * 3600 * 1000;
};

struct ConnectionConfig {
    bool retry_enabled = true;
    long long retry_interval_ms = 30000;
    int max_retries = 0;                  // 0 = 무제한
    long long backoff_max_ms = 300000;
    long long connect_wait_ms = 15000;
    long long connect_poll_ms = 500;
    long long safe_mode_duration_ms = 300000;
    long long safe_mode_recheck_delay_ms = 1000;
    bool sync_after_reconnection = true;
    long long stale_feed_timeout_ms = 120000;
};

struct RetrySettings {
    int max_retries = 5;
    long long delay_ms = 10000;
    double backoff_multiplier = 1.2;

    RetrySettings() = default;
    RetrySettings(int retries, long long delay, double multiplier)
        : max_retries(retries), delay_ms(delay), backoff_multiplier(multiplier) {}
};

struct RetryConfig {
    RetrySettings defaults{5, 10000, 1.2};
    RetrySettings order_placement{3, 5000, 1.2};
    RetrySettings order_status{3, 2000, 1.2};
    RetrySettings order_cancellation{3, 2000, 1.2};
    RetrySettings market_data{5, 10000, 1.2};
    RetrySettings account{5, 10000, 1.2};
};

// 엔진 설정 (시작 시 1회 검증 후 불변)
struct EngineConfig {
    TradingMode mode;
    bool trading_enabled;

    ExchangeConfig exchange;
    IndicatorConfig indicators;
    SignalConfig signal;
    RiskConfig risk;
    OrderConfig orders;
    DeferredProtectionConfig deferred;
    ConnectionConfig connection;
    RetryConfig retry;

    long long health_check_interval_ms = 30000;
    int max_api_failures = 3;

    std::string log_dir = "logs";
    std::string log_level = "info";

    EngineConfig()
        : mode(TradingMode::TESTNET)
        , trading_enabled(true)
    {}
};

} // namespace engine
} // namespace triplersi
