#pragma once

#include <chrono>
#include <limits>
#include <string>
#include <vector>

namespace triplersi {

// 기본 타입 정의
using Timestamp = long long;  // epoch milliseconds
using Price = double;
using Quantity = double;

inline Timestamp nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

// 포지션 방향
enum class Direction {
    LONG,
    SHORT
};

// 주문 방향
enum class OrderSide {
    BUY,
    SELL
};

// 주문 타입
enum class OrderType {
    MARKET,
    LIMIT,
    STOP_MARKET
};

// 주문 상태
enum class OrderStatus {
    PENDING,
    PARTIALLY_FILLED,
    FILLED,
    CANCELLED,
    FAILED
};

// 트레이드 상태
enum class TradeStatus {
    OPENING,
    OPEN,
    CLOSING,
    CLOSED,
    FAILED
};

enum class ExitReason {
    NONE,
    STOP_LOSS,
    TAKE_PROFIT,
    MANUAL,
    EMERGENCY,
    ANOMALY,
    GHOST,
    ENTRY_FAILED
};

inline const char* toString(Direction d) {
    return d == Direction::LONG ? "LONG" : "SHORT";
}

inline const char* toString(OrderSide s) {
    return s == OrderSide::BUY ? "BUY" : "SELL";
}

inline const char* toString(OrderType t) {
    switch (t) {
        case OrderType::MARKET: return "MARKET";
        case OrderType::LIMIT: return "LIMIT";
        case OrderType::STOP_MARKET: return "STOP_MARKET";
    }
    return "UNKNOWN";
}

inline const char* toString(OrderStatus s) {
    switch (s) {
        case OrderStatus::PENDING: return "PENDING";
        case OrderStatus::PARTIALLY_FILLED: return "PARTIALLY_FILLED";
        case OrderStatus::FILLED: return "FILLED";
        case OrderStatus::CANCELLED: return "CANCELLED";
        case OrderStatus::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}

inline const char* toString(TradeStatus s) {
    switch (s) {
        case TradeStatus::OPENING: return "OPENING";
        case TradeStatus::OPEN: return "OPEN";
        case TradeStatus::CLOSING: return "CLOSING";
        case TradeStatus::CLOSED: return "CLOSED";
        case TradeStatus::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}

inline const char* toString(ExitReason r) {
    switch (r) {
        case ExitReason::NONE: return "NONE";
        case ExitReason::STOP_LOSS: return "STOP_LOSS";
        case ExitReason::TAKE_PROFIT: return "TAKE_PROFIT";
        case ExitReason::MANUAL: return "MANUAL";
        case ExitReason::EMERGENCY: return "EMERGENCY";
        case ExitReason::ANOMALY: return "ANOMALY";
        case ExitReason::GHOST: return "GHOST";
        case ExitReason::ENTRY_FAILED: return "ENTRY_FAILED";
    }
    return "UNKNOWN";
}

// 진입 주문 방향
inline OrderSide entrySide(Direction d) {
    return d == Direction::LONG ? OrderSide::BUY : OrderSide::SELL;
}

// 청산/보호 주문 방향
inline OrderSide exitSide(Direction d) {
    return d == Direction::LONG ? OrderSide::SELL : OrderSide::BUY;
}

inline bool isTerminal(TradeStatus s) {
    return s == TradeStatus::CLOSED || s == TradeStatus::FAILED;
}

// 거래소에서 더 이상 체결될 수 없는 주문
inline bool isFinal(OrderStatus s) {
    return s == OrderStatus::FILLED || s == OrderStatus::CANCELLED || s == OrderStatus::FAILED;
}

// 캔들 데이터
struct Candle {
    Timestamp open_time;
    Timestamp close_time;
    Price open;
    Price high;
    Price low;
    Price close;
    Quantity volume;
    bool closed;

    Candle()
        : open_time(0), close_time(0), open(0), high(0), low(0)
        , close(0), volume(0), closed(false)
    {}

    Candle(Timestamp t, Price o, Price h, Price l, Price c, Quantity v)
        : open_time(t), close_time(0), open(o), high(h), low(l)
        , close(c), volume(v), closed(true)
    {}
};

// 마감 캔들 기준 지표 스냅샷 (값이 없으면 NaN)
struct IndicatorSnapshot {
    std::vector<double> rsi;   // indicators.rsi_periods 순서 (기본 5/14/21)
    double rsi_mtf = std::numeric_limits<double>::quiet_NaN();
    double ha_open = std::numeric_limits<double>::quiet_NaN();
    double ha_high = std::numeric_limits<double>::quiet_NaN();
    double ha_low = std::numeric_limits<double>::quiet_NaN();
    double ha_close = std::numeric_limits<double>::quiet_NaN();
    double ema = std::numeric_limits<double>::quiet_NaN();
    double ema_slope = std::numeric_limits<double>::quiet_NaN();
    double close = std::numeric_limits<double>::quiet_NaN();

    // 손절 계산용 (최근 N개 HA 저가 최소 / 고가 최대)
    double ha_lowest_low = std::numeric_limits<double>::quiet_NaN();
    double ha_highest_high = std::numeric_limits<double>::quiet_NaN();

    Timestamp candle_open_time = 0;
    Timestamp candle_close_time = 0;
};

struct Signal {
    Direction direction = Direction::LONG;
    Timestamp detected_at = 0;   // latch 시각
    Timestamp confirmed_at = 0;
    IndicatorSnapshot indicators;
    double confidence = 0.0;
    std::vector<std::string> reasons;
};

struct PositionSize {
    Quantity quantity = 0.0;
    Price entry_price_estimate = 0.0;
    Price stop_loss = 0.0;
    Price take_profit = 0.0;
    double risk_amount = 0.0;
    double notional = 0.0;
};

struct Order {
    std::string exchange_order_id;
    std::string client_order_id;
    OrderSide side = OrderSide::BUY;
    OrderType type = OrderType::MARKET;
    Quantity quantity = 0.0;
    Price price = 0.0;
    Price stop_price = 0.0;
    OrderStatus status = OrderStatus::PENDING;
    Quantity filled_qty = 0.0;
    Price avg_fill_price = 0.0;
    Timestamp update_time = 0;
    bool reduce_only = false;
};

struct Trade {
    std::string id;
    std::string symbol;
    Direction direction = Direction::LONG;
    TradeStatus status = TradeStatus::OPENING;
    Quantity quantity = 0.0;
    Price entry_price = 0.0;
    Price stop_loss = 0.0;
    Price take_profit = 0.0;
    Order entry_order;
    Order sl_order;
    Order tp_order;
    Price exit_price = 0.0;
    double pnl = 0.0;
    ExitReason exit_reason = ExitReason::NONE;
    double confidence = 0.0;

    bool degraded_fill = false;        // 시장가 폴백으로 체결
    bool deferred_protection = false;  // 진입 캔들 마감 후 SL/TP 배치
    bool protection_placed = false;
    bool entry_unresolved = false;     // 타임아웃 후 진입 주문 취소 미확인
    bool exit_filled = false;          // 청산 체결 확인, CLOSED 직전

    Timestamp created_at = 0;
    Timestamp filled_at = 0;
    Timestamp closed_at = 0;
};

// 심볼 거래 규칙
struct SymbolInfo {
    std::string symbol;
    int price_precision = 2;
    int quantity_precision = 3;
    double tick_size = 0.01;
    double step_size = 0.001;
    double min_qty = 0.001;
    double min_notional = 5.0;
};

// 거래소 포지션 스냅샷
struct ExchangePosition {
    std::string symbol;
    double position_amt = 0.0;   // 부호 있는 수량 (음수 = SHORT)
    double entry_price = 0.0;
    double unrealized_pnl = 0.0;

    Direction direction() const {
        return position_amt >= 0.0 ? Direction::LONG : Direction::SHORT;
    }
};

} // namespace triplersi
