#pragma once
// ===================================================================
// 심볼 거래 규칙(틱/스텝) 기준 가격·수량 정규화 헬퍼
//
// 선물 거래소는 PRICE_FILTER.tickSize / LOT_SIZE.stepSize 에 맞지 않는
// 가격·수량을 거부한다 (-1111 Precision is over the maximum).
// ===================================================================

#include <cmath>
#include <cstdio>
#include <string>

namespace triplersi {
namespace common {

// 부동소수 오차 보정용
constexpr double kTickEpsilon = 1e-9;

inline double roundToTick(double price, double tick) {
    if (tick <= 0.0) return price;
    return std::round(price / tick) * tick;
}

// 매수 보호 가격(SHORT 손절)은 올림
inline double roundUpToTick(double price, double tick) {
    if (tick <= 0.0) return price;
    return std::ceil(price / tick - kTickEpsilon) * tick;
}

// 매도 보호 가격(LONG 손절)은 내림
inline double roundDownToTick(double price, double tick) {
    if (tick <= 0.0) return price;
    return std::floor(price / tick + kTickEpsilon) * tick;
}

// 수량은 항상 스텝 단위로 내림 (잔고 초과 주문 방지)
inline double floorToStep(double quantity, double step) {
    if (step <= 0.0) return quantity;
    return std::floor(quantity / step + kTickEpsilon) * step;
}

// 주문 전송용 문자열 (precision 자리 고정)
inline std::string formatDecimal(double value, int precision) {
    if (precision < 0) precision = 0;
    if (precision > 12) precision = 12;
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", precision, value);
    return std::string(buf);
}

// 스텝 값(0.1, 0.001 ...)의 소수 자릿수
inline int precisionFromStep(double step) {
    if (step <= 0.0) return 0;
    int decimals = 0;
    double s = step;
    while (decimals < 12 && std::fabs(s - std::round(s)) > kTickEpsilon) {
        s *= 10.0;
        decimals++;
    }
    return decimals;
}

} // namespace common
} // namespace triplersi
