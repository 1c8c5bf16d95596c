#pragma once

#include <vector>
#include "common/Types.h"

namespace triplersi {
namespace analytics {

// Heikin-Ashi 캔들
struct HeikinAshiCandle {
    double open;
    double high;
    double low;
    double close;

    HeikinAshiCandle() : open(0), high(0), low(0), close(0) {}

    bool isGreen() const { return close > open; }
    bool isRed() const { return close < open; }
};

class TechnicalIndicators {
public:
    // RSI (Wilder smoothing). 데이터 부족 시 NaN
    static double calculateRSI(const std::vector<double>& prices, int period = 14);

    // EMA (초기값 = 첫 period 개 SMA). 결과[i] 는 prices[i + period - 1] 시점
    static std::vector<double> calculateEMAVector(const std::vector<double>& prices, int period);

    // HA_close = (O+H+L+C)/4, HA_open = (이전 HA_open + 이전 HA_close)/2
    static std::vector<HeikinAshiCandle> calculateHeikinAshi(const std::vector<Candle>& candles);

    // Double HA 계산용: HA 결과를 다시 캔들로
    static std::vector<Candle> toCandles(
        const std::vector<HeikinAshiCandle>& ha,
        const std::vector<Candle>& source
    );

    // 상위 타임프레임 종가 (factor 개씩 묶어 마지막 종가). 마지막 묶음은 미완성이어도 포함
    static std::vector<double> resampleCloses(const std::vector<double>& closes, int factor);
};

} // namespace analytics
} // namespace triplersi
