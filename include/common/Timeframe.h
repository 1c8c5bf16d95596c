#pragma once

#include <map>
#include <string>

namespace triplersi {
namespace common {

// 캔들 주기 → 초
inline const std::map<std::string, long long>& timeframeTable() {
    static const std::map<std::string, long long> table = {
        {"1m", 60},
        {"3m", 180},
        {"5m", 300},
        {"15m", 900},
        {"30m", 1800},
        {"1h", 3600},
        {"2h", 7200},
        {"4h", 14400},
        {"6h", 21600},
        {"8h", 28800},
        {"12h", 43200},
        {"1d", 86400},
        {"3d", 259200},
        {"1w", 604800},
        {"1M", 2592000}
    };
    return table;
}

inline bool isKnownTimeframe(const std::string& timeframe) {
    return timeframeTable().count(timeframe) > 0;
}

// 알 수 없는 주기는 5분으로 간주
inline long long timeframeToSeconds(const std::string& timeframe) {
    const auto& table = timeframeTable();
    auto it = table.find(timeframe);
    return it != table.end() ? it->second : 300;
}

} // namespace common
} // namespace triplersi
