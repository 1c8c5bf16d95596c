#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace triplersi {
namespace common {

// 거래소 응답은 숫자를 문자열("123.45")로 내려줌
inline double parseJsonNumber(const nlohmann::json& json, const char* key, double fallback = 0.0) {
    if (!json.is_object() || !json.contains(key) || json[key].is_null()) {
        return fallback;
    }
    const auto& value = json[key];
    if (value.is_string()) {
        const auto text = value.get<std::string>();
        if (text.empty()) {
            return fallback;
        }
        return std::stod(text);
    }
    if (value.is_number()) {
        return value.get<double>();
    }
    return fallback;
}

// 주문 ID 는 정수로 내려오지만 내부에서는 문자열로 다룸
inline std::string parseJsonId(const nlohmann::json& json, const char* key) {
    if (!json.is_object() || !json.contains(key) || json[key].is_null()) {
        return "";
    }
    const auto& value = json[key];
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number_integer()) {
        return std::to_string(value.get<long long>());
    }
    return value.dump();
}

} // namespace common
} // namespace triplersi
