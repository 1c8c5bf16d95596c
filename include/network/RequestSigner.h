#pragma once

#include <map>
#include <string>

namespace triplersi {
namespace network {

// USER_DATA / TRADE 엔드포인트 서명 (HMAC-SHA256, hex)
class RequestSigner {
public:
    static std::string hmacSha256Hex(const std::string& secret, const std::string& payload);

    // key=value&... (키 정렬, 값 percent-encode)
    static std::string buildQueryString(const std::map<std::string, std::string>& params);

    // timestamp / recvWindow 추가 후 signature 를 붙인 쿼리 문자열
    static std::string signQuery(
        std::map<std::string, std::string> params,
        const std::string& secret,
        long long timestamp_ms,
        long long recv_window_ms
    );

    // newClientOrderId 용 UUID v4
    static std::string generateClientOrderId();

    static std::string urlEncode(const std::string& value);
};

} // namespace network
} // namespace triplersi
