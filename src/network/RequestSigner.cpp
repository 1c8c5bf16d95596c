#include "network/RequestSigner.h"
#include <openssl/hmac.h>
#include <openssl/evp.h>
#include <sstream>
#include <iomanip>
#include <random>
#include <cctype>
#include <cstdint>

namespace triplersi {
namespace network {

std::string RequestSigner::hmacSha256Hex(const std::string& secret, const std::string& payload) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    HMAC(EVP_sha256(),
         secret.c_str(), static_cast<int>(secret.length()),
         reinterpret_cast<const unsigned char*>(payload.c_str()), payload.length(),
         digest, &digest_len);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < digest_len; ++i) {
        oss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str();
}

std::string RequestSigner::urlEncode(const std::string& value) {
    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setfill('0');
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << static_cast<char>(c);
        } else {
            oss << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return oss.str();
}

std::string RequestSigner::buildQueryString(const std::map<std::string, std::string>& params) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& [key, value] : params) {
        if (!first) oss << "&";
        oss << key << "=" << urlEncode(value);
        first = false;
    }
    return oss.str();
}

std::string RequestSigner::signQuery(
    std::map<std::string, std::string> params,
    const std::string& secret,
    long long timestamp_ms,
    long long recv_window_ms
) {
    params["timestamp"] = std::to_string(timestamp_ms);
    if (recv_window_ms > 0) {
        params["recvWindow"] = std::to_string(recv_window_ms);
    }

    // 서명 대상은 전송되는 쿼리 문자열과 바이트 단위로 같아야 함
    const std::string query = buildQueryString(params);
    return query + "&signature=" + hmacSha256Hex(secret, query);
}

std::string RequestSigner::generateClientOrderId() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    uint64_t part1 = dis(gen);
    uint64_t part2 = dis(gen);

    oss << std::setw(8) << (part1 >> 32)
        << "-" << std::setw(4) << ((part1 >> 16) & 0xFFFF)
        << "-4" << std::setw(3) << (part1 & 0xFFF)
        << "-" << std::setw(4) << (((part2 >> 48) & 0x3FFF) | 0x8000)
        << "-" << std::setw(12) << (part2 & 0xFFFFFFFFFFFF);

    return oss.str();
}

} // namespace network
} // namespace triplersi
