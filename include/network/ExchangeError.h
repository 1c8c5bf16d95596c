#pragma once

#include <stdexcept>
#include <string>

#include "network/IHttpClient.h"

namespace triplersi {
namespace network {

// REST 호출 실패. transient 이면 재시도 대상
class ExchangeError : public std::runtime_error {
public:
    ExchangeError(const std::string& what, int http_status, int exchange_code, bool transient)
        : std::runtime_error(what)
        , http_status_(http_status)
        , exchange_code_(exchange_code)
        , transient_(transient)
    {}

    int httpStatus() const { return http_status_; }
    int exchangeCode() const { return exchange_code_; }
    bool isTransient() const { return transient_; }

    // 전송 계층 실패 (DNS, 연결, 타임아웃)
    static ExchangeError transport(const std::string& what) {
        return ExchangeError(what, 0, 0, true);
    }

    static ExchangeError fromResponse(const HttpResponse& response, const std::string& context) {
        const int code = response.exchangeErrorCode();
        const bool transient = response.status_code >= 500
            || response.isRateLimited()
            || response.isBlocked()
            || isTransientCode(code);
        return ExchangeError(
            context + " failed (HTTP " + std::to_string(response.status_code) +
                ", code " + std::to_string(code) + "): " + response.exchangeErrorMessage(),
            response.status_code, code, transient);
    }

    // -1000 UNKNOWN, -1001 DISCONNECTED, -1003 TOO_MANY_REQUESTS, -1006 UNEXPECTED_RESP,
    // -1007 TIMEOUT, -1008 SERVER_BUSY, -1021 INVALID_TIMESTAMP
    static bool isTransientCode(int code) {
        switch (code) {
            case -1000:
            case -1001:
            case -1003:
            case -1006:
            case -1007:
            case -1008:
            case -1021:
                return true;
            default:
                return false;
        }
    }

private:
    int http_status_;
    int exchange_code_;
    bool transient_;
};

} // namespace network
} // namespace triplersi
