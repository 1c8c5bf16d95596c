#pragma once

#include "network/IHttpClient.h"
#include "execution/RateLimiter.h"
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace triplersi {
namespace network {

// USDⓈ-M 선물 REST 클라이언트 (curl + HMAC 서명)
class BinanceHttpClient : public IHttpClient {
public:
    BinanceHttpClient(
        const std::string& api_key,
        const std::string& api_secret,
        const std::string& base_url,
        long long recv_window_ms = 5000,
        long long timeout_ms = 30000
    );
    ~BinanceHttpClient() override;

    BinanceHttpClient(const BinanceHttpClient&) = delete;
    BinanceHttpClient& operator=(const BinanceHttpClient&) = delete;

    HttpResponse get(
        const std::string& endpoint,
        const std::map<std::string, std::string>& query_params = {},
        bool signed_request = false
    ) override;

    HttpResponse post(
        const std::string& endpoint,
        const std::map<std::string, std::string>& params,
        bool signed_request = true
    ) override;

    HttpResponse del(
        const std::string& endpoint,
        const std::map<std::string, std::string>& query_params,
        bool signed_request = true
    ) override;

    std::shared_ptr<execution::RateLimiter> getRateLimiter() const { return rate_limiter_; }

private:
    std::string api_key_;
    std::string api_secret_;
    std::string base_url_;
    long long recv_window_ms_;
    long long timeout_ms_;
    CURL* curl_;
    std::mutex mutex_;
    std::shared_ptr<execution::RateLimiter> rate_limiter_;

    std::string buildPayload(
        const std::map<std::string, std::string>& params,
        bool signed_request
    ) const;

    HttpResponse send(
        const std::string& method,
        const std::string& endpoint,
        const std::map<std::string, std::string>& params,
        bool signed_request
    );

    HttpResponse performRequest(
        const std::string& method,
        const std::string& url,
        const std::string& body_data,
        const std::map<std::string, std::string>& headers
    );

    void applyRateLimitHeaders(const HttpResponse& response);

    static std::string groupForEndpoint(const std::string& method, const std::string& endpoint);
    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata);
};

} // namespace network
} // namespace triplersi
