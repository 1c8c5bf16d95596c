#include "network/BinanceHttpClient.h"
#include "network/ExchangeError.h"
#include "network/RequestSigner.h"
#include "common/Logger.h"
#include "common/Types.h"
#include <algorithm>
#include <cctype>
#include <set>

namespace triplersi {
namespace network {
namespace {
bool isSensitiveKey(const std::string& key) {
    static const std::set<std::string> kKeys = {
        "signature", "x-mbx-apikey", "api_key", "api_secret", "listenkey"
    };
    std::string lower = key;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return kKeys.find(lower) != kKeys.end();
}

// 쿼리 문자열의 민감 값 마스킹
std::string sanitizeForLog(const std::string& query) {
    std::string out;
    size_t pos = 0;
    while (pos <= query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();
        const std::string pair = query.substr(pos, amp - pos);
        const size_t eq = pair.find('=');
        if (!out.empty()) out += "&";
        if (eq != std::string::npos && isSensitiveKey(pair.substr(0, eq))) {
            out += pair.substr(0, eq) + "=***";
        } else {
            out += pair;
        }
        pos = amp + 1;
    }
    return out;
}

std::string headerValue(const HttpResponse& response, const std::string& name) {
    for (const auto& [key, value] : response.headers) {
        if (key.size() != name.size()) continue;
        bool same = std::equal(key.begin(), key.end(), name.begin(), [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
        });
        if (same) return value;
    }
    return "";
}
} // namespace

BinanceHttpClient::BinanceHttpClient(
    const std::string& api_key,
    const std::string& api_secret,
    const std::string& base_url,
    long long recv_window_ms,
    long long timeout_ms
)
    : api_key_(api_key)
    , api_secret_(api_secret)
    , base_url_(base_url)
    , recv_window_ms_(recv_window_ms)
    , timeout_ms_(timeout_ms)
    , rate_limiter_(std::make_shared<execution::RateLimiter>())
{
    curl_global_init(CURL_GLOBAL_ALL);
    curl_ = curl_easy_init();

    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL");
    }
}

BinanceHttpClient::~BinanceHttpClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
    curl_global_cleanup();
}

HttpResponse BinanceHttpClient::get(
    const std::string& endpoint,
    const std::map<std::string, std::string>& query_params,
    bool signed_request
) {
    return send("GET", endpoint, query_params, signed_request);
}

HttpResponse BinanceHttpClient::post(
    const std::string& endpoint,
    const std::map<std::string, std::string>& params,
    bool signed_request
) {
    return send("POST", endpoint, params, signed_request);
}

HttpResponse BinanceHttpClient::del(
    const std::string& endpoint,
    const std::map<std::string, std::string>& query_params,
    bool signed_request
) {
    return send("DELETE", endpoint, query_params, signed_request);
}

std::string BinanceHttpClient::buildPayload(
    const std::map<std::string, std::string>& params,
    bool signed_request
) const {
    if (!signed_request) {
        return RequestSigner::buildQueryString(params);
    }
    if (api_secret_.empty()) {
        throw ExchangeError("Signed request without API secret", 0, 0, false);
    }
    return RequestSigner::signQuery(params, api_secret_, nowMs(), recv_window_ms_);
}

HttpResponse BinanceHttpClient::send(
    const std::string& method,
    const std::string& endpoint,
    const std::map<std::string, std::string>& params,
    bool signed_request
) {
    rate_limiter_->acquire(groupForEndpoint(method, endpoint));

    const std::string payload = buildPayload(params, signed_request);

    std::map<std::string, std::string> headers;
    if (!api_key_.empty()) {
        headers["X-MBX-APIKEY"] = api_key_;
    }

    std::string url = base_url_ + endpoint;
    std::string body;
    if (method == "POST") {
        headers["Content-Type"] = "application/x-www-form-urlencoded";
        body = payload;
    } else if (!payload.empty()) {
        url += "?" + payload;
    }

    LOG_DEBUG("{} {} {}", method, endpoint, sanitizeForLog(payload));

    auto response = performRequest(method, url, body, headers);
    applyRateLimitHeaders(response);

    if (!response.isSuccess()) {
        LOG_WARN("{} {} -> HTTP {} {}", method, endpoint, response.status_code, response.body);
    }
    return response;
}

void BinanceHttpClient::applyRateLimitHeaders(const HttpResponse& response) {
    const std::string used_weight = headerValue(response, "X-MBX-USED-WEIGHT-1M");
    if (!used_weight.empty()) {
        try {
            rate_limiter_->updateUsedWeight(std::stoi(used_weight));
        } catch (const std::exception& e) {
            LOG_WARN("Invalid X-MBX-USED-WEIGHT-1M header '{}': {}", used_weight, e.what());
        }
    }

    if (response.isRateLimited() || response.isBlocked()) {
        int retry_after = 0;
        const std::string retry_header = headerValue(response, "Retry-After");
        if (!retry_header.empty()) {
            try {
                retry_after = std::stoi(retry_header);
            } catch (const std::exception&) {
                retry_after = 0;
            }
        }
        rate_limiter_->handleRateLimitError(response.status_code, retry_after);
    }
}

std::string BinanceHttpClient::groupForEndpoint(const std::string& method, const std::string& endpoint) {
    if (endpoint.find("/order") != std::string::npos ||
        endpoint.find("/openOrders") != std::string::npos ||
        endpoint.find("/allOpenOrders") != std::string::npos) {
        return "order";
    }
    if (endpoint.find("/balance") != std::string::npos ||
        endpoint.find("/account") != std::string::npos ||
        endpoint.find("/positionRisk") != std::string::npos) {
        return "account";
    }
    if (method == "GET") {
        return "market_data";
    }
    return "default";
}

HttpResponse BinanceHttpClient::performRequest(
    const std::string& method,
    const std::string& url,
    const std::string& body_data,
    const std::map<std::string, std::string>& headers
) {
    std::lock_guard<std::mutex> lock(mutex_);

    HttpResponse response;
    std::string response_body;
    std::map<std::string, std::string> response_headers;

    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl_, CURLOPT_HEADERDATA, &response_headers);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

    if (method == "POST") {
        curl_easy_setopt(curl_, CURLOPT_POST, 1L);
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body_data.c_str());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body_data.size()));
    } else if (method == "DELETE") {
        curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, "DELETE");
    }

    struct curl_slist* header_list = nullptr;
    for (const auto& [key, value] : headers) {
        std::string header_line = key + ": " + value;
        header_list = curl_slist_append(header_list, header_line.c_str());
    }
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, header_list);

    CURLcode res = curl_easy_perform(curl_);

    if (res != CURLE_OK) {
        curl_slist_free_all(header_list);
        throw ExchangeError::transport("CURL error: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);

    curl_slist_free_all(header_list);

    response.status_code = static_cast<int>(http_code);
    response.body = response_body;
    response.headers = response_headers;

    return response;
}

size_t BinanceHttpClient::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    std::string* response_body = static_cast<std::string*>(userp);
    response_body->append(static_cast<char*>(contents), total_size);
    return total_size;
}

size_t BinanceHttpClient::headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total_size = size * nitems;
    std::string header_line(buffer, total_size);

    size_t colon_pos = header_line.find(':');
    if (colon_pos != std::string::npos) {
        std::string key = header_line.substr(0, colon_pos);
        std::string value = header_line.substr(colon_pos + 1);

        value.erase(0, value.find_first_not_of(" \t\r\n"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);

        auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
        (*headers)[key] = value;
    }

    return total_size;
}

} // namespace network
} // namespace triplersi
