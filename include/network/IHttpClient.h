#pragma once

#include <string>
#include <map>
#include <nlohmann/json.hpp>

namespace triplersi {
namespace network {

struct HttpResponse {
    int status_code = 0;
    std::string body;
    std::map<std::string, std::string> headers;

    bool isSuccess() const { return status_code >= 200 && status_code < 300; }
    bool isRateLimited() const { return status_code == 429; }
    bool isBlocked() const { return status_code == 418; }

    nlohmann::json json() const {
        return nlohmann::json::parse(body);
    }

    // {"code":-2011,"msg":"Unknown order sent."} 형태의 오류 코드 (없으면 0)
    int exchangeErrorCode() const {
        auto j = nlohmann::json::parse(body, nullptr, false);
        if (j.is_object() && j.contains("code") && j["code"].is_number_integer()) {
            return j["code"].get<int>();
        }
        return 0;
    }

    std::string exchangeErrorMessage() const {
        auto j = nlohmann::json::parse(body, nullptr, false);
        if (j.is_object() && j.contains("msg") && j["msg"].is_string()) {
            return j["msg"].get<std::string>();
        }
        return body;
    }
};

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    // GET 요청 (signed = true 이면 timestamp/signature 추가)
    virtual HttpResponse get(
        const std::string& endpoint,
        const std::map<std::string, std::string>& query_params = {},
        bool signed_request = false
    ) = 0;

    // POST 요청 (form body)
    virtual HttpResponse post(
        const std::string& endpoint,
        const std::map<std::string, std::string>& params,
        bool signed_request = true
    ) = 0;

    // DELETE 요청
    virtual HttpResponse del(
        const std::string& endpoint,
        const std::map<std::string, std::string>& query_params,
        bool signed_request = true
    ) = 0;
};

} // namespace network
} // namespace triplersi
