#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "engine/EngineConfig.h"
#include "execution/IExchangeGateway.h"
#include "execution/RetryPolicy.h"
#include "network/IHttpClient.h"

namespace triplersi {
namespace execution {

// USDⓈ-M 선물 REST 게이트웨이 (단일 심볼)
class ExchangeGateway : public IExchangeGateway {
public:
    ExchangeGateway(
        std::shared_ptr<network::IHttpClient> http_client,
        const engine::EngineConfig& config,
        RetryPolicy::SleepFunction sleeper = RetryPolicy::SleepFunction()
    );

    Result<double> getBalance() override;
    Result<SymbolInfo> getSymbolInfo() override;
    Result<double> getCurrentPrice() override;
    Result<std::vector<Candle>> getKlines(int limit) override;

    Result<Order> placeMarketOrder(OrderSide side, double quantity, bool reduce_only) override;
    Result<Order> placeLimitOrder(OrderSide side, double quantity, double price, bool reduce_only) override;
    Result<Order> placeStopMarketOrder(OrderSide side, double quantity, double stop_price) override;

    Result<Order> getOrder(const std::string& order_id) override;
    Status cancelOrder(const std::string& order_id) override;
    Result<std::vector<Order>> getOpenOrders() override;
    Result<std::vector<ExchangePosition>> getPositions() override;
    Result<long long> ping() override;

    // 심볼 규칙에 맞춘 주문 전송 문자열
    std::string formatPrice(double price);
    std::string formatQuantity(double quantity);

    const RetryPolicy& getRetryPolicy() const { return retry_policy_; }

    static Order parseOrder(const nlohmann::json& j);
    static SymbolInfo parseSymbolInfo(const nlohmann::json& exchange_info, const std::string& symbol);

private:
    std::shared_ptr<network::IHttpClient> http_client_;
    std::string symbol_;
    std::string balance_asset_;
    std::string timeframe_;
    RetryPolicy retry_policy_;

    std::mutex symbol_mutex_;
    std::optional<SymbolInfo> symbol_info_;

    Result<Order> placeOrder(std::map<std::string, std::string> params, const std::string& description);

    // 예외 → Result 분류 (재시도 소진 = TRANSIENT, 거부 = VALIDATION)
    template<typename T, typename Fn>
    Result<T> guarded(const std::string& name, Fn&& fn);

    nlohmann::json expectJson(const network::HttpResponse& response, const std::string& context) const;
};

} // namespace execution
} // namespace triplersi
