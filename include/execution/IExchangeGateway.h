#pragma once

#include <string>
#include <vector>

#include "common/Result.h"
#include "common/Types.h"

namespace triplersi {
namespace execution {

// 거래소 REST 경계. 모든 I/O 실패는 Result 로 분류되어 반환됨
class IExchangeGateway {
public:
    virtual ~IExchangeGateway() = default;

    virtual Result<double> getBalance() = 0;
    virtual Result<SymbolInfo> getSymbolInfo() = 0;
    virtual Result<double> getCurrentPrice() = 0;
    virtual Result<std::vector<Candle>> getKlines(int limit) = 0;

    virtual Result<Order> placeMarketOrder(OrderSide side, double quantity, bool reduce_only) = 0;
    virtual Result<Order> placeLimitOrder(OrderSide side, double quantity, double price, bool reduce_only) = 0;
    virtual Result<Order> placeStopMarketOrder(OrderSide side, double quantity, double stop_price) = 0;

    virtual Result<Order> getOrder(const std::string& order_id) = 0;
    // 이미 체결/취소된 주문이면 성공으로 간주
    virtual Status cancelOrder(const std::string& order_id) = 0;
    virtual Result<std::vector<Order>> getOpenOrders() = 0;

    // positionAmt != 0 인 포지션만
    virtual Result<std::vector<ExchangePosition>> getPositions() = 0;

    // 서버 왕복 지연 (ms)
    virtual Result<long long> ping() = 0;
};

} // namespace execution
} // namespace triplersi
