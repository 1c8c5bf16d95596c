#include "execution/ExchangeGateway.h"

#include "common/JsonUtils.h"
#include "common/Logger.h"
#include "common/TickSizeHelper.h"
#include "execution/OrderStateMapper.h"
#include "network/ExchangeError.h"
#include "network/RequestSigner.h"

#include <chrono>

namespace triplersi {
namespace execution {

namespace {
// -2011: Unknown order sent / -2013: Order does not exist
bool isUnknownOrderCode(int code) {
    return code == -2011 || code == -2013;
}

OrderType parseOrderType(const std::string& type) {
    if (type == "LIMIT") return OrderType::LIMIT;
    if (type == "STOP_MARKET" || type == "STOP") return OrderType::STOP_MARKET;
    return OrderType::MARKET;
}
} // namespace

ExchangeGateway::ExchangeGateway(
    std::shared_ptr<network::IHttpClient> http_client,
    const engine::EngineConfig& config,
    RetryPolicy::SleepFunction sleeper
)
    : http_client_(std::move(http_client))
    , symbol_(config.exchange.symbol)
    , balance_asset_(config.exchange.balance_asset)
    , timeframe_(config.exchange.timeframe)
    , retry_policy_(config.retry, std::move(sleeper))
{
}

template<typename T, typename Fn>
Result<T> ExchangeGateway::guarded(const std::string& name, Fn&& fn) {
    try {
        return Result<T>::ok(fn());
    } catch (const network::ExchangeError& e) {
        if (e.isTransient()) {
            return Result<T>::fail(Error::transient(std::to_string(e.exchangeCode()), name + ": " + e.what()));
        }
        LOG_ERROR("{} rejected: {}", name, e.what());
        return Result<T>::fail(Error::validation(std::to_string(e.exchangeCode()), name + ": " + e.what()));
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("{} returned malformed payload: {}", name, e.what());
        return Result<T>::fail(Error::transient("malformed_response", name + ": " + e.what()));
    } catch (const std::invalid_argument& e) {
        LOG_ERROR("{} returned malformed number: {}", name, e.what());
        return Result<T>::fail(Error::transient("malformed_response", name + ": " + e.what()));
    }
}

nlohmann::json ExchangeGateway::expectJson(
    const network::HttpResponse& response,
    const std::string& context
) const {
    if (!response.isSuccess()) {
        throw network::ExchangeError::fromResponse(response, context);
    }
    return response.json();
}

Result<double> ExchangeGateway::getBalance() {
    return guarded<double>("getBalance", [&]() {
        return retry_policy_.execute(OperationType::ACCOUNT, "getBalance", [&](int) {
            const auto j = expectJson(http_client_->get("/fapi/v2/balance", {}, true), "getBalance");
            for (const auto& entry : j) {
                if (entry.value("asset", "") == balance_asset_) {
                    return common::parseJsonNumber(entry, "availableBalance");
                }
            }
            LOG_WARN("Asset {} not found in balance response", balance_asset_);
            return 0.0;
        });
    });
}

SymbolInfo ExchangeGateway::parseSymbolInfo(const nlohmann::json& exchange_info, const std::string& symbol) {
    if (!exchange_info.contains("symbols") || !exchange_info["symbols"].is_array()) {
        throw network::ExchangeError("exchangeInfo without symbols", 200, 0, false);
    }

    for (const auto& s : exchange_info["symbols"]) {
        if (s.value("symbol", "") != symbol) {
            continue;
        }

        SymbolInfo info;
        info.symbol = symbol;
        info.price_precision = s.value("pricePrecision", info.price_precision);
        info.quantity_precision = s.value("quantityPrecision", info.quantity_precision);

        if (s.contains("filters") && s["filters"].is_array()) {
            for (const auto& f : s["filters"]) {
                const std::string type = f.value("filterType", "");
                if (type == "PRICE_FILTER") {
                    info.tick_size = common::parseJsonNumber(f, "tickSize", info.tick_size);
                } else if (type == "LOT_SIZE") {
                    info.step_size = common::parseJsonNumber(f, "stepSize", info.step_size);
                    info.min_qty = common::parseJsonNumber(f, "minQty", info.min_qty);
                } else if (type == "MIN_NOTIONAL") {
                    info.min_notional = common::parseJsonNumber(f, "notional", info.min_notional);
                }
            }
        }
        return info;
    }

    throw network::ExchangeError("Symbol " + symbol + " not listed", 200, 0, false);
}

Result<SymbolInfo> ExchangeGateway::getSymbolInfo() {
    {
        std::lock_guard<std::mutex> lock(symbol_mutex_);
        if (symbol_info_) {
            return Result<SymbolInfo>::ok(*symbol_info_);
        }
    }

    auto result = guarded<SymbolInfo>("getSymbolInfo", [&]() {
        return retry_policy_.execute(OperationType::MARKET_DATA, "getSymbolInfo", [&](int) {
            const auto j = expectJson(http_client_->get("/fapi/v1/exchangeInfo"), "exchangeInfo");
            return parseSymbolInfo(j, symbol_);
        });
    });

    if (result) {
        const auto& info = result.value();
        LOG_INFO("Symbol {}: tick {} step {} minQty {} minNotional {} (precision p{} q{})",
                 info.symbol, info.tick_size, info.step_size, info.min_qty, info.min_notional,
                 info.price_precision, info.quantity_precision);
        std::lock_guard<std::mutex> lock(symbol_mutex_);
        symbol_info_ = info;
    }
    return result;
}

Result<double> ExchangeGateway::getCurrentPrice() {
    return guarded<double>("getCurrentPrice", [&]() {
        return retry_policy_.execute(OperationType::MARKET_DATA, "getCurrentPrice", [&](int) {
            const auto j = expectJson(
                http_client_->get("/fapi/v1/ticker/price", {{"symbol", symbol_}}), "ticker");
            const double price = common::parseJsonNumber(j, "price");
            if (price <= 0.0) {
                throw network::ExchangeError("ticker returned non-positive price", 200, 0, true);
            }
            return price;
        });
    });
}

Result<std::vector<Candle>> ExchangeGateway::getKlines(int limit) {
    return guarded<std::vector<Candle>>("getKlines", [&]() {
        return retry_policy_.execute(OperationType::MARKET_DATA, "getKlines", [&](int) {
            const auto j = expectJson(http_client_->get("/fapi/v1/klines", {
                {"symbol", symbol_},
                {"interval", timeframe_},
                {"limit", std::to_string(limit)}
            }), "klines");

            const Timestamp now = nowMs();
            std::vector<Candle> candles;
            candles.reserve(j.size());
            for (const auto& row : j) {
                if (!row.is_array() || row.size() < 7) {
                    continue;
                }
                Candle c;
                c.open_time = row[0].get<long long>();
                c.open = std::stod(row[1].get<std::string>());
                c.high = std::stod(row[2].get<std::string>());
                c.low = std::stod(row[3].get<std::string>());
                c.close = std::stod(row[4].get<std::string>());
                c.volume = std::stod(row[5].get<std::string>());
                c.close_time = row[6].get<long long>();
                c.closed = c.close_time < now;
                candles.push_back(c);
            }
            return candles;
        });
    });
}

Order ExchangeGateway::parseOrder(const nlohmann::json& j) {
    Order order;
    order.exchange_order_id = common::parseJsonId(j, "orderId");
    order.client_order_id = j.value("clientOrderId", "");
    order.side = (j.value("side", "BUY") == "SELL") ? OrderSide::SELL : OrderSide::BUY;
    order.type = parseOrderType(j.value("origType", j.value("type", "MARKET")));
    order.quantity = common::parseJsonNumber(j, "origQty");
    order.price = common::parseJsonNumber(j, "price");
    order.stop_price = common::parseJsonNumber(j, "stopPrice");
    order.avg_fill_price = common::parseJsonNumber(j, "avgPrice");
    order.reduce_only = j.value("reduceOnly", false);
    order.update_time = j.value("updateTime", 0LL);

    const auto mapped = OrderStateMapper::map(
        j.value("status", "NEW"),
        common::parseJsonNumber(j, "executedQty"),
        order.quantity
    );
    order.status = mapped.status;
    order.filled_qty = mapped.filled_qty;
    return order;
}

Result<Order> ExchangeGateway::placeOrder(
    std::map<std::string, std::string> params,
    const std::string& description
) {
    params["symbol"] = symbol_;
    params["newOrderRespType"] = "RESULT";
    // 재시도 중에도 같은 clientOrderId 를 유지해서 중복 주문을 막음
    const std::string client_id = network::RequestSigner::generateClientOrderId();
    params["newClientOrderId"] = client_id;

    LOG_INFO("Submitting order: {} (clientOrderId={})", description, client_id);

    auto result = guarded<Order>(description, [&]() {
        return retry_policy_.execute(OperationType::ORDER_PLACEMENT, description, [&](int attempt) {
            if (attempt > 1) {
                // 이전 시도가 응답 없이 접수되었는지 먼저 확인
                auto lookup = http_client_->get("/fapi/v1/order", {
                    {"symbol", symbol_},
                    {"origClientOrderId", client_id}
                }, true);
                if (lookup.isSuccess()) {
                    LOG_WARN("Order {} already accepted by exchange on previous attempt", client_id);
                    return parseOrder(lookup.json());
                }
                if (!isUnknownOrderCode(lookup.exchangeErrorCode())) {
                    throw network::ExchangeError::fromResponse(lookup, "order lookup");
                }
            }
            const auto j = expectJson(http_client_->post("/fapi/v1/order", params, true), description);
            return parseOrder(j);
        });
    });

    if (result) {
        LOG_INFO("Order accepted: {} id={} status={}", description,
                 result.value().exchange_order_id, toString(result.value().status));
    }
    return result;
}

Result<Order> ExchangeGateway::placeMarketOrder(OrderSide side, double quantity, bool reduce_only) {
    std::map<std::string, std::string> params{
        {"side", toString(side)},
        {"type", "MARKET"},
        {"quantity", formatQuantity(quantity)}
    };
    if (reduce_only) {
        params["reduceOnly"] = "true";
    }
    return placeOrder(params, std::string("MARKET ") + toString(side) + " " + params["quantity"]);
}

Result<Order> ExchangeGateway::placeLimitOrder(OrderSide side, double quantity, double price, bool reduce_only) {
    std::map<std::string, std::string> params{
        {"side", toString(side)},
        {"type", "LIMIT"},
        {"timeInForce", "GTC"},
        {"quantity", formatQuantity(quantity)},
        {"price", formatPrice(price)}
    };
    if (reduce_only) {
        params["reduceOnly"] = "true";
    }
    return placeOrder(params, std::string("LIMIT ") + toString(side) + " " +
                      params["quantity"] + " @ " + params["price"]);
}

Result<Order> ExchangeGateway::placeStopMarketOrder(OrderSide side, double quantity, double stop_price) {
    std::map<std::string, std::string> params{
        {"side", toString(side)},
        {"type", "STOP_MARKET"},
        {"quantity", formatQuantity(quantity)},
        {"stopPrice", formatPrice(stop_price)},
        {"reduceOnly", "true"},
        {"workingType", "MARK_PRICE"}
    };
    return placeOrder(params, std::string("STOP_MARKET ") + toString(side) + " " +
                      params["quantity"] + " stop " + params["stopPrice"]);
}

Result<Order> ExchangeGateway::getOrder(const std::string& order_id) {
    return guarded<Order>("getOrder", [&]() {
        return retry_policy_.execute(OperationType::ORDER_STATUS, "getOrder", [&](int) {
            const auto j = expectJson(http_client_->get("/fapi/v1/order", {
                {"symbol", symbol_},
                {"orderId", order_id}
            }, true), "getOrder " + order_id);
            return parseOrder(j);
        });
    });
}

Status ExchangeGateway::cancelOrder(const std::string& order_id) {
    auto result = guarded<bool>("cancelOrder", [&]() {
        return retry_policy_.execute(OperationType::ORDER_CANCELLATION, "cancelOrder", [&](int) {
            auto response = http_client_->del("/fapi/v1/order", {
                {"symbol", symbol_},
                {"orderId", order_id}
            }, true);
            if (response.isSuccess()) {
                return true;
            }
            if (isUnknownOrderCode(response.exchangeErrorCode())) {
                LOG_INFO("Cancel {}: order already closed on exchange", order_id);
                return true;
            }
            throw network::ExchangeError::fromResponse(response, "cancelOrder " + order_id);
        });
    });
    if (!result) {
        return Status::fail(result.error());
    }
    return Status::ok();
}

Result<std::vector<Order>> ExchangeGateway::getOpenOrders() {
    return guarded<std::vector<Order>>("getOpenOrders", [&]() {
        return retry_policy_.execute(OperationType::ORDER_STATUS, "getOpenOrders", [&](int) {
            const auto j = expectJson(
                http_client_->get("/fapi/v1/openOrders", {{"symbol", symbol_}}, true), "openOrders");
            std::vector<Order> orders;
            for (const auto& entry : j) {
                orders.push_back(parseOrder(entry));
            }
            return orders;
        });
    });
}

Result<std::vector<ExchangePosition>> ExchangeGateway::getPositions() {
    return guarded<std::vector<ExchangePosition>>("getPositions", [&]() {
        return retry_policy_.execute(OperationType::ACCOUNT, "getPositions", [&](int) {
            const auto j = expectJson(
                http_client_->get("/fapi/v2/positionRisk", {{"symbol", symbol_}}, true), "positionRisk");
            std::vector<ExchangePosition> positions;
            for (const auto& entry : j) {
                ExchangePosition p;
                p.symbol = entry.value("symbol", "");
                p.position_amt = common::parseJsonNumber(entry, "positionAmt");
                p.entry_price = common::parseJsonNumber(entry, "entryPrice");
                p.unrealized_pnl = common::parseJsonNumber(entry, "unRealizedProfit");
                if (p.symbol == symbol_ && p.position_amt != 0.0) {
                    positions.push_back(p);
                }
            }
            return positions;
        });
    });
}

Result<long long> ExchangeGateway::ping() {
    return guarded<long long>("ping", [&]() {
        const auto started = std::chrono::steady_clock::now();
        expectJson(http_client_->get("/fapi/v1/time"), "serverTime");
        return static_cast<long long>(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count());
    });
}

std::string ExchangeGateway::formatPrice(double price) {
    SymbolInfo info;
    auto symbol = getSymbolInfo();
    if (symbol) {
        info = symbol.value();
    }
    return common::formatDecimal(common::roundToTick(price, info.tick_size), info.price_precision);
}

std::string ExchangeGateway::formatQuantity(double quantity) {
    SymbolInfo info;
    auto symbol = getSymbolInfo();
    if (symbol) {
        info = symbol.value();
    }
    return common::formatDecimal(common::floorToStep(quantity, info.step_size), info.quantity_precision);
}

} // namespace execution
} // namespace triplersi
