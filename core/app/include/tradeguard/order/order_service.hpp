#pragma once

#include "tradeguard/concurrent/id_generator.hpp"
#include "tradeguard/domain/decimal.hpp"
#include "tradeguard/domain/order.hpp"
#include "tradeguard/domain/order_types.hpp"
#include "tradeguard/risk/i_order_validator.hpp"
#include "tradeguard/risk/risk_data_sources.hpp"
#include "tradeguard/time/i_time_provider.hpp"
#include "tradeguard/time/time_utils.hpp"

#include <map>
#include <optional>
#include <string>

namespace tradeguard {

// -----------------------------------------------------------------------------
// CreateOrderRequest: inbound order creation payload
// -----------------------------------------------------------------------------
struct CreateOrderRequest {
  std::string strategy_id;
  std::string symbol;
  std::string exchange;
  domain::OrderSide side{domain::OrderSide::Buy};
  domain::OrderType order_type{domain::OrderType::Limit};
  domain::Decimal quantity;
  domain::Decimal price;
  std::optional<domain::Decimal> stop_price;
  domain::TimeInForce time_in_force{domain::TimeInForce::GTC};
  std::optional<Timestamp> expires_at;
  std::optional<std::string> client_order_id;
};

// -----------------------------------------------------------------------------
// CommissionConfig
// -----------------------------------------------------------------------------
//
// @details
// Rate: exchange_rates[exchange] if present, else default_rate.
//
// Settlement asset, first match wins:
//   1. symbol_settlement_assets[symbol]
//   2. exchange_settlement_assets[exchange]
//   3. quote currency parsed from the symbol (see quoteCurrency())
//   4. default_settlement_asset
// -----------------------------------------------------------------------------
struct CommissionConfig {
  domain::Decimal default_rate{domain::Decimal::fromRaw(100'000)};  // 0.001
  std::string default_settlement_asset{"USDT"};
  std::map<std::string, domain::Decimal> exchange_rates;
  std::map<std::string, std::string> exchange_settlement_assets;
  std::map<std::string, std::string> symbol_settlement_assets;
};

// -----------------------------------------------------------------------------
// quoteCurrency(symbol)
// -----------------------------------------------------------------------------
// @brief  Extracts the quote asset from a trading pair symbol.
//
// @details
//   "BTC/USDT", "BTC-USDT", "BTC_USDT"  → "USDT" (text after the last
//                                         separator)
//   "BTCUSDT", "ethbtc"                 → "USDT", "BTC" (known quote
//                                         suffix, upper-cased)
//   "AAPL"                              → std::nullopt
//
// Known suffixes, longest match first: USDT, USDC, BUSD, USD, EUR, BTC, ETH.
// -----------------------------------------------------------------------------
std::optional<std::string> quoteCurrency(const std::string& symbol);

// -----------------------------------------------------------------------------
// OrderService: domain order service
// -----------------------------------------------------------------------------
//
// @brief  Builds validated Order entities from creation requests and
//         computes their monetary value and commission.
//
// @details
// createOrder() pipeline:
//   1. Request shape (required fields, price / stop price by order type,
//      expiry for GTD)                      → ValidationError
//   2. Order::create() with a fresh "ord-<n>" id → ValidationError
//   3. validator.validateOrder(order)       → OrderBlockedError
// On success the Pending order is returned to the caller. Nothing is sent
// to an exchange and nothing is persisted here.
//
// canPlaceOrder() is the boolean pre-check used before submission. With a
// strategy state lookup configured it also requires the strategy to be
// active and to have enough available capital for the order's value; if
// that lookup is unavailable the decision falls back to the risk rules
// alone.
//
// Thread model:
//   No mutable state of its own. Safe to call concurrently provided the
//   validator and the lookup are thread-safe (RiskChecker and RiskService
//   are).
//
// Ownership:
//   References the validator, the id generator, the optional strategy
//   lookup and the optional clock. All must outlive the service.
// -----------------------------------------------------------------------------
class OrderService {
 public:
  // clock stamps the orders it creates (see Order::create). Null means
  // system_clock.
  OrderService(IOrderValidator& validator, IdGenerator& ids,
               CommissionConfig commission,
               const IStrategyStateLookup* strategies = nullptr,
               const ITimeProvider* clock = nullptr);

  // -------------------------------------------------------------------------
  // createOrder(request)
  // -------------------------------------------------------------------------
  // @return A Pending order that passed every risk rule.
  //
  // @throws ValidationError    Malformed request.
  // @throws OrderBlockedError  A risk rule refused the order. Its message
  //                            starts with "order blocked by risk
  //                            management: ".
  // -------------------------------------------------------------------------
  domain::Order createOrder(const CreateOrderRequest& request);

  // quantity * referencePrice(): the limit price, or the stop price for
  // stop orders without one.
  // @throws ValidationError for Market orders, which have no price until a
  //         mark price is supplied, and for values outside the Decimal range.
  domain::Decimal calculateOrderValue(const domain::Order& order) const;

  // quantity * mark_price, used for Market orders.
  domain::Decimal calculateOrderValue(const domain::Order& order,
                                      domain::Price mark_price) const;

  // -------------------------------------------------------------------------
  // calculateCommission(order, exchange)
  // -------------------------------------------------------------------------
  // @return {orderValue * rate(exchange), settlementAsset(symbol, exchange)}
  //
  // @throws ValidationError for Market orders (see calculateOrderValue).
  // -------------------------------------------------------------------------
  domain::Commission calculateCommission(const domain::Order& order,
                                         const std::string& exchange) const;

  std::string settlementAsset(const std::string& symbol,
                              const std::string& exchange) const;

  bool canPlaceOrder(const std::string& strategy_id,
                     const domain::Order& order);

 private:
  void validateRequest(const CreateOrderRequest& request) const;

  // quantity * price. @throws ValidationError when out of Decimal range.
  static domain::Decimal notional(const domain::Order& order,
                                  domain::Price price);

  IOrderValidator& validator_;
  IdGenerator& ids_;
  const CommissionConfig commission_;
  const IStrategyStateLookup* strategies_;
  const ITimeProvider* clock_;
};

}  // namespace tradeguard
