#include "tradeguard/order/order_service.hpp"
#include "tradeguard/domain/errors.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace tradeguard {

using domain::Decimal;

// -----------------------------------------------------------------------------
// quoteCurrency()
// -----------------------------------------------------------------------------
std::optional<std::string> quoteCurrency(const std::string& symbol) {
  std::string upper = symbol;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });

  const std::size_t sep = upper.find_last_of("/-_");
  if (sep != std::string::npos) {
    if (sep == 0 || sep + 1 >= upper.size()) {
      return std::nullopt;
    }
    return upper.substr(sep + 1);
  }

  static const std::array<const char*, 7> kQuoteSuffixes = {
      "USDT", "USDC", "BUSD", "USD", "EUR", "BTC", "ETH"};
  for (const char* suffix : kQuoteSuffixes) {
    const std::string s(suffix);
    if (upper.size() > s.size() &&
        upper.compare(upper.size() - s.size(), s.size(), s) == 0) {
      return s;
    }
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
OrderService::OrderService(IOrderValidator& validator, IdGenerator& ids,
                           CommissionConfig commission,
                           const IStrategyStateLookup* strategies,
                           const ITimeProvider* clock)
    : validator_(validator),
      ids_(ids),
      commission_(std::move(commission)),
      strategies_(strategies),
      clock_(clock) {}

// -----------------------------------------------------------------------------
// createOrder(): shape → entity → risk
// -----------------------------------------------------------------------------
domain::Order OrderService::createOrder(const CreateOrderRequest& request) {
  validateRequest(request);

  domain::OrderParams params;
  params.id = ids_.next_id();
  params.client_order_id = request.client_order_id;
  params.strategy_id = request.strategy_id;
  params.symbol = request.symbol;
  params.exchange = request.exchange;
  params.side = request.side;
  params.order_type = request.order_type;
  params.time_in_force = request.time_in_force;
  params.quantity = request.quantity;
  params.price = request.price;
  params.stop_price = request.stop_price;
  params.expires_at = request.expires_at;

  domain::Order order = domain::Order::create(params, clock_);

  try {
    validator_.validateOrder(order);
  } catch (const RiskViolationError& e) {
    std::cerr << "[OrderService] WARNING: order " << order.id()
              << " blocked: " << e.what() << "\n";
    throw OrderBlockedError(e);
  }

  std::cout << "[OrderService] created " << order.id() << " "
            << domain::toString(order.side()) << " "
            << order.quantity().value() << " " << order.symbol() << " @ "
            << order.price().value() << " for " << order.strategyId() << "\n";
  return order;
}

// -----------------------------------------------------------------------------
// calculateOrderValue()
// -----------------------------------------------------------------------------
Decimal OrderService::calculateOrderValue(const domain::Order& order) const {
  const std::optional<domain::Price> reference = order.referencePrice();
  if (!reference) {
    throw ValidationError("price",
                          "cannot calculate value without current market "
                          "price");
  }
  return notional(order, *reference);
}

Decimal OrderService::calculateOrderValue(const domain::Order& order,
                                          domain::Price mark_price) const {
  if (mark_price.isZero()) {
    throw ValidationError("mark_price", "mark price must be positive");
  }
  return notional(order, mark_price);
}

Decimal OrderService::notional(const domain::Order& order,
                               domain::Price price) {
  try {
    return order.quantity().value() * price.value();
  } catch (const std::overflow_error&) {
    throw ValidationError("quantity", "value of order " + order.id() +
                                          " exceeds the representable range");
  }
}

// -----------------------------------------------------------------------------
// calculateCommission()
// -----------------------------------------------------------------------------
domain::Commission OrderService::calculateCommission(
    const domain::Order& order, const std::string& exchange) const {
  const Decimal value = calculateOrderValue(order);

  Decimal rate = commission_.default_rate;
  auto it = commission_.exchange_rates.find(exchange);
  if (it != commission_.exchange_rates.end()) {
    rate = it->second;
  }

  Decimal amount;
  try {
    amount = value * rate;
  } catch (const std::overflow_error&) {
    throw ValidationError("commission", "commission on order " + order.id() +
                                            " exceeds the representable range");
  }
  return domain::Commission{amount, settlementAsset(order.symbol(), exchange)};
}

std::string OrderService::settlementAsset(const std::string& symbol,
                                          const std::string& exchange) const {
  auto by_symbol = commission_.symbol_settlement_assets.find(symbol);
  if (by_symbol != commission_.symbol_settlement_assets.end()) {
    return by_symbol->second;
  }
  auto by_exchange = commission_.exchange_settlement_assets.find(exchange);
  if (by_exchange != commission_.exchange_settlement_assets.end()) {
    return by_exchange->second;
  }
  if (auto quote = quoteCurrency(symbol)) {
    return *quote;
  }
  return commission_.default_settlement_asset;
}

// -----------------------------------------------------------------------------
// canPlaceOrder()
// -----------------------------------------------------------------------------
bool OrderService::canPlaceOrder(const std::string& strategy_id,
                                 const domain::Order& order) {
  if (order.strategyId() != strategy_id) {
    return false;
  }

  try {
    validator_.validateOrder(order);
  } catch (const RiskViolationError& e) {
    std::cout << "[OrderService] " << order.id() << " cannot be placed: "
              << e.what() << "\n";
    return false;
  }

  if (strategies_ == nullptr) {
    return true;
  }

  StrategyState state;
  try {
    state = strategies_->state(strategy_id);
  } catch (const DependencyUnavailableError& e) {
    std::cerr << "[OrderService] WARNING: strategy state unavailable for "
              << strategy_id << ", using risk checks only: " << e.what()
              << "\n";
    return true;
  }

  if (!state.active) {
    std::cout << "[OrderService] strategy " << strategy_id
              << " is inactive.\n";
    return false;
  }

  // Market orders have no value yet; capital is checked at execution.
  if (!order.referencePrice()) {
    return true;
  }

  Decimal value;
  try {
    value = calculateOrderValue(order);
  } catch (const ValidationError& e) {
    std::cout << "[OrderService] " << order.id() << " cannot be placed: "
              << e.what() << "\n";
    return false;
  }
  if (state.available_capital < value) {
    std::cout << "[OrderService] strategy " << strategy_id
              << " has insufficient capital (" << state.available_capital
              << " < " << value << ").\n";
    return false;
  }
  return true;
}

// -----------------------------------------------------------------------------
// validateRequest(): shape checks before an id is spent
// -----------------------------------------------------------------------------
void OrderService::validateRequest(const CreateOrderRequest& request) const {
  if (request.strategy_id.empty()) {
    throw ValidationError("strategy_id", "strategy_id is required");
  }
  if (request.symbol.empty()) {
    throw ValidationError("symbol", "symbol is required");
  }
  if (request.exchange.empty()) {
    throw ValidationError("exchange", "exchange is required");
  }
  if (request.client_order_id && request.client_order_id->empty()) {
    throw ValidationError("client_order_id",
                          "client_order_id must not be empty when given");
  }
  if (!request.quantity.isPositive()) {
    throw ValidationError("quantity", "quantity must be positive");
  }
  if (domain::requiresPrice(request.order_type) &&
      !request.price.isPositive()) {
    throw ValidationError("price",
                          std::string("price is required for ") +
                              domain::toString(request.order_type) +
                              " orders");
  }
  if (domain::requiresStopPrice(request.order_type) && !request.stop_price) {
    throw ValidationError("stop_price",
                          std::string("stop price is required for ") +
                              domain::toString(request.order_type) +
                              " orders");
  }
  if (request.time_in_force == domain::TimeInForce::GTD &&
      !request.expires_at) {
    throw ValidationError("expires_at",
                          "expires_at is required for GTD orders");
  }
}

}  // namespace tradeguard
