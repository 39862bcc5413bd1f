#include "tradeguard/domain/risk_limits.hpp"
#include "tradeguard/domain/errors.hpp"

#include <string>

namespace tradeguard {
namespace domain {

namespace {

void requireNonNegative(Decimal value, const char* field) {
  if (value.isNegative()) {
    throw ValidationError(field, std::string(field) +
                                     " must not be negative, got " +
                                     value.toString());
  }
}

}  // namespace

void RiskLimits::validate() const {
  requireNonNegative(max_position_size, "max_position_size");
  requireNonNegative(max_order_size, "max_order_size");
  requireNonNegative(max_daily_loss, "max_daily_loss");
  requireNonNegative(max_drawdown_percent, "max_drawdown_percent");
  if (max_orders_per_second < 0) {
    throw ValidationError("max_orders_per_second",
                          "max_orders_per_second must not be negative, got " +
                              std::to_string(max_orders_per_second));
  }
  requireNonNegative(max_exposure, "max_exposure");
  requireNonNegative(stop_loss_percent, "stop_loss_percent");
  requireNonNegative(take_profit_percent, "take_profit_percent");
}

RiskLimits defaultRiskLimits() {
  RiskLimits limits;
  limits.max_position_size = Decimal(1000);
  limits.max_order_size = Decimal(100);
  limits.max_daily_loss = Decimal(10000);
  limits.max_drawdown_percent = Decimal(20);
  limits.max_orders_per_second = 100;
  limits.max_exposure = Decimal(100000);
  limits.stop_loss_percent = Decimal(5);
  limits.take_profit_percent = Decimal(10);
  return limits;
}

}  // namespace domain
}  // namespace tradeguard
