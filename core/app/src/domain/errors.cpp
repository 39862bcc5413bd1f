#include "tradeguard/domain/errors.hpp"

namespace tradeguard {

const char* toString(RiskViolationKind kind) {
  switch (kind) {
    case RiskViolationKind::OrderSize:    return "order_size";
    case RiskViolationKind::PositionSize: return "position_size";
    case RiskViolationKind::Exposure:     return "exposure";
    case RiskViolationKind::OrderRate:    return "order_rate";
    case RiskViolationKind::MarketClosed: return "market_closed";
    case RiskViolationKind::DailyLoss:    return "daily_loss";
    case RiskViolationKind::Margin:       return "margin";
    case RiskViolationKind::Drawdown:     return "drawdown";
  }
  return "unknown";
}

}  // namespace tradeguard
