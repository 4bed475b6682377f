#include "papertrade/execution/fill_policy.hpp"

#include "papertrade/common/errors.hpp"

#include <algorithm>
#include <cmath>

namespace papertrade {

double FullFillPolicy::fillQuantity(const domain::Order& order,
                                    const domain::Quote& /*quote*/) const {
  return std::max(order.remaining(), 0.0);
}

LiquidityCappedFillPolicy::LiquidityCappedFillPolicy(double max_fill_quantity)
    : max_fill_quantity_(max_fill_quantity) {
  if (!std::isfinite(max_fill_quantity) || max_fill_quantity <= 0.0) {
    throw ConfigError("max_fill_quantity must be positive");
  }
}

double LiquidityCappedFillPolicy::fillQuantity(const domain::Order& order,
                                               const domain::Quote& /*quote*/) const {
  return std::clamp(order.remaining(), 0.0, max_fill_quantity_);
}

}  // namespace papertrade
