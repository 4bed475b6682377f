#pragma once

#include "papertrade/domain/order.hpp"
#include "papertrade/domain/quote.hpp"

namespace papertrade {

// -----------------------------------------------------------------------------
// IFillPolicy — how much of a triggered order fills in one pass
// -----------------------------------------------------------------------------
//
// @brief  Seam between "the order's trigger condition is met" and "this much
//         quantity changes hands".
//
// @details
//   FullFillPolicy            → the whole remaining quantity fills at once.
//                               Default; orders never rest in
//                               PartiallyFilled.
//   LiquidityCappedFillPolicy → at most max_fill_quantity per pass; larger
//                               orders fill across several ticks and pass
//                               through PartiallyFilled.
//
// The fill price is always the quote price; policies only choose quantity.
// A return value <= 0 means "nothing fills this pass".
// -----------------------------------------------------------------------------
class IFillPolicy {
 public:
  virtual ~IFillPolicy() = default;

  virtual double fillQuantity(const domain::Order& order,
                              const domain::Quote& quote) const = 0;

  virtual const char* name() const = 0;
};

class FullFillPolicy final : public IFillPolicy {
 public:
  double fillQuantity(const domain::Order& order,
                      const domain::Quote& quote) const override;
  const char* name() const override { return "full"; }
};

class LiquidityCappedFillPolicy final : public IFillPolicy {
 public:
  explicit LiquidityCappedFillPolicy(double max_fill_quantity);

  double fillQuantity(const domain::Order& order,
                      const domain::Quote& quote) const override;
  const char* name() const override { return "liquidity_capped"; }

 private:
  double max_fill_quantity_;
};

}  // namespace papertrade
