#pragma once

#include "model/snapshot.hpp"

namespace yield_oracle::sensors {

// Two-slope supply rate curve. Every field is 18-decimal fixed point; the
// slopes are per-second rates at 100% utilization.
struct KinkedRateCurve {
  model::rate_t base{0};
  model::rate_t slope_low{0};
  model::rate_t slope_high{0};
  model::rate_t kink{800'000'000'000'000'000ULL};

  // Saturates at the maximum rate instead of wrapping.
  [[nodiscard]] model::rate_t supply_rate(model::rate_t utilization) const noexcept;
};

// borrow / supply as an 18-decimal fraction, 0 for an empty pool.
[[nodiscard]] model::rate_t pool_utilization(model::rate_t total_supply, model::rate_t total_borrow) noexcept;

}  // namespace yield_oracle::sensors
