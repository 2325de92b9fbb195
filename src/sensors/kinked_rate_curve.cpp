#include "sensors/kinked_rate_curve.hpp"

#include "core/fixed_point.hpp"

namespace yield_oracle::sensors {

model::rate_t KinkedRateCurve::supply_rate(const model::rate_t utilization) const noexcept {
  core::wide_t rate = base;
  if (utilization <= kink) {
    rate += core::mul_fixed_wide(slope_low, utilization);
  } else {
    rate += core::mul_fixed_wide(slope_low, kink) + core::mul_fixed_wide(slope_high, utilization - kink);
  }
  return core::saturate(rate);
}

model::rate_t pool_utilization(const model::rate_t total_supply, const model::rate_t total_borrow) noexcept {
  if (total_supply == 0) {
    return 0;
  }
  return core::saturate((static_cast<core::wide_t>(total_borrow) * core::kRateScale) / total_supply);
}

}  // namespace yield_oracle::sensors
