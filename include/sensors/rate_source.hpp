#pragma once

#include <memory>
#include <string>

#include "model/snapshot.hpp"
#include "sensors/kinked_rate_curve.hpp"

namespace yield_oracle::sensors {

// Point-in-time view of a lending pool's rates. Reads report failure through
// the return value and leave the output untouched.
class RateSource {
 public:
  virtual const char* kind() const noexcept = 0;
  // Utilization as an 18-decimal fraction.
  virtual bool utilization(model::rate_t& out) noexcept = 0;
  // Per-second supply rate for `utilization`, 18 decimals.
  virtual bool supply_rate(model::rate_t utilization, model::rate_t& out) noexcept = 0;
  virtual ~RateSource() = default;

  bool current_supply_rate(model::rate_t& out) noexcept;
};

std::unique_ptr<RateSource> make_fixed_rate_source(model::rate_t rate);
std::unique_ptr<RateSource> make_pool_file_rate_source(std::string path, KinkedRateCurve curve);

}  // namespace yield_oracle::sensors
