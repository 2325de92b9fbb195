#include "sensors/rate_source.hpp"

#include <memory>

namespace yield_oracle::sensors {
namespace {

class FixedRateSource final : public RateSource {
 public:
  explicit FixedRateSource(const model::rate_t rate) : rate_(rate) {}

  const char* kind() const noexcept override { return "fixed"; }

  bool utilization(model::rate_t& out) noexcept override {
    out = 0;
    return true;
  }

  bool supply_rate(model::rate_t /*utilization*/, model::rate_t& out) noexcept override {
    out = rate_;
    return true;
  }

 private:
  model::rate_t rate_;
};

}  // namespace

bool RateSource::current_supply_rate(model::rate_t& out) noexcept {
  model::rate_t current_utilization = 0;
  if (!utilization(current_utilization)) {
    return false;
  }
  return supply_rate(current_utilization, out);
}

std::unique_ptr<RateSource> make_fixed_rate_source(const model::rate_t rate) {
  return std::make_unique<FixedRateSource>(rate);
}

}  // namespace yield_oracle::sensors
