#include "derived/time_weighted_yield.hpp"

#include <string>

#include "core/errors.hpp"
#include "core/fixed_point.hpp"

namespace yield_oracle::derived {
namespace {

struct YieldAccumulator {
  model::rate_t prev_rate{0};
  model::timestamp_t prev_timestamp{0};
  model::timestamp_t total_elapsed{0};
  core::wide_t weighted_rate_sum{0};
  std::size_t samples{0};
  model::timestamp_t oldest{0};
};

// The first snapshot only seeds prev_*. Elapsed times telescope to at most
// newest - oldest, so weighted_rate_sum stays below 2^64 * 2^64.
YieldAccumulator fold(YieldAccumulator acc, const model::snapshot& s) {
  if (acc.samples == 0) {
    acc.oldest = s.timestamp;
  } else {
    if (s.timestamp < acc.prev_timestamp) {
      throw core::OracleError(core::error_kind::NON_MONOTONIC_SAMPLES,
                              "snapshot at " + std::to_string(s.timestamp) + " follows snapshot at " +
                                  std::to_string(acc.prev_timestamp));
    }
    const model::timestamp_t elapsed = s.timestamp - acc.prev_timestamp;
    const model::rate_t period_average_rate = core::midpoint(s.rate, acc.prev_rate);
    acc.total_elapsed += elapsed;
    acc.weighted_rate_sum += static_cast<core::wide_t>(period_average_rate) * elapsed;
  }

  acc.prev_rate = s.rate;
  acc.prev_timestamp = s.timestamp;
  ++acc.samples;
  return acc;
}

}  // namespace

YieldWindow summarize_window(const buffer::SnapshotRing& ring) {
  YieldAccumulator acc{};
  ring.visit_chronological([&acc](const model::snapshot& s) { acc = fold(acc, s); });

  if (acc.total_elapsed == 0) {
    throw core::OracleError(core::error_kind::INSUFFICIENT_SAMPLES,
                            "window of " + std::to_string(acc.samples) + " snapshot(s) covers no elapsed time");
  }

  YieldWindow window{};
  window.average = static_cast<model::rate_t>(acc.weighted_rate_sum / acc.total_elapsed);
  window.total_elapsed = acc.total_elapsed;
  window.samples = acc.samples;
  window.oldest = acc.oldest;
  window.newest = acc.prev_timestamp;
  return window;
}

model::rate_t time_weighted_average(const buffer::SnapshotRing& ring) { return summarize_window(ring).average; }

}  // namespace yield_oracle::derived
