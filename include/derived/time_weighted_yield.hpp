#pragma once

#include <cstddef>

#include "buffer/snapshot_ring.hpp"
#include "model/snapshot.hpp"

namespace yield_oracle::derived {

struct YieldWindow {
  model::rate_t average{0};
  model::timestamp_t total_elapsed{0};
  std::size_t samples{0};
  model::timestamp_t oldest{0};
  model::timestamp_t newest{0};
};

// Trapezoidal time-weighted average over every populated snapshot of the ring.
// Throws core::OracleError(INSUFFICIENT_SAMPLES) when the window covers no
// time and core::OracleError(NON_MONOTONIC_SAMPLES) when timestamps go
// backwards inside the window.
[[nodiscard]] YieldWindow summarize_window(const buffer::SnapshotRing& ring);

[[nodiscard]] model::rate_t time_weighted_average(const buffer::SnapshotRing& ring);

}  // namespace yield_oracle::derived
