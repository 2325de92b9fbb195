#include "model/snapshot.hpp"

namespace yield_oracle::model {

const char* to_string(const event_kind kind) noexcept {
  switch (kind) {
    case event_kind::RATE_SOURCE_BOUND:
      return "rate_source_bound";
    case event_kind::CAPACITY_CHANGED:
      return "capacity_changed";
    case event_kind::SNAPSHOT_LATCHED:
      return "snapshot_latched";
  }
  return "unknown";
}

}  // namespace yield_oracle::model
