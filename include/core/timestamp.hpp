#pragma once

#include <chrono>
#include <cstdint>

#include "model/snapshot.hpp"

namespace yield_oracle::core {

inline model::timestamp_t unix_timestamp_now_s() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<model::timestamp_t>(
      std::chrono::duration_cast<std::chrono::seconds>(now).count());
}

}  // namespace yield_oracle::core
