#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "core/oracle.hpp"

namespace yield_oracle::core {

struct KeeperStats {
  std::size_t ticks_executed{0};
  std::size_t refresh_cycles{0};
  std::size_t snapshots_latched{0};
  std::size_t refresh_failures{0};
  std::size_t persist_failures{0};
  std::size_t missed_cycles{0};
};

struct KeeperOptions {
  std::chrono::milliseconds tick_interval{std::chrono::seconds(60)};
  // Refresh every N ticks.
  std::uint64_t refresh_every_ticks{1};
  // Empty disables persistence.
  std::string state_path{};
};

// Drives YieldOracle::keeper_refresh() on a fixed steady-clock cadence.
class Keeper {
 public:
  Keeper(YieldOracle& oracle, KeeperOptions options);

  template <typename StopPredicate>
  KeeperStats run_until(StopPredicate&& should_stop) {
    KeeperStats stats{};
    while (!should_stop()) {
      tick(stats);
    }
    return stats;
  }

  // total_ticks == 0 never returns.
  KeeperStats run_for_ticks(std::size_t total_ticks);

 private:
  void tick(KeeperStats& stats);
  void refresh(KeeperStats& stats);
  void persist(KeeperStats& stats);
  [[nodiscard]] bool refresh_due() const noexcept;

  YieldOracle& oracle_;
  KeeperOptions options_;
  std::uint64_t tick_count_{0};
  std::chrono::steady_clock::time_point next_wakeup_{};
  bool first_tick_{true};
  bool persist_was_ok_{true};
};

}  // namespace yield_oracle::core
