#include "core/keeper.hpp"

#include <iostream>
#include <string>
#include <thread>
#include <utility>

namespace yield_oracle::core {

Keeper::Keeper(YieldOracle& oracle, KeeperOptions options) : oracle_(oracle), options_(std::move(options)) {}

KeeperStats Keeper::run_for_ticks(const std::size_t total_ticks) {
  KeeperStats stats{};
  for (std::size_t i = 0; total_ticks == 0 || i < total_ticks; ++i) {
    tick(stats);
  }
  return stats;
}

void Keeper::tick(KeeperStats& stats) {
  if (first_tick_) {
    next_wakeup_ = std::chrono::steady_clock::now();
    first_tick_ = false;
  }

  const auto cycle_start = std::chrono::steady_clock::now();
  if (refresh_due()) {
    refresh(stats);
    persist(stats);
  }
  if (std::chrono::steady_clock::now() - cycle_start > options_.tick_interval) {
    ++stats.missed_cycles;
  }

  ++stats.ticks_executed;
  ++tick_count_;

  next_wakeup_ += options_.tick_interval;
  std::this_thread::sleep_until(next_wakeup_);
}

bool Keeper::refresh_due() const noexcept {
  if (options_.refresh_every_ticks == 0) {
    return false;
  }
  return (tick_count_ % options_.refresh_every_ticks) == 0;
}

void Keeper::refresh(KeeperStats& stats) {
  ++stats.refresh_cycles;
  const auto report = oracle_.keeper_refresh();
  stats.snapshots_latched += report.latched.size();
  stats.refresh_failures += report.failures.size();

  for (const auto& failure : report.failures) {
    std::cerr << "[keeper] latch failed for " << failure.asset << ": " << failure.message << '\n';
  }
}

void Keeper::persist(KeeperStats& stats) {
  if (options_.state_path.empty()) {
    return;
  }

  std::string error;
  if (!storage::save_state(options_.state_path, oracle_.export_state(), &error)) {
    ++stats.persist_failures;
    if (persist_was_ok_) {
      std::cerr << "[state] save to " << options_.state_path << " failed: " << error << '\n';
      persist_was_ok_ = false;
    }
  } else if (!persist_was_ok_) {
    std::cerr << "[state] save recovered\n";
    persist_was_ok_ = true;
  }
}

}  // namespace yield_oracle::core
