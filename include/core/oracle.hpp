#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "buffer/snapshot_ring.hpp"
#include "core/admin.hpp"
#include "core/errors.hpp"
#include "model/snapshot.hpp"
#include "registry/asset_registry.hpp"
#include "sensors/rate_source.hpp"
#include "sinks/event_sink.hpp"
#include "storage/state_store.hpp"

namespace yield_oracle::core {

struct RefreshFailure {
  std::string asset;
  error_kind kind;
  std::string message;
};

struct RefreshReport {
  std::vector<std::pair<std::string, model::snapshot>> latched{};
  std::vector<RefreshFailure> failures{};

  [[nodiscard]] bool ok() const noexcept { return failures.empty(); }
};

struct SnapshotView {
  std::size_t write_index{0};
  // Empty slots render as {0, 0}.
  std::vector<model::snapshot> snapshots{};
};

class YieldOracle {
 public:
  using Clock = std::function<model::timestamp_t()>;

  explicit YieldOracle(Clock clock);

  YieldOracle(const YieldOracle&) = delete;
  YieldOracle& operator=(const YieldOracle&) = delete;

  void add_rate_source(const std::string& id, std::unique_ptr<sensors::RateSource> source);
  void add_sink(std::unique_ptr<sinks::EventSink> sink);

  registry::Binding register_asset(const AdminCapability& admin, const std::string& asset,
                                   const std::string& rate_source);
  std::size_t resize(const AdminCapability& admin, const std::string& asset, std::size_t new_capacity);
  model::snapshot refresh_one(const AdminCapability& admin, const std::string& asset);
  RefreshReport refresh_all(const AdminCapability& admin);

  // Unprivileged entry point for the keeper.
  RefreshReport keeper_refresh();

  [[nodiscard]] model::rate_t get_yield(const std::string& asset) const;
  [[nodiscard]] SnapshotView get_snapshots(const std::string& asset) const;
  [[nodiscard]] const buffer::SnapshotRing& ring(const std::string& asset) const;
  [[nodiscard]] const std::vector<std::string>& assets() const noexcept;
  [[nodiscard]] std::size_t sink_failures() const noexcept { return sink_failures_; }

  [[nodiscard]] storage::OracleState export_state() const;
  // Restores registry and rings without emitting events. Assets already
  // registered keep their current ring.
  void import_state(const storage::OracleState& state);

 private:
  model::snapshot latch(const std::string& asset);
  RefreshReport refresh_registered();
  buffer::SnapshotRing& mutable_ring(const std::string& asset);
  void emit(const model::oracle_event& event);

  Clock clock_;
  registry::AssetRegistry registry_{};
  std::unordered_map<std::string, buffer::SnapshotRing> rings_{};
  std::unordered_map<std::string, std::unique_ptr<sensors::RateSource>> rate_sources_{};
  struct SinkSlot {
    std::unique_ptr<sinks::EventSink> sink;
    // Failures are logged once per transition.
    bool was_ok;
  };

  std::vector<SinkSlot> sinks_{};
  std::size_t sink_failures_{0};
};

}  // namespace yield_oracle::core
