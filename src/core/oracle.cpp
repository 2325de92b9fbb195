#include "core/oracle.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include "derived/time_weighted_yield.hpp"

namespace yield_oracle::core {

YieldOracle::YieldOracle(Clock clock) : clock_(std::move(clock)) {
  if (!clock_) {
    throw std::invalid_argument("yield oracle requires a clock");
  }
}

void YieldOracle::add_rate_source(const std::string& id, std::unique_ptr<sensors::RateSource> source) {
  if (!registry::is_valid_identifier(id)) {
    throw OracleError(error_kind::INVALID_IDENTIFIER, "invalid rate source identifier '" + id + "'");
  }
  if (source == nullptr) {
    throw std::invalid_argument("rate source " + id + " is null");
  }
  rate_sources_[id] = std::move(source);
}

void YieldOracle::add_sink(std::unique_ptr<sinks::EventSink> sink) {
  if (sink != nullptr) {
    sinks_.push_back(SinkSlot{std::move(sink), true});
  }
}

registry::Binding YieldOracle::register_asset(const AdminCapability& /*admin*/, const std::string& asset,
                                              const std::string& rate_source) {
  const auto result = registry_.bind(asset, rate_source);
  if (result.newly_registered) {
    rings_.emplace(asset, buffer::SnapshotRing{});
    std::cerr << "[oracle] registered " << asset << " at position " << *registry_.position(asset) << '\n';
  }

  if (result.source_changed) {
    model::oracle_event event{};
    event.kind = model::event_kind::RATE_SOURCE_BOUND;
    event.asset = asset;
    event.rate_source = rate_source;
    event.capacity = ring(asset).capacity();
    emit(event);
  }
  return result.binding;
}

std::size_t YieldOracle::resize(const AdminCapability& /*admin*/, const std::string& asset,
                                const std::size_t new_capacity) {
  auto& target = mutable_ring(asset);
  const std::size_t previous = target.capacity();
  const std::size_t effective = target.resize(new_capacity);

  if (effective != previous) {
    model::oracle_event event{};
    event.kind = model::event_kind::CAPACITY_CHANGED;
    event.asset = asset;
    event.rate_source = registry_.rate_source_for(asset);
    event.capacity = effective;
    emit(event);
  }
  return effective;
}

model::snapshot YieldOracle::refresh_one(const AdminCapability& /*admin*/, const std::string& asset) {
  return latch(asset);
}

RefreshReport YieldOracle::refresh_all(const AdminCapability& /*admin*/) { return refresh_registered(); }

RefreshReport YieldOracle::keeper_refresh() { return refresh_registered(); }

model::rate_t YieldOracle::get_yield(const std::string& asset) const {
  return derived::time_weighted_average(ring(asset));
}

SnapshotView YieldOracle::get_snapshots(const std::string& asset) const {
  const auto& source = ring(asset);
  SnapshotView view{};
  view.write_index = source.write_index();
  view.snapshots.reserve(source.capacity());
  for (const auto& slot : source.slots()) {
    view.snapshots.push_back(slot.value_or(model::snapshot{}));
  }
  return view;
}

const buffer::SnapshotRing& YieldOracle::ring(const std::string& asset) const {
  const auto it = rings_.find(asset);
  if (it == rings_.end()) {
    throw OracleError(error_kind::UNKNOWN_ASSET, "asset " + asset + " is not registered");
  }
  return it->second;
}

const std::vector<std::string>& YieldOracle::assets() const noexcept { return registry_.assets(); }

storage::OracleState YieldOracle::export_state() const {
  storage::OracleState state{};
  for (const auto& asset : registry_.assets()) {
    const auto& source = ring(asset);
    state.assets.push_back(
        storage::AssetState{asset, registry_.rate_source_for(asset), source.write_index(), source.slots()});
  }
  return state;
}

void YieldOracle::import_state(const storage::OracleState& state) {
  std::vector<buffer::SnapshotRing> restored;
  restored.reserve(state.assets.size());
  for (const auto& entry : state.assets) {
    if (!registry::is_valid_identifier(entry.asset) || !registry::is_valid_identifier(entry.rate_source)) {
      throw OracleError(error_kind::INVALID_IDENTIFIER, "persisted entry '" + entry.asset + "' has an invalid identifier");
    }
    restored.push_back(buffer::SnapshotRing::restore(entry.slots, entry.write_index));
  }

  for (std::size_t i = 0; i < state.assets.size(); ++i) {
    const auto& entry = state.assets[i];
    if (registry_.bind(entry.asset, entry.rate_source).newly_registered) {
      rings_.emplace(entry.asset, std::move(restored[i]));
    }
  }
}

model::snapshot YieldOracle::latch(const std::string& asset) {
  auto& target = mutable_ring(asset);
  const auto& source_id = registry_.rate_source_for(asset);

  const auto source_it = rate_sources_.find(source_id);
  if (source_it == rate_sources_.end()) {
    throw OracleError(error_kind::RATE_SOURCE_FAILURE, "rate source " + source_id + " for " + asset + " is not configured");
  }

  const model::timestamp_t now = clock_();
  const auto& newest = target.slot((target.write_index() + target.capacity() - 1) % target.capacity());
  if (newest.has_value() && now < newest->timestamp) {
    throw OracleError(error_kind::NON_MONOTONIC_SAMPLES, "clock for " + asset + " reads " + std::to_string(now) +
                                                             ", before the newest snapshot at " +
                                                             std::to_string(newest->timestamp));
  }

  model::rate_t rate = 0;
  if (!source_it->second->current_supply_rate(rate)) {
    throw OracleError(error_kind::RATE_SOURCE_FAILURE,
                      std::string(source_it->second->kind()) + " rate source " + source_id + " failed to read");
  }

  model::oracle_event event{};
  event.kind = model::event_kind::SNAPSHOT_LATCHED;
  event.asset = asset;
  event.rate_source = source_id;
  event.latched = target.latch(now, rate);
  event.capacity = target.capacity();
  try {
    event.yield = derived::time_weighted_average(target);
  } catch (const OracleError& ex) {
    if (ex.kind() != error_kind::INSUFFICIENT_SAMPLES && ex.kind() != error_kind::NON_MONOTONIC_SAMPLES) {
      throw;
    }
  }
  emit(event);
  return event.latched;
}

RefreshReport YieldOracle::refresh_registered() {
  RefreshReport report{};
  for (const auto& asset : registry_.assets()) {
    try {
      report.latched.emplace_back(asset, latch(asset));
    } catch (const OracleError& ex) {
      report.failures.push_back(RefreshFailure{asset, ex.kind(), ex.what()});
    }
  }
  return report;
}

buffer::SnapshotRing& YieldOracle::mutable_ring(const std::string& asset) {
  const auto it = rings_.find(asset);
  if (it == rings_.end()) {
    throw OracleError(error_kind::UNKNOWN_ASSET, "asset " + asset + " is not registered");
  }
  return it->second;
}

void YieldOracle::emit(const model::oracle_event& event) {
  for (auto& [sink, was_ok] : sinks_) {
    if (!sink->publish(event)) {
      ++sink_failures_;
      if (was_ok) {
        std::cerr << "[oracle] " << sink->name() << " sink failed to publish " << model::to_string(event.kind)
                  << " for " << event.asset << '\n';
        was_ok = false;
      }
    } else if (!was_ok) {
      std::cerr << "[oracle] " << sink->name() << " sink recovered\n";
      was_ok = true;
    }
  }
}

}  // namespace yield_oracle::core
