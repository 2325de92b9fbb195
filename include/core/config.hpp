#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "buffer/snapshot_ring.hpp"
#include "model/snapshot.hpp"
#include "sensors/kinked_rate_curve.hpp"

namespace yield_oracle::core {

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  std::string key_prefix{"yield:oracle"};
  bool enabled{false};
};

struct RateSourceConfig {
  std::string kind{"fixed"};
  model::rate_t rate{0};
  std::string path{};
  sensors::KinkedRateCurve curve{};
};

struct AssetConfig {
  std::string asset{};
  std::string rate_source{};
  std::size_t capacity{buffer::SnapshotRing::kDefaultCapacity};
};

struct OracleConfig {
  std::chrono::milliseconds refresh_interval{std::chrono::seconds(60)};
  std::vector<std::string> admins{};
  std::string operator_id{};
  std::string state_path{};
  bool stdout_debug{true};
  RedisConfig redis{};
  std::map<std::string, RateSourceConfig> rate_sources{};
  // Declaration order is registration order.
  std::vector<AssetConfig> assets{};
};

OracleConfig load_oracle_config(const std::string& path);

}  // namespace yield_oracle::core
