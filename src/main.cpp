#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "core/admin.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/keeper.hpp"
#include "core/oracle.hpp"
#include "core/timestamp.hpp"
#include "sensors/rate_source.hpp"
#include "sinks/redis_ts.hpp"
#include "sinks/stdout_debug.hpp"
#include "storage/state_store.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

std::string format_config_settings(const yield_oracle::core::OracleConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[oracle] loaded config from " << config_path
         << " | refresh_interval_ms=" << config.refresh_interval.count()
         << " | assets=" << config.assets.size()
         << " | rate_sources=" << config.rate_sources.size()
         << " | state_path=" << (config.state_path.empty() ? "<none>" : config.state_path)
         << " | stdout_debug=" << (config.stdout_debug ? "true" : "false")
         << " | redis_enabled=" << (config.redis.enabled ? "true" : "false")
         << " | redis_address=";

  if (!config.redis.unix_socket.empty()) {
    output << "unix://" << config.redis.unix_socket;
  } else {
    output << config.redis.host << ':' << config.redis.port;
  }
  return output.str();
}

void add_rate_sources(yield_oracle::core::YieldOracle& oracle, const yield_oracle::core::OracleConfig& config) {
  for (const auto& [id, source] : config.rate_sources) {
    if (source.kind == "pool_file") {
      oracle.add_rate_source(id, yield_oracle::sensors::make_pool_file_rate_source(source.path, source.curve));
    } else {
      oracle.add_rate_source(id, yield_oracle::sensors::make_fixed_rate_source(source.rate));
    }
  }
}

void add_sinks(yield_oracle::core::YieldOracle& oracle, const yield_oracle::core::OracleConfig& config) {
  if (config.stdout_debug) {
    oracle.add_sink(std::make_unique<yield_oracle::sinks::StdoutDebugSink>());
  }

  if (!config.redis.enabled) {
    return;
  }

  yield_oracle::sinks::RedisTsOptions options{};
  options.host = config.redis.host;
  options.port = config.redis.port;
  options.unix_socket = config.redis.unix_socket;
  options.password = config.redis.password;
  options.key_prefix = config.redis.key_prefix;
  auto redis_sink = std::make_unique<yield_oracle::sinks::RedisTsSink>(options);

  const std::string address =
      options.unix_socket.empty() ? options.host + ':' + std::to_string(options.port) : "unix://" + options.unix_socket;
  if (redis_sink->check_connectivity()) {
    std::cerr << "[oracle] redis connectivity confirmed at " << address << '\n';
  } else {
    std::cerr << "[oracle] redis connectivity check failed at " << address << '\n';
  }
  oracle.add_sink(std::move(redis_sink));
}

}  // namespace

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);

  const std::string config_path = argc > 1 ? argv[1] : "configs/oracle.example.yaml";

  yield_oracle::core::OracleConfig config{};
  try {
    config = yield_oracle::core::load_oracle_config(config_path);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << format_config_settings(config, config_path) << '\n';

  yield_oracle::core::YieldOracle oracle{yield_oracle::core::unix_timestamp_now_s};
  try {
    add_rate_sources(oracle, config);
    add_sinks(oracle, config);

    if (!config.state_path.empty()) {
      if (const auto state = yield_oracle::storage::load_state(config.state_path); state.has_value()) {
        oracle.import_state(*state);
        std::cerr << "[state] restored " << state->assets.size() << " asset(s) from " << config.state_path << '\n';
      }
    }

    if (!config.assets.empty()) {
      const yield_oracle::core::AdminGate gate{config.admins};
      const auto admin = gate.require(config.operator_id);
      for (const auto& asset : config.assets) {
        oracle.register_asset(admin, asset.asset, asset.rate_source);
        oracle.resize(admin, asset.asset, asset.capacity);
      }
    }
  } catch (const std::exception& ex) {
    std::cerr << "startup error: " << ex.what() << '\n';
    return 1;
  }

  yield_oracle::core::KeeperOptions keeper_options{};
  // One-second ticks keep shutdown responsive between refreshes.
  keeper_options.tick_interval = std::chrono::seconds(1);
  keeper_options.refresh_every_ticks =
      static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(config.refresh_interval).count());
  keeper_options.state_path = config.state_path;

  yield_oracle::core::Keeper keeper{oracle, keeper_options};
  const auto stats = keeper.run_until([] { return g_shutdown_requested != 0; });

  std::cerr << "[keeper] shutdown signal received after " << stats.refresh_cycles << " refresh cycle(s), "
            << stats.snapshots_latched << " snapshot(s), " << stats.refresh_failures << " failure(s); exiting cleanly\n";

  return 0;
}
