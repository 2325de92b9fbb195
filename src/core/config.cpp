#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/fixed_point.hpp"

namespace yield_oracle::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

bool parse_bool(const std::string& value) {
  const std::string lower = [&value]() {
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
      out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
  }();

  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

std::vector<std::string> split_list(const std::string& value) {
  std::vector<std::string> items;
  std::stringstream stream(value);
  std::string item;
  while (std::getline(stream, item, ',')) {
    item = trim(item);
    if (!item.empty()) {
      items.push_back(item);
    }
  }
  return items;
}

model::rate_t parse_rate(const std::string& key, const std::string& value) {
  try {
    return parse_fixed(value);
  } catch (const std::invalid_argument& ex) {
    throw std::runtime_error(key + ": " + ex.what());
  }
}

AssetConfig& asset_entry(OracleConfig& config, const std::string& asset) {
  const auto it = std::find_if(config.assets.begin(), config.assets.end(),
                               [&asset](const AssetConfig& entry) { return entry.asset == asset; });
  if (it != config.assets.end()) {
    return *it;
  }
  config.assets.push_back(AssetConfig{asset, {}, buffer::SnapshotRing::kDefaultCapacity});
  return config.assets.back();
}

void apply_source_key(OracleConfig& config, const std::string& key, const std::string& value) {
  const std::string rest = key.substr(std::string("sources.").size());
  const auto split = rest.rfind('.');
  if (split == std::string::npos) {
    throw std::runtime_error("rate source settings must look like sources.<id>.<field>: " + key);
  }

  auto& source = config.rate_sources[rest.substr(0, split)];
  const std::string field = rest.substr(split + 1);
  if (field == "kind") {
    if (value != "fixed" && value != "pool_file") {
      throw std::runtime_error(key + " must be fixed or pool_file");
    }
    source.kind = value;
  } else if (field == "rate") {
    source.rate = parse_rate(key, value);
  } else if (field == "path") {
    source.path = value;
  } else if (field == "base") {
    source.curve.base = parse_rate(key, value);
  } else if (field == "slope_low") {
    source.curve.slope_low = parse_rate(key, value);
  } else if (field == "slope_high") {
    source.curve.slope_high = parse_rate(key, value);
  } else if (field == "kink") {
    source.curve.kink = parse_rate(key, value);
    if (source.curve.kink > kRateScale) {
      throw std::runtime_error(key + " must be less than or equal to 1");
    }
  } else {
    throw std::runtime_error("unknown rate source setting: " + key);
  }
}

void apply_asset_key(OracleConfig& config, const std::string& key, const std::string& value) {
  const std::string rest = key.substr(std::string("assets.").size());
  const auto split = rest.rfind('.');
  if (split == std::string::npos) {
    throw std::runtime_error("asset settings must look like assets.<asset>.<field>: " + key);
  }

  auto& asset = asset_entry(config, rest.substr(0, split));
  const std::string field = rest.substr(split + 1);
  if (field == "source") {
    asset.rate_source = value;
  } else if (field == "capacity") {
    const auto capacity = std::stoll(value);
    // Rings start at the default capacity and never shrink.
    if (capacity < static_cast<long long>(buffer::SnapshotRing::kDefaultCapacity)) {
      throw std::runtime_error(key + " must be at least " + std::to_string(buffer::SnapshotRing::kDefaultCapacity));
    }
    if (static_cast<unsigned long long>(capacity) > buffer::SnapshotRing::kMaxCapacity) {
      throw std::runtime_error(key + " must be less than or equal to " +
                               std::to_string(buffer::SnapshotRing::kMaxCapacity));
    }
    asset.capacity = static_cast<std::size_t>(capacity);
  } else {
    throw std::runtime_error("unknown asset setting: " + key);
  }
}

void apply_key_value(OracleConfig& config, const std::string& key, const std::string& value) {
  if (key == "keeper.interval_s") {
    const auto seconds = std::stoll(value);
    if (seconds <= 0) {
      throw std::runtime_error("keeper.interval_s must be greater than 0");
    }
    if (seconds > 86400) {
      throw std::runtime_error("keeper.interval_s must be less than or equal to 86400");
    }
    config.refresh_interval = std::chrono::seconds(seconds);
    return;
  }

  if (key == "admin.callers") {
    config.admins = split_list(value);
    return;
  }

  if (key == "admin.operator") {
    config.operator_id = value;
    return;
  }

  if (key == "state.path") {
    config.state_path = value;
    return;
  }

  if (key == "agent.stdout_debug") {
    config.stdout_debug = parse_bool(value);
    return;
  }

  if (key == "redis.password") {
    config.redis.password = value;
    return;
  }

  if (key == "redis.key_prefix") {
    config.redis.key_prefix = value;
    return;
  }

  if (key == "redis.address") {
    config.redis.enabled = !value.empty();
    if (value.rfind("unix://", 0) == 0) {
      config.redis.unix_socket = value.substr(std::string("unix://").size());
      config.redis.host.clear();
      config.redis.port = 0;
      return;
    }

    if (!value.empty() && value.front() == '/') {
      config.redis.unix_socket = value;
      config.redis.host.clear();
      config.redis.port = 0;
      return;
    }

    config.redis.unix_socket.clear();
    const auto split = value.find(':');
    if (split == std::string::npos) {
      config.redis.host = value;
      return;
    }

    config.redis.host = value.substr(0, split);
    const auto parsed_port = std::stoi(value.substr(split + 1));
    if (parsed_port <= 0 || parsed_port > 65535) {
      throw std::runtime_error("redis.address port must be in range 1..65535");
    }

    config.redis.port = static_cast<std::uint16_t>(parsed_port);
    return;
  }

  if (key.rfind("sources.", 0) == 0) {
    apply_source_key(config, key, value);
    return;
  }

  if (key.rfind("assets.", 0) == 0) {
    apply_asset_key(config, key, value);
  }
}

void validate(const OracleConfig& config) {
  for (const auto& [id, source] : config.rate_sources) {
    if (source.kind == "pool_file" && source.path.empty()) {
      throw std::runtime_error("sources." + id + ".path is required for pool_file rate sources");
    }
  }
  for (const auto& asset : config.assets) {
    if (asset.rate_source.empty()) {
      throw std::runtime_error("assets." + asset.asset + ".source is required");
    }
  }
  if (!config.assets.empty() && config.operator_id.empty()) {
    throw std::runtime_error("admin.operator is required to register assets");
  }
}

}  // namespace

OracleConfig load_oracle_config(const std::string& path) {
  OracleConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections[depth] = key;
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  validate(config);
  return config;
}

}  // namespace yield_oracle::core
