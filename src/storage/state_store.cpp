#include "storage/state_store.hpp"

#include <atomic>
#include <chrono>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace yield_oracle::storage {
namespace {

std::atomic<std::uint64_t> g_temp_counter{0};

std::filesystem::path make_temp_path(const std::filesystem::path& target) {
  const auto nonce = g_temp_counter.fetch_add(1, std::memory_order_relaxed);
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  return target.parent_path() /
         (target.filename().string() + ".tmp." + std::to_string(now) + "." + std::to_string(nonce));
}

const nlohmann::json& require_field(const nlohmann::json& object, const char* name) {
  const auto it = object.find(name);
  if (it == object.end()) {
    throw std::runtime_error(std::string("state document missing field '") + name + "'");
  }
  return *it;
}

}  // namespace

nlohmann::json to_json(const OracleState& state) {
  nlohmann::json assets = nlohmann::json::array();
  for (const auto& asset : state.assets) {
    nlohmann::json slots = nlohmann::json::array();
    for (const auto& slot : asset.slots) {
      if (slot.has_value()) {
        slots.push_back({{"timestamp", slot->timestamp}, {"rate", slot->rate}});
      } else {
        slots.push_back(nullptr);
      }
    }
    assets.push_back({{"asset", asset.asset},
                      {"rate_source", asset.rate_source},
                      {"capacity", asset.slots.size()},
                      {"write_index", asset.write_index},
                      {"slots", slots}});
  }
  return nlohmann::json{{"version", state.version}, {"assets", assets}};
}

OracleState from_json(const nlohmann::json& document) {
  if (!document.is_object()) {
    throw std::runtime_error("state document must be a JSON object");
  }

  OracleState state{};
  try {
    state.version = require_field(document, "version").get<std::uint32_t>();
    if (state.version != kStateVersion) {
      throw std::runtime_error("unsupported state version " + std::to_string(state.version));
    }

    for (const auto& entry : require_field(document, "assets")) {
      AssetState asset{};
      asset.asset = require_field(entry, "asset").get<std::string>();
      asset.rate_source = require_field(entry, "rate_source").get<std::string>();
      asset.write_index = require_field(entry, "write_index").get<std::size_t>();
      for (const auto& slot : require_field(entry, "slots")) {
        if (slot.is_null()) {
          asset.slots.emplace_back(std::nullopt);
          continue;
        }
        asset.slots.emplace_back(model::snapshot{require_field(slot, "timestamp").get<model::timestamp_t>(),
                                                 require_field(slot, "rate").get<model::rate_t>()});
      }
      if (asset.slots.size() != require_field(entry, "capacity").get<std::size_t>()) {
        throw std::runtime_error("state for asset " + asset.asset + " has capacity/slot count mismatch");
      }
      state.assets.push_back(std::move(asset));
    }
  } catch (const nlohmann::json::exception& ex) {
    throw std::runtime_error(std::string("malformed state document: ") + ex.what());
  }
  return state;
}

bool save_state(const std::filesystem::path& path, const OracleState& state, std::string* error) {
  const auto parent = path.parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      if (error != nullptr) {
        *error = "create_directories failed: " + ec.message();
      }
      return false;
    }
  }

  const auto tmp_path = make_temp_path(path);
  {
    std::ofstream out(tmp_path, std::ios::trunc);
    if (!out.is_open()) {
      if (error != nullptr) {
        *error = "failed to open temp file for write";
      }
      return false;
    }
    out << to_json(state).dump(2) << '\n';
    out.flush();
    if (!out.good()) {
      out.close();
      std::error_code ec;
      std::filesystem::remove(tmp_path, ec);
      if (error != nullptr) {
        *error = "flush failed";
      }
      return false;
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    if (error != nullptr) {
      *error = "rename failed: " + ec.message();
    }
    std::error_code remove_ec;
    std::filesystem::remove(tmp_path, remove_ec);
    return false;
  }
  return true;
}

std::optional<OracleState> load_state(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return std::nullopt;
  }

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open state file: " + path.string());
  }

  nlohmann::json document;
  try {
    document = nlohmann::json::parse(input);
  } catch (const nlohmann::json::parse_error& ex) {
    throw std::runtime_error("unable to parse state file " + path.string() + ": " + ex.what());
  }
  return from_json(document);
}

}  // namespace yield_oracle::storage
