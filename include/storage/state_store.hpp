#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "model/snapshot.hpp"

namespace yield_oracle::storage {

inline constexpr std::uint32_t kStateVersion = 1;

struct AssetState {
  std::string asset;
  std::string rate_source;
  std::size_t write_index{0};
  std::vector<std::optional<model::snapshot>> slots;
};

// Registry and rings in registration order.
struct OracleState {
  std::uint32_t version{kStateVersion};
  std::vector<AssetState> assets;
};

nlohmann::json to_json(const OracleState& state);
// Throws std::runtime_error on a document that does not describe a state.
OracleState from_json(const nlohmann::json& document);

// Writes to a temp file beside `path` and renames it into place.
bool save_state(const std::filesystem::path& path, const OracleState& state, std::string* error = nullptr);

// Empty when `path` does not exist. Throws std::runtime_error on unreadable or malformed files.
std::optional<OracleState> load_state(const std::filesystem::path& path);

}  // namespace yield_oracle::storage
