#pragma once

#include <filesystem>
#include <iosfwd>
#include <string>

#include <nlohmann/json.hpp>

#include "buffer/snapshot_ring.hpp"
#include "storage/state_store.hpp"

namespace yield_oracle::rpc {

// Read-only query surface over the oracle's persisted state. The state file is
// re-read for every request, so answers follow the running daemon.
class Server {
 public:
  explicit Server(std::filesystem::path state_path);

  int run(std::istream& in, std::ostream& out, std::ostream& err) const;

  // Handles one parsed request. Sets should_respond to false for notifications.
  nlohmann::json handle_request(const nlohmann::json& request, bool& should_respond) const;

 private:
  nlohmann::json handle_initialize() const;
  nlohmann::json handle_list_assets() const;
  nlohmann::json handle_get_yield(const nlohmann::json& params) const;
  nlohmann::json handle_get_snapshots(const nlohmann::json& params) const;

  // Throws std::runtime_error when the file is unreadable or any persisted
  // ring is inconsistent.
  storage::OracleState load() const;
  buffer::SnapshotRing restore_ring(const storage::AssetState& entry) const;
  const storage::AssetState& find_asset(const storage::OracleState& state, const nlohmann::json& params) const;

  std::filesystem::path state_path_;
};

}  // namespace yield_oracle::rpc
