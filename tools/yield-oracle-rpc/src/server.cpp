#include "rpc/server.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include "buffer/snapshot_ring.hpp"
#include "core/errors.hpp"
#include "core/fixed_point.hpp"
#include "derived/time_weighted_yield.hpp"
#include "rpc/jsonrpc.hpp"

namespace yield_oracle::rpc {

Server::Server(std::filesystem::path state_path) : state_path_(std::move(state_path)) {}

int Server::run(std::istream& in, std::ostream& out, std::ostream& err) const {
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) {
      continue;
    }

    bool should_respond = true;
    nlohmann::json response;
    try {
      const auto request = nlohmann::json::parse(line);
      response = handle_request(request, should_respond);
    } catch (const nlohmann::json::parse_error& ex) {
      err << "yield-oracle-rpc: unparseable request: " << ex.what() << '\n';
      response = make_error_response(nullptr, JsonRpcError{.code = kParseError, .message = "parse error"});
    } catch (const std::exception& ex) {
      err << "yield-oracle-rpc: failed to process request: " << ex.what() << '\n';
      response = make_error_response(nullptr, JsonRpcError{.code = kInternalError, .message = "internal error"});
    }

    if (should_respond) {
      out << response.dump() << '\n';
      out.flush();
    }
  }

  return 0;
}

nlohmann::json Server::handle_request(const nlohmann::json& request, bool& should_respond) const {
  nlohmann::json id = nullptr;
  try {
    const auto parsed = parse_request(request);
    should_respond = parsed.id.has_value();
    if (parsed.id.has_value()) {
      id = *parsed.id;
    }

    if (parsed.method == "initialize") {
      return make_result_response(id, handle_initialize());
    }
    if (parsed.method == "oracle/listAssets") {
      return make_result_response(id, handle_list_assets());
    }
    if (parsed.method == "oracle/getYield") {
      return make_result_response(id, handle_get_yield(parsed.params));
    }
    if (parsed.method == "oracle/getSnapshots") {
      return make_result_response(id, handle_get_snapshots(parsed.params));
    }

    return make_error_response(id, JsonRpcError{.code = kMethodNotFound, .message = "method not found"});
  } catch (const InvalidRequest& ex) {
    should_respond = true;
    return make_error_response(ex.id(), JsonRpcError{.code = kInvalidRequest, .message = ex.what()});
  } catch (const std::invalid_argument& ex) {
    return make_error_response(id, JsonRpcError{.code = kInvalidParams, .message = ex.what()});
  } catch (const core::OracleError& ex) {
    return make_error_response(
        id, JsonRpcError{.code = kOracleError, .message = ex.what(), .data = core::to_string(ex.kind())});
  } catch (const std::runtime_error& ex) {
    // Unreadable or inconsistent state file: the request itself was fine.
    return make_error_response(id, JsonRpcError{.code = kInternalError, .message = ex.what()});
  }
}

nlohmann::json Server::handle_initialize() const {
  return nlohmann::json{{"serverInfo", {{"name", "yield-oracle-rpc"}, {"version", "0.1.0"}}},
                        {"methods", {"oracle/listAssets", "oracle/getYield", "oracle/getSnapshots"}},
                        {"rateDecimals", core::kRateDecimals}};
}

nlohmann::json Server::handle_list_assets() const {
  const auto state = load();
  nlohmann::json assets = nlohmann::json::array();
  for (const auto& entry : state.assets) {
    assets.push_back({{"asset", entry.asset}, {"rate_source", entry.rate_source}, {"capacity", entry.slots.size()}});
  }
  return nlohmann::json{{"assets", assets}};
}

nlohmann::json Server::handle_get_yield(const nlohmann::json& params) const {
  const auto state = load();
  const auto& entry = find_asset(state, params);
  const auto ring = restore_ring(entry);
  const auto window = derived::summarize_window(ring);

  return nlohmann::json{{"asset", entry.asset},
                        {"yield", core::format_fixed(window.average)},
                        {"yield_raw", window.average},
                        {"apr_pct", core::annualized_percent(window.average)},
                        {"window",
                         {{"samples", window.samples},
                          {"total_elapsed_s", window.total_elapsed},
                          {"oldest", window.oldest},
                          {"newest", window.newest}}}};
}

nlohmann::json Server::handle_get_snapshots(const nlohmann::json& params) const {
  const auto state = load();
  const auto& entry = find_asset(state, params);

  nlohmann::json snapshots = nlohmann::json::array();
  for (const auto& slot : entry.slots) {
    const auto value = slot.value_or(model::snapshot{});
    snapshots.push_back({{"timestamp", value.timestamp}, {"rate", value.rate}});
  }
  return nlohmann::json{{"asset", entry.asset}, {"write_index", entry.write_index}, {"snapshots", snapshots}};
}

storage::OracleState Server::load() const {
  auto state = storage::load_state(state_path_);
  if (!state.has_value()) {
    return storage::OracleState{};
  }
  for (const auto& entry : state->assets) {
    (void)restore_ring(entry);
  }
  return std::move(*state);
}

buffer::SnapshotRing Server::restore_ring(const storage::AssetState& entry) const {
  try {
    return buffer::SnapshotRing::restore(entry.slots, entry.write_index);
  } catch (const std::invalid_argument& ex) {
    throw std::runtime_error("state file " + state_path_.string() + " holds an invalid ring for " + entry.asset +
                             ": " + ex.what());
  } catch (const core::OracleError& ex) {
    throw std::runtime_error("state file " + state_path_.string() + " holds an invalid ring for " + entry.asset +
                             ": " + ex.what());
  }
}

const storage::AssetState& Server::find_asset(const storage::OracleState& state, const nlohmann::json& params) const {
  const auto asset_it = params.find("asset");
  if (asset_it == params.end() || !asset_it->is_string()) {
    throw std::invalid_argument("asset must be a string");
  }

  const auto& asset = asset_it->get_ref<const std::string&>();
  for (const auto& entry : state.assets) {
    if (entry.asset == asset) {
      return entry;
    }
  }
  throw core::OracleError(core::error_kind::UNKNOWN_ASSET, "asset " + asset + " is not registered");
}

}  // namespace yield_oracle::rpc
