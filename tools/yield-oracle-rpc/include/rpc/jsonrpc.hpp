#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace yield_oracle::rpc {

constexpr const char* kJsonRpcVersion = "2.0";

constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kInvalidParams = -32602;
constexpr int kMethodNotFound = -32601;
constexpr int kInternalError = -32603;
// Oracle failures; `data` carries the error kind name.
constexpr int kOracleError = -32000;

struct JsonRpcError {
  int code;
  std::string message;
  nlohmann::json data{};
};

struct JsonRpcRequest {
  std::string method;
  nlohmann::json params;
  std::optional<nlohmann::json> id;
};

// Raised for anything that is not a JSON-RPC 2.0 request. id() is the
// request id when it could be read, null otherwise.
class InvalidRequest : public std::invalid_argument {
 public:
  InvalidRequest(const std::string& what, nlohmann::json id);

  [[nodiscard]] const nlohmann::json& id() const noexcept { return id_; }

 private:
  nlohmann::json id_;
};

JsonRpcRequest parse_request(const nlohmann::json& request);

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json make_error_response(const nlohmann::json& id, const JsonRpcError& error);

}  // namespace yield_oracle::rpc
