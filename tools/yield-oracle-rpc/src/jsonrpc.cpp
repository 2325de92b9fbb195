#include "rpc/jsonrpc.hpp"

#include <string>
#include <utility>

namespace yield_oracle::rpc {
namespace {

bool is_valid_id(const nlohmann::json& id) {
  return id.is_null() || id.is_string() || id.is_number_integer() || id.is_number_unsigned();
}

}  // namespace

InvalidRequest::InvalidRequest(const std::string& what, nlohmann::json id)
    : std::invalid_argument(what), id_(std::move(id)) {}

JsonRpcRequest parse_request(const nlohmann::json& request) {
  if (!request.is_object()) {
    throw InvalidRequest("request must be a JSON object", nullptr);
  }

  JsonRpcRequest parsed{.method = {}, .params = nlohmann::json::object(), .id = std::nullopt};

  // The id is read first so later failures can still be answered to the caller.
  if (const auto id_it = request.find("id"); id_it != request.end()) {
    if (!is_valid_id(*id_it)) {
      throw InvalidRequest("id must be a string, an integer or null", nullptr);
    }
    parsed.id = *id_it;
  }
  const nlohmann::json reply_id = parsed.id.value_or(nullptr);

  const auto version_it = request.find("jsonrpc");
  if (version_it == request.end() || !version_it->is_string() || *version_it != kJsonRpcVersion) {
    throw InvalidRequest("jsonrpc must be \"2.0\"", reply_id);
  }

  const auto method_it = request.find("method");
  if (method_it == request.end() || !method_it->is_string() || method_it->get_ref<const std::string&>().empty()) {
    throw InvalidRequest("method must be a non-empty string", reply_id);
  }
  parsed.method = method_it->get<std::string>();

  if (const auto params_it = request.find("params"); params_it != request.end() && !params_it->is_null()) {
    if (!params_it->is_object()) {
      throw InvalidRequest("params must be an object with named members", reply_id);
    }
    parsed.params = *params_it;
  }

  return parsed;
}

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result) {
  nlohmann::json response = nlohmann::json::object();
  response["jsonrpc"] = kJsonRpcVersion;
  response["id"] = id;
  response["result"] = result;
  return response;
}

nlohmann::json make_error_response(const nlohmann::json& id, const JsonRpcError& error) {
  nlohmann::json body{{"code", error.code}, {"message", error.message}};
  if (!error.data.is_null()) {
    body["data"] = error.data;
  }

  nlohmann::json response = nlohmann::json::object();
  response["jsonrpc"] = kJsonRpcVersion;
  response["id"] = id;
  response["error"] = std::move(body);
  return response;
}

}  // namespace yield_oracle::rpc
