#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace ctxmgr::mcp {

using json = nlohmann::json;

// Standard JSON-RPC 2.0 error codes, plus -32000 for tool execution failures
enum class ErrorCode : int {
  ParseError = -32700,
  InvalidRequest = -32600,
  MethodNotFound = -32601,
  InvalidParams = -32602,
  InternalError = -32603,
  ToolExecutionError = -32000,
};

// "Parse error", "Invalid Request", ...
std::string to_string(ErrorCode code);

struct JsonRpcError {
  int code = 0;
  std::string message;
  std::optional<json> data;

  json to_json() const;
};

// Incoming request after envelope validation
struct JsonRpcRequest {
  json id = nullptr;  // number, string or null; echoed verbatim
  std::string method;
  json params = json::object();
};

struct JsonRpcResponse {
  json id = nullptr;
  std::optional<json> result;
  std::optional<JsonRpcError> error;

  bool ok() const {
    return !error.has_value();
  }

  static JsonRpcResponse success(json id, json result);
  static JsonRpcResponse failure(json id, ErrorCode code, std::string message, std::optional<json> data = std::nullopt);

  json to_json() const;

  // One line of compact JSON, no trailing newline
  std::string serialize() const;
};

// True for ids a request may carry: number, string or null
bool is_valid_id(const json &id);

}  // namespace ctxmgr::mcp
