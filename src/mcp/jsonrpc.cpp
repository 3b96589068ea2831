#include "mcp/jsonrpc.hpp"

namespace ctxmgr::mcp {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::ParseError:
      return "Parse error";
    case ErrorCode::InvalidRequest:
      return "Invalid Request";
    case ErrorCode::MethodNotFound:
      return "Method not found";
    case ErrorCode::InvalidParams:
      return "Invalid params";
    case ErrorCode::InternalError:
      return "Internal error";
    case ErrorCode::ToolExecutionError:
      return "Tool execution error";
  }
  return "Unknown error";
}

// ============================================================
// JSON-RPC 2.0 serialization
// ============================================================

json JsonRpcError::to_json() const {
  json j;
  j["code"] = code;
  j["message"] = message;
  if (data.has_value()) {
    j["data"] = *data;
  }
  return j;
}

JsonRpcResponse JsonRpcResponse::success(json id, json result) {
  JsonRpcResponse resp;
  resp.id = std::move(id);
  resp.result = std::move(result);
  return resp;
}

JsonRpcResponse JsonRpcResponse::failure(json id, ErrorCode code, std::string message, std::optional<json> data) {
  JsonRpcResponse resp;
  resp.id = std::move(id);
  resp.error = JsonRpcError{static_cast<int>(code), std::move(message), std::move(data)};
  return resp;
}

json JsonRpcResponse::to_json() const {
  json j;
  j["jsonrpc"] = "2.0";
  j["id"] = id;
  if (error.has_value()) {
    j["error"] = error->to_json();
  } else {
    j["result"] = result.value_or(json::object());
  }
  return j;
}

std::string JsonRpcResponse::serialize() const {
  // Invalid UTF-8 from a handler is replaced rather than thrown
  return to_json().dump(-1, ' ', false, json::error_handler_t::replace);
}

bool is_valid_id(const json &id) {
  return id.is_null() || id.is_number() || id.is_string();
}

}  // namespace ctxmgr::mcp
