#include "mcp/dispatcher.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

#include "mcp/router.hpp"

namespace ctxmgr::mcp {

namespace {

std::future<JsonRpcResponse> ready(JsonRpcResponse response) {
  std::promise<JsonRpcResponse> promise;
  promise.set_value(std::move(response));
  return promise.get_future();
}

std::string join(const std::vector<std::string> &items, const std::string &sep) {
  std::string out;
  for (const auto &item : items) {
    if (!out.empty()) out += sep;
    out += item;
  }
  return out;
}

JsonRpcResponse internal_error(const json &id, const std::string &message) {
  spdlog::error("[Dispatcher] Internal error: {}", message);
  return JsonRpcResponse::failure(id, ErrorCode::InternalError, "Internal error: " + message);
}

}  // namespace

std::string to_string(DispatcherState state) {
  switch (state) {
    case DispatcherState::Uninitialized:
      return "Uninitialized";
    case DispatcherState::Ready:
      return "Ready";
  }
  return "Unknown";
}

const std::vector<std::string> &Dispatcher::supported_methods() {
  static const std::vector<std::string> methods = {"initialize", "tools/list", "tools/call"};
  return methods;
}

Dispatcher::Dispatcher(const skill::SkillRegistry &registry, ServerInfo info) : registry_(registry), info_(std::move(info)) {}

std::future<JsonRpcResponse> Dispatcher::handle_line(const std::string &line) {
  json message;
  try {
    message = json::parse(line);
  } catch (const json::parse_error &e) {
    spdlog::warn("[Dispatcher] Parse error for line: {}", line);
    return ready(JsonRpcResponse::failure(nullptr, ErrorCode::ParseError, to_string(ErrorCode::ParseError), json(e.what())));
  }
  return handle_message(message);
}

std::future<JsonRpcResponse> Dispatcher::handle_message(const json &message) {
  // The id is recovered separately so even the backstop can echo it
  json id = nullptr;
  if (message.is_object() && message.contains("id") && is_valid_id(message["id"])) {
    id = message["id"];
  }

  try {
    return dispatch(message);
  } catch (const std::exception &e) {
    return ready(internal_error(id, e.what()));
  } catch (...) {
    return ready(internal_error(id, "unknown exception"));
  }
}

std::future<JsonRpcResponse> Dispatcher::dispatch(const json &message) {
  if (!message.is_object()) {
    return ready(JsonRpcResponse::failure(nullptr, ErrorCode::InvalidRequest, "Invalid Request: message must be a JSON object"));
  }

  JsonRpcRequest request;
  if (message.contains("id")) {
    if (!is_valid_id(message["id"])) {
      return ready(JsonRpcResponse::failure(nullptr, ErrorCode::InvalidRequest, "Invalid Request: id must be a number, string or null"));
    }
    request.id = message["id"];
  }

  auto version = message.find("jsonrpc");
  if (version == message.end() || !version->is_string() || version->get<std::string>() != "2.0") {
    return ready(JsonRpcResponse::failure(request.id, ErrorCode::InvalidRequest, "Invalid Request: jsonrpc must be '2.0'"));
  }

  auto method = message.find("method");
  if (method == message.end() || !method->is_string() || method->get<std::string>().empty()) {
    return ready(
        JsonRpcResponse::failure(request.id, ErrorCode::InvalidRequest, "Invalid Request: method is required and must be a string"));
  }
  request.method = method->get<std::string>();
  request.params = message.value("params", json::object());

  if (request.method == "initialize") {
    spdlog::info("[Dispatcher] Received initialize request");
  } else if (state_.load() != DispatcherState::Ready) {
    spdlog::warn("[Dispatcher] Received {} before initialization (state: {})", request.method, to_string(state_.load()));
  }

  if (request.method == "initialize") {
    return ready(handle_initialize(request));
  }
  if (request.method == "tools/list") {
    return ready(handle_tools_list(request));
  }
  if (request.method == "tools/call") {
    return handle_tools_call(request);
  }

  return ready(JsonRpcResponse::failure(request.id,
                                        ErrorCode::MethodNotFound,
                                        "Method not found: " + request.method + ". Supported methods: " + join(supported_methods(), ", ")));
}

JsonRpcResponse Dispatcher::handle_initialize(const JsonRpcRequest &request) {
  json result = {
      {"protocolVersion", info_.protocol_version},
      {"capabilities", {{"tools", json::object()}}},
      {"serverInfo", {{"name", info_.name}, {"version", info_.version}}},
  };

  if (state_.exchange(DispatcherState::Ready) != DispatcherState::Ready) {
    spdlog::info("[Dispatcher] Server successfully initialized");
  }
  return JsonRpcResponse::success(request.id, std::move(result));
}

JsonRpcResponse Dispatcher::handle_tools_list(const JsonRpcRequest &request) {
  json tools = json::array();
  for (const auto &tool : list_tools(registry_)) {
    tools.push_back(tool.to_json());
  }
  return JsonRpcResponse::success(request.id, json{{"tools", std::move(tools)}});
}

std::future<JsonRpcResponse> Dispatcher::handle_tools_call(const JsonRpcRequest &request) {
  const auto &params = request.params;
  if (!params.is_object() || !params.contains("name") || !params["name"].is_string() || params["name"].get<std::string>().empty()) {
    return ready(JsonRpcResponse::failure(request.id, ErrorCode::InvalidParams, "Invalid params: tool name is required"));
  }
  std::string tool_name = params["name"].get<std::string>();

  // Recomputed on every call so tools registered after initialize are callable
  auto available = registry_.tool_names();
  if (std::find(available.begin(), available.end(), tool_name) == available.end()) {
    return ready(JsonRpcResponse::failure(request.id,
                                          ErrorCode::InvalidParams,
                                          "Invalid params: unknown tool '" + tool_name + "'. Available tools: " + join(available, ", "),
                                          json{{"availableTools", available}}));
  }

  json args = json::object();
  if (params.contains("arguments") && !params["arguments"].is_null()) {
    args = params["arguments"];
  }

  spdlog::info("[Dispatcher] Tool call: {}", tool_name);

  std::future<ToolResult> pending;
  try {
    pending = route_tool_call(registry_, tool_name, args);
  } catch (const std::exception &e) {
    return ready(JsonRpcResponse::failure(request.id,
                                          ErrorCode::ToolExecutionError,
                                          std::string("Tool execution error: ") + e.what(),
                                          json{{"tool", tool_name}, {"originalError", e.what()}}));
  }

  return std::async(std::launch::deferred, [id = request.id, tool_name, pending = std::move(pending)]() mutable -> JsonRpcResponse {
    try {
      return JsonRpcResponse::success(id, pending.get().to_json());
    } catch (const std::exception &e) {
      spdlog::error("[Dispatcher] Router failed for {}: {}", tool_name, e.what());
      return JsonRpcResponse::failure(id,
                                      ErrorCode::ToolExecutionError,
                                      std::string("Tool execution error: ") + e.what(),
                                      json{{"tool", tool_name}, {"originalError", e.what()}});
    } catch (...) {
      return internal_error(id, "unknown exception in " + tool_name);
    }
  });
}

}  // namespace ctxmgr::mcp
