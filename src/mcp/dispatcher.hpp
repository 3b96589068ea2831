#pragma once

#include <atomic>
#include <future>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "mcp/jsonrpc.hpp"
#include "skill/registry.hpp"

namespace ctxmgr::mcp {

using json = nlohmann::json;

// Reported by initialize
struct ServerInfo {
  std::string name = "context-manager";
  std::string version = "0.0.1";
  std::string protocol_version = "2024-11-05";
};

// Uninitialized -> Ready on the first successful initialize.
// Requests arriving before that are still served.
enum class DispatcherState { Uninitialized, Ready };

std::string to_string(DispatcherState state);

// Maps framed lines to JSON-RPC responses: initialize, tools/list, tools/call.
//
// Every call returns a future that resolves to exactly one response and never
// holds an exception. Responses that need no tool handler are ready on return;
// a tools/call response resolves when the handler finishes.
class Dispatcher {
 public:
  Dispatcher(const skill::SkillRegistry &registry, ServerInfo info);

  std::future<JsonRpcResponse> handle_line(const std::string &line);

  // Entry point for an already parsed message
  std::future<JsonRpcResponse> handle_message(const json &message);

  DispatcherState state() const {
    return state_.load();
  }

  const ServerInfo &info() const {
    return info_;
  }

  static const std::vector<std::string> &supported_methods();

 private:
  std::future<JsonRpcResponse> dispatch(const json &message);

  JsonRpcResponse handle_initialize(const JsonRpcRequest &request);
  JsonRpcResponse handle_tools_list(const JsonRpcRequest &request);
  std::future<JsonRpcResponse> handle_tools_call(const JsonRpcRequest &request);

  const skill::SkillRegistry &registry_;
  ServerInfo info_;
  std::atomic<DispatcherState> state_{DispatcherState::Uninitialized};
};

}  // namespace ctxmgr::mcp
