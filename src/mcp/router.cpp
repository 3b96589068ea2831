#include "mcp/router.hpp"

#include <spdlog/spdlog.h>

namespace ctxmgr::mcp {

namespace {

std::future<ToolResult> ready(ToolResult result) {
  std::promise<ToolResult> promise;
  promise.set_value(std::move(result));
  return promise.get_future();
}

ToolResult failure(const std::string &tool_name, const std::string &message) {
  spdlog::error("[Router] Error executing {}: {}", tool_name, message);
  return ToolResult::error("Error: " + message);
}

}  // namespace

json ToolDescriptor::to_json() const {
  return json{{"name", name}, {"description", description}, {"inputSchema", input_schema}};
}

ToolResult normalize_result(const json &value) {
  if (value.is_string()) {
    return ToolResult::success(value.get<std::string>());
  }
  if (ToolResult::is_envelope(value)) {
    return ToolResult::from_json(value);
  }
  return ToolResult::success(value.dump(2));
}

std::future<ToolResult> route_tool_call(const skill::SkillRegistry &registry, const std::string &tool_name, const json &args) {
  spdlog::debug("[Router] Routing tool call: {}", tool_name);

  auto skill = registry.find_by_tool(tool_name);
  if (!skill) {
    return ready(failure(tool_name, "Unknown tool: " + tool_name));
  }

  const auto *registration = skill->find_tool(tool_name);
  if (!registration) {
    spdlog::error("[Router] Registry maps '{}' to skill '{}' which does not declare it", tool_name, skill->id);
    return ready(failure(tool_name, "Tool handler not found: " + tool_name));
  }

  json input;
  try {
    input = registration->definition.input_schema.validate(args);
  } catch (const tool::SchemaError &e) {
    return ready(failure(tool_name, e.what()));
  }

  spdlog::debug("[Router] Executing {} from skill {}", tool_name, skill->id);

  std::future<json> pending;
  try {
    pending = registration->handler(input);
  } catch (const std::exception &e) {
    return ready(failure(tool_name, e.what()));
  } catch (...) {
    // Handlers may throw values that are not std::exception
    return ready(failure(tool_name, "unknown error"));
  }

  if (!pending.valid()) {
    return ready(failure(tool_name, "Handler for " + tool_name + " returned no result"));
  }

  // The skill is captured so its handler state outlives a concurrent unregister
  return std::async(std::launch::deferred, [skill, tool_name, pending = std::move(pending)]() mutable -> ToolResult {
    try {
      return normalize_result(pending.get());
    } catch (const std::exception &e) {
      return failure(tool_name, e.what());
    } catch (...) {
      return failure(tool_name, "unknown error");
    }
  });
}

std::vector<ToolDescriptor> list_tools(const skill::SkillRegistry &registry) {
  std::vector<ToolDescriptor> tools;
  for (const auto &skill : registry.all()) {
    for (const auto &tool : skill->tools) {
      const auto &def = tool.definition;
      tools.push_back({def.name, def.description, def.input_schema.to_json_schema()});
    }
  }
  return tools;
}

}  // namespace ctxmgr::mcp
