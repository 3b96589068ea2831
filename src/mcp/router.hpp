#pragma once

#include <future>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "core/types.hpp"
#include "skill/registry.hpp"

namespace ctxmgr::mcp {

using json = nlohmann::json;

// One entry of the tools/list result
struct ToolDescriptor {
  std::string name;
  std::string description;
  json input_schema;  // {type: "object", properties, required?}

  json to_json() const;
};

// Route a tool call to the skill that owns it.
// Resolution and argument validation happen before this returns; only the
// handler itself runs behind the future. Never throws: unknown tools, schema
// violations and handler failures all resolve to a ToolResult with is_error set.
std::future<ToolResult> route_tool_call(const skill::SkillRegistry &registry, const std::string &tool_name, const json &args);

// Every tool of every registered skill, in registration order
std::vector<ToolDescriptor> list_tools(const skill::SkillRegistry &registry);

// Handler value -> ToolResult: strings become one text block, {content: [...]}
// envelopes pass through, anything else is rendered as indented JSON
ToolResult normalize_result(const json &value);

}  // namespace ctxmgr::mcp
