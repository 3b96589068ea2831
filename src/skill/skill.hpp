#pragma once

#include <functional>
#include <future>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "tool/schema.hpp"

namespace ctxmgr::skill {

using json = nlohmann::json;

// Tool handler. Receives input already validated against the tool's schema.
// The resolved value is either a string, a {content: [...], isError?} envelope,
// or any other JSON value (rendered as indented JSON text).
using Handler = std::function<std::future<json>(const json &input)>;

// Optional init/cleanup hook of a skill
using Hook = std::function<std::future<void>()>;

struct ToolDefinition {
  std::string name;  // Unique across the whole registry
  std::string description;
  tool::Schema input_schema = tool::Schema::object();
};

struct ToolRegistration {
  ToolDefinition definition;
  Handler handler;
};

// A named, versioned bundle of tools. Never mutated after registration.
struct Skill {
  std::string id;  // kebab-case
  std::string name;
  std::string description;
  std::string version;  // semver
  std::vector<ToolRegistration> tools;
  Hook init;     // Awaited once by the loader before the skill counts as loaded
  Hook cleanup;  // Awaited once at unload or shutdown

  const ToolRegistration *find_tool(const std::string &tool_name) const;
  std::vector<std::string> tool_names() const;
};

using SkillPtr = std::shared_ptr<const Skill>;

// Validate a skill id:
//   - 1-64 characters
//   - lowercase alphanumeric with single hyphen separators
//   - Must match: ^[a-z0-9]+(-[a-z0-9]+)*$
bool validate_skill_id(const std::string &id);

// MAJOR.MINOR.PATCH with an optional -prerelease / +build suffix
bool validate_semver(const std::string &version);

// Checks the shape of a skill; returns the first problem found
std::optional<std::string> validate_skill(const Skill &skill);

}  // namespace ctxmgr::skill
