#include "skill/skill.hpp"

#include <regex>
#include <set>

namespace ctxmgr::skill {

const ToolRegistration *Skill::find_tool(const std::string &tool_name) const {
  for (const auto &tool : tools) {
    if (tool.definition.name == tool_name) {
      return &tool;
    }
  }
  return nullptr;
}

std::vector<std::string> Skill::tool_names() const {
  std::vector<std::string> names;
  names.reserve(tools.size());
  for (const auto &tool : tools) {
    names.push_back(tool.definition.name);
  }
  return names;
}

bool validate_skill_id(const std::string &id) {
  if (id.empty() || id.size() > 64) {
    return false;
  }
  static const std::regex pattern("^[a-z0-9]+(-[a-z0-9]+)*$");
  return std::regex_match(id, pattern);
}

bool validate_semver(const std::string &version) {
  static const std::regex pattern(R"(^(0|[1-9]\d*)\.(0|[1-9]\d*)\.(0|[1-9]\d*)(-[0-9A-Za-z.-]+)?(\+[0-9A-Za-z.-]+)?$)");
  return std::regex_match(version, pattern);
}

std::optional<std::string> validate_skill(const Skill &skill) {
  if (skill.id.empty()) return "Invalid skill: missing id";
  if (!validate_skill_id(skill.id)) return "Invalid skill id '" + skill.id + "': must be kebab-case";
  if (skill.name.empty()) return "Invalid skill '" + skill.id + "': missing name";
  if (skill.description.empty()) return "Invalid skill '" + skill.id + "': missing description";
  if (skill.version.empty()) return "Invalid skill '" + skill.id + "': missing version";
  if (!validate_semver(skill.version)) return "Invalid skill '" + skill.id + "': version '" + skill.version + "' is not semver";
  if (skill.tools.empty()) return "Invalid skill '" + skill.id + "': must provide at least one tool";

  std::set<std::string> seen;
  for (const auto &registration : skill.tools) {
    const auto &name = registration.definition.name;
    if (name.empty()) return "Invalid skill '" + skill.id + "': tool with empty name";
    if (!registration.handler) return "Invalid skill '" + skill.id + "': tool '" + name + "' has no handler";
    if (registration.definition.input_schema.kind() != tool::SchemaKind::Object) {
      return "Invalid skill '" + skill.id + "': input schema of tool '" + name + "' must be an object";
    }
    if (!seen.insert(name).second) return "Invalid skill '" + skill.id + "': tool '" + name + "' declared twice";
  }
  return std::nullopt;
}

}  // namespace ctxmgr::skill
