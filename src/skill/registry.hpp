#pragma once

#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "skill/skill.hpp"

namespace ctxmgr::skill {

class RegistryError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class DuplicateSkillId : public RegistryError {
 public:
  explicit DuplicateSkillId(const std::string &skill_id);
};

class DuplicateToolName : public RegistryError {
 public:
  DuplicateToolName(const std::string &tool_name, const std::string &owner_id);
};

class SkillNotFound : public RegistryError {
 public:
  explicit SkillNotFound(const std::string &skill_id);
};

// Registry of loaded skills and the tool name -> owning skill mapping.
// A tool name belongs to at most one registered skill at any time; conflicting
// registrations are rejected before any state is touched.
class SkillRegistry {
 public:
  SkillRegistry() = default;
  SkillRegistry(const SkillRegistry &) = delete;
  SkillRegistry &operator=(const SkillRegistry &) = delete;

  // Throws DuplicateSkillId / DuplicateToolName; registry unchanged on failure
  void register_skill(SkillPtr skill);
  void register_skill(Skill skill);

  // Throws SkillNotFound. Returns the removed skill.
  SkillPtr unregister_skill(const std::string &skill_id);

  SkillPtr get(const std::string &skill_id) const;

  // Registration order
  std::vector<SkillPtr> all() const;

  SkillPtr find_by_tool(const std::string &tool_name) const;

  // Every registered tool name, in registration order
  std::vector<std::string> tool_names() const;

  size_t size() const;
  size_t tool_count() const;

 private:
  mutable std::mutex mutex_;
  std::vector<SkillPtr> skills_;                   // Registration order
  std::map<std::string, SkillPtr> by_id_;
  std::map<std::string, std::string> tool_owner_;  // tool name -> skill id
};

}  // namespace ctxmgr::skill
