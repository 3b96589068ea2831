#include "skill/registry.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

namespace ctxmgr::skill {

DuplicateSkillId::DuplicateSkillId(const std::string &skill_id) : RegistryError("Skill already registered: " + skill_id) {}

DuplicateToolName::DuplicateToolName(const std::string &tool_name, const std::string &owner_id)
    : RegistryError("Tool \"" + tool_name + "\" already registered by skill \"" + owner_id + "\"") {}

SkillNotFound::SkillNotFound(const std::string &skill_id) : RegistryError("Skill not found: " + skill_id) {}

void SkillRegistry::register_skill(Skill skill) {
  register_skill(std::make_shared<const Skill>(std::move(skill)));
}

void SkillRegistry::register_skill(SkillPtr skill) {
  if (!skill) {
    throw RegistryError("Cannot register a null skill");
  }

  std::lock_guard<std::mutex> lock(mutex_);

  if (by_id_.count(skill->id)) {
    throw DuplicateSkillId(skill->id);
  }

  // Check every tool name before inserting anything
  std::set<std::string> incoming;
  for (const auto &tool : skill->tools) {
    const auto &name = tool.definition.name;
    auto it = tool_owner_.find(name);
    if (it != tool_owner_.end()) {
      throw DuplicateToolName(name, it->second);
    }
    if (!incoming.insert(name).second) {
      throw DuplicateToolName(name, skill->id);
    }
  }

  skills_.push_back(skill);
  by_id_[skill->id] = skill;
  for (const auto &name : incoming) {
    tool_owner_[name] = skill->id;
  }

  spdlog::info("[Registry] Registered skill: {} ({} tools)", skill->id, skill->tools.size());
}

SkillPtr SkillRegistry::unregister_skill(const std::string &skill_id) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = by_id_.find(skill_id);
  if (it == by_id_.end()) {
    throw SkillNotFound(skill_id);
  }

  SkillPtr skill = it->second;
  for (const auto &tool : skill->tools) {
    tool_owner_.erase(tool.definition.name);
  }
  by_id_.erase(it);
  skills_.erase(std::remove(skills_.begin(), skills_.end(), skill), skills_.end());

  spdlog::info("[Registry] Unregistered skill: {}", skill_id);
  return skill;
}

SkillPtr SkillRegistry::get(const std::string &skill_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = by_id_.find(skill_id);
  if (it != by_id_.end()) {
    return it->second;
  }
  return nullptr;
}

std::vector<SkillPtr> SkillRegistry::all() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return skills_;
}

SkillPtr SkillRegistry::find_by_tool(const std::string &tool_name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto owner = tool_owner_.find(tool_name);
  if (owner == tool_owner_.end()) {
    return nullptr;
  }
  auto it = by_id_.find(owner->second);
  if (it != by_id_.end()) {
    return it->second;
  }
  return nullptr;
}

std::vector<std::string> SkillRegistry::tool_names() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> names;
  names.reserve(tool_owner_.size());
  for (const auto &skill : skills_) {
    for (const auto &tool : skill->tools) {
      names.push_back(tool.definition.name);
    }
  }
  return names;
}

size_t SkillRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return by_id_.size();
}

size_t SkillRegistry::tool_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tool_owner_.size();
}

}  // namespace ctxmgr::skill
