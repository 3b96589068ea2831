#pragma once

#include <functional>
#include <string>
#include <vector>

#include "skill/registry.hpp"
#include "skill/skill.hpp"

namespace ctxmgr::skill {

// Builds a skill bundle. May throw; the loader records the failure.
using SkillFactory = std::function<Skill()>;

// One entry of the build-time skill manifest
struct SkillEntry {
  std::string path;  // Bundle location, e.g. "skills/mcp-governance"
  SkillFactory factory;
};

struct LoadFailure {
  std::string path;
  std::string error;
};

struct LoadResult {
  std::vector<SkillPtr> loaded;
  std::vector<LoadFailure> failed;
};

// Builds, validates and initializes every entry. One bad entry never stops the others.
// Skills whose id appears in `disabled` are skipped.
LoadResult load_skills(const std::vector<SkillEntry> &entries, const std::vector<std::string> &disabled = {});

// Registers every loaded skill. Skills rejected by the registry are moved
// from result.loaded to result.failed. Returns the number registered.
size_t register_loaded(SkillRegistry &registry, LoadResult &result);

// Unregisters a skill and awaits its cleanup hook. Cleanup failures are logged.
// Throws SkillNotFound if the id is not registered.
void unload_skill(SkillRegistry &registry, const std::string &skill_id);

// Unloads every registered skill, most recently registered first
void unload_all(SkillRegistry &registry);

}  // namespace ctxmgr::skill
