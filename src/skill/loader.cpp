#include "skill/loader.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace ctxmgr::skill {

namespace {

void run_cleanup(const Skill &skill) {
  if (!skill.cleanup) return;
  try {
    auto future = skill.cleanup();
    if (future.valid()) future.get();
    spdlog::info("[Loader] Cleaned up skill: {}", skill.id);
  } catch (const std::exception &e) {
    spdlog::error("[Loader] Failed to cleanup skill {}: {}", skill.id, e.what());
  }
}

}  // namespace

LoadResult load_skills(const std::vector<SkillEntry> &entries, const std::vector<std::string> &disabled) {
  LoadResult result;

  spdlog::info("[Loader] {} skill bundle(s) in manifest", entries.size());

  for (const auto &entry : entries) {
    spdlog::debug("[Loader] Loading skill from: {}", entry.path);

    try {
      if (!entry.factory) {
        throw std::runtime_error("Invalid skill export: no factory");
      }

      Skill skill = entry.factory();

      if (std::find(disabled.begin(), disabled.end(), skill.id) != disabled.end()) {
        spdlog::info("[Loader] Skipping disabled skill: {}", skill.id);
        continue;
      }

      if (auto problem = validate_skill(skill)) {
        throw std::runtime_error(*problem);
      }

      if (skill.init) {
        auto future = skill.init();
        if (future.valid()) future.get();
      }

      spdlog::info("[Loader] Loaded skill: {} v{}", skill.id, skill.version);
      result.loaded.push_back(std::make_shared<const Skill>(std::move(skill)));
    } catch (const std::exception &e) {
      spdlog::error("[Loader] Failed to load skill from {}: {}", entry.path, e.what());
      result.failed.push_back({entry.path, e.what()});
    }
  }

  return result;
}

size_t register_loaded(SkillRegistry &registry, LoadResult &result) {
  std::vector<SkillPtr> registered;

  for (auto &skill : result.loaded) {
    try {
      registry.register_skill(skill);
      registered.push_back(skill);
    } catch (const RegistryError &e) {
      spdlog::error("[Loader] Skipping skill {}: {}", skill->id, e.what());
      result.failed.push_back({"skills/" + skill->id, e.what()});
      // init already ran, so the skill gets its cleanup
      run_cleanup(*skill);
    }
  }

  result.loaded = std::move(registered);
  return result.loaded.size();
}

void unload_skill(SkillRegistry &registry, const std::string &skill_id) {
  auto skill = registry.unregister_skill(skill_id);
  run_cleanup(*skill);
}

void unload_all(SkillRegistry &registry) {
  auto skills = registry.all();
  for (auto it = skills.rbegin(); it != skills.rend(); ++it) {
    try {
      unload_skill(registry, (*it)->id);
    } catch (const RegistryError &e) {
      // Already removed by someone else
      spdlog::warn("[Loader] {}", e.what());
    }
  }
}

}  // namespace ctxmgr::skill
