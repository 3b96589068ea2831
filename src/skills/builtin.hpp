#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/types.hpp"
#include "skill/loader.hpp"
#include "skill/skill.hpp"

namespace ctxmgr::skills {

// ============================================================================
// mcp-governance: TODO.md / TODO-NEXT.md / TODO-BACKLOG.md / CONTEXT-SESSION.md
// ============================================================================

inline constexpr const char *kContextFile = "CONTEXT-SESSION.md";

const std::vector<std::string> &todo_files();

// Files are resolved against workspace_dir
skill::Skill make_governance_skill(std::filesystem::path workspace_dir);

// File helpers shared by the governance handlers
Result<std::string> read_text_file(const std::filesystem::path &path);
Result<bool> write_text_file(const std::filesystem::path &path, const std::string &content);

// ============================================================================
// chat: echo
// ============================================================================

skill::Skill make_chat_skill();

// ============================================================================
// Manifest
// ============================================================================

// Every skill bundle compiled into the server
std::vector<skill::SkillEntry> builtin_manifest(const Config &config);

}  // namespace ctxmgr::skills
