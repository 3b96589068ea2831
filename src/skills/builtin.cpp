// Build-time skill manifest: every bundle compiled into the server
#include "skills/builtin.hpp"

namespace ctxmgr::skills {

std::vector<skill::SkillEntry> builtin_manifest(const Config &config) {
  auto workspace = config.workspace_dir;
  return {
      {"skills/mcp-governance",
       [workspace]() {
         return make_governance_skill(workspace);
       }},
      {"skills/chat", make_chat_skill},
  };
}

}  // namespace ctxmgr::skills
