#include <spdlog/spdlog.h>

#include <fstream>
#include <future>
#include <sstream>
#include <stdexcept>

#include "skills/builtin.hpp"

namespace ctxmgr::skills {

namespace fs = std::filesystem;

using tool::Schema;

const std::vector<std::string> &todo_files() {
  static const std::vector<std::string> files = {"TODO.md", "TODO-NEXT.md", "TODO-BACKLOG.md"};
  return files;
}

Result<std::string> read_text_file(const fs::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return Result<std::string>::failure("Failed to read file " + path.string());
  }
  std::ostringstream content;
  content << file.rdbuf();
  return Result<std::string>::success(content.str());
}

Result<bool> write_text_file(const fs::path &path, const std::string &content) {
  std::error_code ec;
  auto parent = path.parent_path();
  if (!parent.empty()) {
    fs::create_directories(parent, ec);
    if (ec) {
      return Result<bool>::failure("Failed to write file " + path.string() + ": " + ec.message());
    }
  }

  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file.is_open()) {
    return Result<bool>::failure("Failed to write file " + path.string());
  }
  file << content;
  file.close();
  if (file.fail()) {
    return Result<bool>::failure("Failed to write file " + path.string());
  }
  return Result<bool>::success(true);
}

namespace {

std::string read_governance_file(const fs::path &root, const std::string &file_name) {
  spdlog::info("[mcp-governance] Reading {}", file_name);

  auto path = root / file_name;
  if (!fs::exists(path)) {
    return "File " + file_name + " does not exist.";
  }

  auto content = read_text_file(path);
  if (!content.ok()) {
    throw std::runtime_error(*content.error);
  }
  return "# " + file_name + "\n\n" + *content.value;
}

std::string update_governance_file(const fs::path &root, const std::string &file_name, const std::string &content) {
  spdlog::info("[mcp-governance] Updating {}", file_name);

  auto written = write_text_file(root / file_name, content);
  if (!written.ok()) {
    throw std::runtime_error(*written.error);
  }
  return "Successfully updated " + file_name;
}

Schema todo_file_schema() {
  return Schema::string().one_of(todo_files());
}

}  // namespace

skill::Skill make_governance_skill(fs::path workspace_dir) {
  skill::Skill skill;
  skill.id = "mcp-governance";
  skill.name = "MCP Governance";
  skill.description = "Manages project governance files (TODO.md, CONTEXT-SESSION.md) for session tracking and task management";
  skill.version = "1.0.0";

  skill.tools.push_back({
      {"read_todo",
       "Read TODO file contents (TODO.md, TODO-NEXT.md, or TODO-BACKLOG.md)",
       Schema::object({{"file", todo_file_schema().optional().describe("Which TODO file to read (defaults to TODO.md)")}})},
      [root = workspace_dir](const json &input) {
        return std::async(std::launch::async, [root, input]() -> json {
          return read_governance_file(root, input.value("file", "TODO.md"));
        });
      },
  });

  skill.tools.push_back({
      {"update_todo",
       "Update TODO file with new content",
       Schema::object({
           {"file", todo_file_schema().describe("Which TODO file to update")},
           {"content", Schema::string().describe("New content for the TODO file")},
       })},
      [root = workspace_dir](const json &input) {
        return std::async(std::launch::async, [root, input]() -> json {
          return update_governance_file(root, input["file"].get<std::string>(), input["content"].get<std::string>());
        });
      },
  });

  skill.tools.push_back({
      {"read_context", "Read CONTEXT-SESSION.md file contents", Schema::object()},
      [root = workspace_dir](const json &) {
        return std::async(std::launch::async, [root]() -> json {
          return read_governance_file(root, kContextFile);
        });
      },
  });

  skill.tools.push_back({
      {"update_context",
       "Update CONTEXT-SESSION.md file with new content",
       Schema::object({{"content", Schema::string().describe("New content for CONTEXT-SESSION.md")}})},
      [root = workspace_dir](const json &input) {
        return std::async(std::launch::async, [root, input]() -> json {
          return update_governance_file(root, kContextFile, input["content"].get<std::string>());
        });
      },
  });

  return skill;
}

}  // namespace ctxmgr::skills
