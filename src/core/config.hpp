#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace ctxmgr {

using json = nlohmann::json;

namespace config_paths {

std::filesystem::path home_dir();

// ~/.config/context-manager
std::filesystem::path config_dir();

// ~/.config/context-manager/config.json
std::filesystem::path config_file();

}  // namespace config_paths

// Server configuration, persisted as JSON
struct Config {
  std::string name = "context-manager";
  std::string version = "0.0.1";
  std::string protocol_version = "2024-11-05";
  std::filesystem::path workspace_dir = std::filesystem::current_path();
  std::string log_level = "info";
  std::vector<std::string> disabled_skills;

  // Throws std::runtime_error if the file cannot be read or parsed
  static Config load(const std::filesystem::path &path);

  // Reads config_paths::config_file() when it exists, defaults otherwise. Never throws.
  static Config load_default();

  void save(const std::filesystem::path &path) const;

  // WORKSPACE_DIR and CONTEXT_MANAGER_LOG_LEVEL take precedence over the file
  void apply_env();

  json to_json() const;
  static Config from_json(const json &j);
};

}  // namespace ctxmgr
