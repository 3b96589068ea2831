#include "core/config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace ctxmgr {

namespace fs = std::filesystem;

namespace config_paths {

fs::path home_dir() {
  if (const char *home = std::getenv("HOME"); home && *home) {
    return fs::path(home);
  }
  return fs::temp_directory_path();
}

fs::path config_dir() {
  return home_dir() / ".config" / "context-manager";
}

fs::path config_file() {
  return config_dir() / "config.json";
}

}  // namespace config_paths

json Config::to_json() const {
  return json{
      {"name", name},
      {"version", version},
      {"protocol_version", protocol_version},
      {"workspace_dir", workspace_dir.string()},
      {"log_level", log_level},
      {"disabled_skills", disabled_skills},
  };
}

Config Config::from_json(const json &j) {
  Config config;
  if (!j.is_object()) {
    throw std::runtime_error("Config root must be a JSON object");
  }
  config.name = j.value("name", config.name);
  config.version = j.value("version", config.version);
  config.protocol_version = j.value("protocol_version", config.protocol_version);
  if (j.contains("workspace_dir") && j["workspace_dir"].is_string()) {
    config.workspace_dir = j["workspace_dir"].get<std::string>();
  }
  config.log_level = j.value("log_level", config.log_level);
  if (j.contains("disabled_skills") && j["disabled_skills"].is_array()) {
    for (const auto &id : j["disabled_skills"]) {
      if (id.is_string()) {
        config.disabled_skills.push_back(id.get<std::string>());
      }
    }
  }
  return config;
}

Config Config::load(const fs::path &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Failed to open config file: " + path.string());
  }

  json j;
  try {
    j = json::parse(file);
  } catch (const json::parse_error &e) {
    throw std::runtime_error("Failed to parse config file " + path.string() + ": " + e.what());
  }

  try {
    return from_json(j);
  } catch (const json::exception &e) {
    throw std::runtime_error("Invalid config file " + path.string() + ": " + e.what());
  }
}

Config Config::load_default() {
  auto path = config_paths::config_file();
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return Config{};
  }

  try {
    return load(path);
  } catch (const std::exception &e) {
    spdlog::warn("[Config] {}; using defaults", e.what());
    return Config{};
  }
}

void Config::save(const fs::path &path) const {
  auto parent = path.parent_path();
  if (!parent.empty()) {
    fs::create_directories(parent);
  }

  std::ofstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Failed to open config file for writing: " + path.string());
  }
  file << to_json().dump(2);
}

void Config::apply_env() {
  if (const char *dir = std::getenv("WORKSPACE_DIR"); dir && *dir) {
    workspace_dir = dir;
  }
  if (const char *level = std::getenv("CONTEXT_MANAGER_LOG_LEVEL"); level && *level) {
    log_level = level;
  }
}

}  // namespace ctxmgr
