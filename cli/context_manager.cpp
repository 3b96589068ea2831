// context-manager: skill-driven MCP server over stdio
#include <spdlog/spdlog.h>

#include <csignal>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

#include "core/config.hpp"
#include "core/log.hpp"
#include "mcp/dispatcher.hpp"
#include "mcp/server.hpp"
#include "skill/loader.hpp"
#include "skill/registry.hpp"
#include "skills/builtin.hpp"

using namespace ctxmgr;

namespace fs = std::filesystem;

namespace {

struct CliOptions {
  std::optional<fs::path> config_path;
  std::optional<std::string> workspace_dir;
  std::optional<std::string> log_level;
  bool show_help = false;
  bool show_version = false;
};

void print_usage(std::ostream &out) {
  out << "Usage: context-manager [options]\n"
      << "\n"
      << "Skill-driven MCP server speaking newline-delimited JSON-RPC 2.0 on stdin/stdout.\n"
      << "\n"
      << "Options:\n"
      << "  --config <path>      Config file (default: ~/.config/context-manager/config.json)\n"
      << "  --workspace <dir>    Directory holding TODO.md and CONTEXT-SESSION.md (env: WORKSPACE_DIR)\n"
      << "  --log-level <level>  trace, debug, info, warn, error, critical, off (env: CONTEXT_MANAGER_LOG_LEVEL)\n"
      << "  --version            Print version and exit\n"
      << "  -h, --help           Show this help\n";
}

// Returns nullopt on a malformed command line
std::optional<CliOptions> parse_args(int argc, char *argv[]) {
  CliOptions opts;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto next = [&]() -> std::optional<std::string> {
      if (i + 1 >= argc) {
        std::cerr << "Error: " << arg << " requires a value\n";
        return std::nullopt;
      }
      return std::string(argv[++i]);
    };

    if (arg == "-h" || arg == "--help") {
      opts.show_help = true;
    } else if (arg == "--version") {
      opts.show_version = true;
    } else if (arg == "--config") {
      auto v = next();
      if (!v) return std::nullopt;
      opts.config_path = *v;
    } else if (arg == "--workspace") {
      auto v = next();
      if (!v) return std::nullopt;
      opts.workspace_dir = *v;
    } else if (arg == "--log-level") {
      auto v = next();
      if (!v) return std::nullopt;
      opts.log_level = *v;
    } else {
      std::cerr << "Error: unknown option " << arg << "\n";
      return std::nullopt;
    }
  }
  return opts;
}

}  // namespace

int main(int argc, char *argv[]) {
  // A client that goes away must surface as a write error, not kill the process
  std::signal(SIGPIPE, SIG_IGN);

  auto opts = parse_args(argc, argv);
  if (!opts) {
    print_usage(std::cerr);
    return 1;
  }
  if (opts->show_help) {
    print_usage(std::cerr);
    return 0;
  }

  log::init();

  // ===== Configuration: file < environment < command line =====
  Config config;
  try {
    config = opts->config_path ? Config::load(*opts->config_path) : Config::load_default();
  } catch (const std::exception &e) {
    spdlog::critical("[Server] {}", e.what());
    return 1;
  }
  config.apply_env();
  if (opts->workspace_dir) config.workspace_dir = *opts->workspace_dir;
  if (opts->log_level) config.log_level = *opts->log_level;

  if (opts->show_version) {
    std::cout << config.name << " " << config.version << "\n";
    return 0;
  }

  log::set_level(config.log_level);

  spdlog::info("[Server] === SERVER MAIN START ===");
  spdlog::info("[Server] Version: {}", config.version);
  spdlog::info("[Server] CWD: {}", fs::current_path().string());
  spdlog::info("[Server] Workspace: {}", config.workspace_dir.string());

  try {
    // ===== Skills =====
    skill::SkillRegistry registry;
    auto loaded = skill::load_skills(skills::builtin_manifest(config), config.disabled_skills);
    skill::register_loaded(registry, loaded);

    if (!loaded.failed.empty()) {
      spdlog::error("[Server] Failed to load {} skill(s)", loaded.failed.size());
    }
    spdlog::info("[Server] Loaded {} skill(s) with {} tool(s)", registry.size(), registry.tool_count());
    for (const auto &skill : registry.all()) {
      std::string names;
      for (const auto &name : skill->tool_names()) {
        if (!names.empty()) names += ", ";
        names += name;
      }
      spdlog::info("[Server]   - {}: {}", skill->id, names);
    }

    // ===== Transport =====
    mcp::Dispatcher dispatcher(registry, mcp::ServerInfo{config.name, config.version, config.protocol_version});
    mcp::StdioServer server(dispatcher);
    server.on_shutdown([&registry]() {
      skill::unload_all(registry);
    });

    spdlog::info("[Server] === SERVER READY ===");
    int code = server.run();
    spdlog::info("[Server] Exited with code {}", code);
    return code;
  } catch (const std::exception &e) {
    spdlog::critical("[Server] === SERVER FAILED === {}", e.what());
    return 1;
  }
}
