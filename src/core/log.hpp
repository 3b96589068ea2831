#pragma once

#include <string>

namespace ctxmgr::log {

// Installs the default spdlog logger writing to stderr only.
// stdout is reserved for protocol JSON.
void init(const std::string &level = "info");

// Changes the level of the default logger; unknown names fall back to info
void set_level(const std::string &level);

}  // namespace ctxmgr::log
