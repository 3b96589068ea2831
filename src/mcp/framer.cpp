#include "mcp/framer.hpp"

namespace ctxmgr::mcp {

bool is_blank(std::string_view line) {
  return line.find_first_not_of(" \t\r\n\f\v") == std::string_view::npos;
}

std::vector<std::string> LineFramer::feed(std::string_view chunk) {
  std::vector<std::string> lines;
  buffer_.append(chunk.data(), chunk.size());

  size_t start = 0;
  while (true) {
    auto nl = buffer_.find('\n', start);
    if (nl == std::string::npos) break;

    std::string_view line(buffer_.data() + start, nl - start);
    if (!is_blank(line)) {
      lines.emplace_back(line);
    }
    start = nl + 1;
  }

  // Keep the remainder (possibly empty) as the new buffer
  buffer_.erase(0, start);
  return lines;
}

}  // namespace ctxmgr::mcp
