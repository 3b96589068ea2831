#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace ctxmgr::mcp {

// Newline-delimited framing for the stdio transport.
// After every feed() the buffer holds either nothing or exactly the
// unterminated tail of the stream seen so far, so the emitted lines do not
// depend on where chunk boundaries fall.
class LineFramer {
 public:
  // Appends a chunk and returns every line it completed, in order.
  // Lines that are blank after trimming are dropped.
  std::vector<std::string> feed(std::string_view chunk);

  // Unterminated tail waiting for its newline
  const std::string &pending() const {
    return buffer_;
  }

  void reset() {
    buffer_.clear();
  }

 private:
  std::string buffer_;
};

// True if the line holds nothing but whitespace
bool is_blank(std::string_view line);

}  // namespace ctxmgr::mcp
