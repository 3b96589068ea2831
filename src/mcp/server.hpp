#pragma once

#include <unistd.h>

#include <array>
#include <asio.hpp>
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <thread>

#include "mcp/dispatcher.hpp"
#include "mcp/framer.hpp"

namespace ctxmgr::mcp {

// Server lifecycle
enum class ServerState { Idle, Running, Draining, Stopped };

std::string to_string(ServerState state);

// Newline-delimited JSON-RPC over a pair of file descriptors (stdin/stdout by default).
//
// Single io_context: reads, dispatch kickoff and response writes all happen on
// the thread that calls run(). Lines are dispatched in arrival order; a
// tools/call whose handler is still running is awaited off the io thread and
// its response posted back, so responses may be written out of order.
class StdioServer {
 public:
  // The descriptors are duplicated; the caller keeps ownership of its own.
  explicit StdioServer(Dispatcher &dispatcher, int input_fd = STDIN_FILENO, int output_fd = STDOUT_FILENO);
  ~StdioServer();

  StdioServer(const StdioServer &) = delete;
  StdioServer &operator=(const StdioServer &) = delete;

  // Runs once, at the end of the shutdown sequence, on the io thread
  void on_shutdown(std::function<void()> callback);

  // Blocks until input closes, a read fails, or SIGINT/SIGTERM arrives.
  // Returns the process exit code: 0 for a normal close or signal, 1 for a stream error.
  int run();

  // Requests shutdown from any thread; pending tool calls are not awaited
  void stop(int exit_code = 0);

  ServerState state() const {
    return state_.load();
  }

 private:
  void start_read();
  void on_line(const std::string &line);
  void write_response(const JsonRpcResponse &response);

  // drain: wait for in-flight tool calls to be written before finishing
  void begin_shutdown(int exit_code, bool drain);
  void maybe_finish();
  void finish();

  // Blocks until every waiter thread has returned
  void join_waiters();

  Dispatcher &dispatcher_;

  // Shared with the threads awaiting slow tool calls
  std::shared_ptr<asio::io_context> io_;
  asio::posix::stream_descriptor input_;
  asio::posix::stream_descriptor output_;
  asio::signal_set signals_;

  std::array<char, 4096> read_buf_{};
  LineFramer framer_;

  size_t in_flight_ = 0;  // io thread only

  // One thread per tool call still running, keyed by call number; io thread only.
  // Handlers cannot be cancelled, so shutdown joins them before cleanup runs.
  std::map<uint64_t, std::thread> waiters_;
  uint64_t next_waiter_ = 0;
  int exit_code_ = 0;
  std::atomic<ServerState> state_{ServerState::Idle};
  std::atomic<bool> shutdown_requested_{false};
  std::atomic<bool> finished_{false};
  std::function<void()> shutdown_callback_;
};

}  // namespace ctxmgr::mcp
