#include "mcp/server.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <system_error>
#include <thread>

namespace ctxmgr::mcp {

namespace {

int dup_or_throw(int fd) {
  int copy = ::dup(fd);
  if (copy < 0) {
    throw std::system_error(errno, std::generic_category(), "dup(" + std::to_string(fd) + ")");
  }
  return copy;
}

std::string signal_name(int signo) {
  switch (signo) {
    case SIGINT:
      return "SIGINT";
    case SIGTERM:
      return "SIGTERM";
  }
  return "signal " + std::to_string(signo);
}

}  // namespace

std::string to_string(ServerState state) {
  switch (state) {
    case ServerState::Idle:
      return "Idle";
    case ServerState::Running:
      return "Running";
    case ServerState::Draining:
      return "Draining";
    case ServerState::Stopped:
      return "Stopped";
  }
  return "Unknown";
}

StdioServer::StdioServer(Dispatcher &dispatcher, int input_fd, int output_fd)
    : dispatcher_(dispatcher),
      io_(std::make_shared<asio::io_context>()),
      input_(*io_, dup_or_throw(input_fd)),
      output_(*io_, dup_or_throw(output_fd)),
      signals_(*io_, SIGINT, SIGTERM) {}

StdioServer::~StdioServer() {
  join_waiters();

  std::error_code ec;
  signals_.cancel(ec);
  input_.close(ec);
  output_.close(ec);
}

void StdioServer::on_shutdown(std::function<void()> callback) {
  shutdown_callback_ = std::move(callback);
}

int StdioServer::run() {
  state_ = ServerState::Running;

  signals_.async_wait([this](const std::error_code &ec, int signo) {
    if (ec) return;
    spdlog::info("[Server] Received {}, shutting down gracefully...", signal_name(signo));
    begin_shutdown(0, false);
  });

  spdlog::info("[Server] Listening on STDIO");
  start_read();
  io_->run();

  state_ = ServerState::Stopped;
  return exit_code_;
}

void StdioServer::stop(int exit_code) {
  asio::post(*io_, [this, exit_code]() {
    begin_shutdown(exit_code, false);
  });
}

// ============================================================
// Input
// ============================================================

void StdioServer::start_read() {
  input_.async_read_some(asio::buffer(read_buf_), [this](const std::error_code &ec, std::size_t n) {
    if (ec) {
      if (ec == asio::error::operation_aborted) return;

      if (!framer_.pending().empty()) {
        spdlog::warn("[Server] Discarding {} bytes of unterminated input", framer_.pending().size());
        framer_.reset();
      }

      if (ec == asio::error::eof) {
        spdlog::info("[Server] stdin closed, shutting down server");
        begin_shutdown(0, true);
      } else {
        spdlog::error("[Server] stdin error: {}", ec.message());
        begin_shutdown(1, true);
      }
      return;
    }

    for (const auto &line : framer_.feed(std::string_view(read_buf_.data(), n))) {
      on_line(line);
    }

    if (!shutdown_requested_) {
      start_read();
    }
  });
}

void StdioServer::on_line(const std::string &line) {
  auto future = dispatcher_.handle_line(line);

  if (future.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
    write_response(future.get());
    return;
  }

  // Slow path: a tool handler is involved. Await it off the io thread so the
  // read loop keeps going, then write from the io thread.
  ++in_flight_;
  auto waiter_id = next_waiter_++;
  waiters_.emplace(waiter_id, std::thread([io = io_, this, waiter_id, future = std::move(future)]() mutable {
    JsonRpcResponse response;
    try {
      response = future.get();
    } catch (const std::exception &e) {
      response = JsonRpcResponse::failure(nullptr, ErrorCode::InternalError, std::string("Internal error: ") + e.what());
    }
    asio::post(*io, [this, waiter_id, response = std::move(response)]() {
      write_response(response);
      --in_flight_;

      // The waiter has nothing left to do after posting; reap it
      auto it = waiters_.find(waiter_id);
      if (it != waiters_.end()) {
        if (it->second.joinable()) it->second.join();
        waiters_.erase(it);
      }

      maybe_finish();
    });
  }));
}

void StdioServer::join_waiters() {
  if (waiters_.empty()) return;

  spdlog::info("[Server] Waiting for {} running tool call(s) to finish", waiters_.size());
  for (auto &[id, waiter] : waiters_) {
    if (waiter.joinable()) waiter.join();
  }
  waiters_.clear();
}

// ============================================================
// Output
// ============================================================

void StdioServer::write_response(const JsonRpcResponse &response) {
  if (finished_) return;

  std::string line = response.serialize();
  line += '\n';

  // One blocking write per response on the io thread; lines never interleave
  std::error_code ec;
  asio::write(output_, asio::buffer(line), ec);
  if (ec) {
    spdlog::error("[Server] Write failed: {}", ec.message());
    begin_shutdown(1, false);
  }
}

// ============================================================
// Lifecycle
// ============================================================

void StdioServer::begin_shutdown(int exit_code, bool drain) {
  if (shutdown_requested_.exchange(true)) {
    // A second trigger (e.g. a signal while draining) cuts the drain short
    if (!drain) finish();
    return;
  }

  exit_code_ = exit_code;

  std::error_code ec;
  input_.cancel(ec);

  if (drain && in_flight_ > 0) {
    spdlog::info("[Server] Waiting for {} in-flight request(s)", in_flight_);
    state_ = ServerState::Draining;
    return;
  }
  finish();
}

void StdioServer::maybe_finish() {
  if (shutdown_requested_ && in_flight_ == 0) {
    finish();
  }
}

void StdioServer::finish() {
  if (finished_.exchange(true)) return;

  spdlog::info("[Server] Shutting down...");

  // Skills must not be cleaned up under a running handler
  join_waiters();

  if (shutdown_callback_) {
    try {
      shutdown_callback_();
    } catch (const std::exception &e) {
      spdlog::error("[Server] Error during shutdown: {}", e.what());
      exit_code_ = 1;
    }
  }

  std::error_code ec;
  signals_.cancel(ec);
  input_.close(ec);
  output_.close(ec);
  io_->stop();
}

}  // namespace ctxmgr::mcp
