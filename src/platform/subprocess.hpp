#pragma once

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace platform {

class SubprocessStartError : public std::runtime_error {
 public:
  explicit SubprocessStartError(const std::string& message) : std::runtime_error(message) {}
};

enum class ReadStatus { kLine = 0, kTimeout, kEof, kIoError };

struct ReadResult {
  ReadStatus status = ReadStatus::kIoError;
  std::string line;
  std::string error;
};

struct WriteResult {
  bool ok = false;
  // Set when the child stopped reading before the whole line was accepted.
  bool timed_out = false;
  std::string error;
};

struct SubprocessOptions {
  // Called from the stderr reader thread for every complete stderr line.
  std::function<void(const std::string&)> on_stderr_line;
  std::size_t stderr_tail_lines = 20;
  std::size_t max_line_bytes = 1024 * 1024;
};

inline constexpr std::chrono::milliseconds kDefaultTerminateGrace{500};

// One child process with piped stdin/stdout/stderr. Stdout is read as
// '\n'-terminated lines; stderr is drained on a background thread and only
// kept for diagnostics.
class Subprocess {
  struct PrivateTag {
    explicit PrivateTag() = default;
  };

 public:
  // Throws SubprocessStartError when the pipes cannot be created, fork fails,
  // or the command cannot be executed.
  static std::unique_ptr<Subprocess> Start(const std::vector<std::string>& command,
                                           SubprocessOptions options = {});

  Subprocess(PrivateTag, pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd,
             SubprocessOptions options);
  ~Subprocess();

  Subprocess(const Subprocess&) = delete;
  Subprocess& operator=(const Subprocess&) = delete;

  // Gives up once `timeout` passes without the child draining its stdin; a
  // partially written line is left behind in that case.
  WriteResult WriteLine(const std::string& line, std::chrono::milliseconds timeout);

  // Blocks until a complete line, EOF, an I/O error, or the timeout. Partial
  // data stays buffered for the next call.
  ReadResult ReadLine(std::chrono::milliseconds timeout);

  // Closes stdin, sends SIGTERM, waits up to `grace`, then SIGKILL. Safe to
  // call repeatedly and on a process that has already exited.
  void Terminate(std::chrono::milliseconds grace = kDefaultTerminateGrace);

  bool IsRunning();
  pid_t pid() const { return pid_; }
  std::optional<int> exit_status() const;
  std::string StderrTail() const;

 private:
  bool ReapLocked(bool block);
  void CloseStdin();
  void StderrLoop();
  void StopStderrReader();

  const pid_t pid_;
  const SubprocessOptions options_;

  std::mutex write_mutex_;
  int stdin_fd_;

  int stdout_fd_;
  std::string read_buffer_;
  bool stdout_eof_ = false;

  mutable std::mutex state_mutex_;
  bool reaped_ = false;
  std::optional<int> exit_status_;

  int stderr_fd_;
  std::atomic<bool> stderr_stop_{false};
  std::thread stderr_thread_;
  std::once_flag stderr_join_once_;
  mutable std::mutex stderr_mutex_;
  std::deque<std::string> stderr_tail_;
};

std::string DescribeCommand(const std::vector<std::string>& command);

}  // namespace platform
