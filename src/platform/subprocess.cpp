#include "platform/subprocess.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

namespace platform {
namespace {

constexpr std::size_t kReadChunk = 4096;
constexpr auto kReapPollInterval = std::chrono::milliseconds(10);
constexpr int kStderrPollMillis = 100;

std::once_flag g_sigpipe_once;

std::string ErrnoText(int error) { return std::strerror(error); }

void CloseFd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

class PipePair {
 public:
  PipePair() {
    if (::pipe2(fds_, O_CLOEXEC) != 0) {
      throw SubprocessStartError("pipe2 failed: " + ErrnoText(errno));
    }
  }
  ~PipePair() {
    CloseFd(fds_[0]);
    CloseFd(fds_[1]);
  }

  PipePair(const PipePair&) = delete;
  PipePair& operator=(const PipePair&) = delete;

  int read_end() const { return fds_[0]; }
  int write_end() const { return fds_[1]; }
  int ReleaseRead() { return std::exchange(fds_[0], -1); }
  int ReleaseWrite() { return std::exchange(fds_[1], -1); }
  void CloseRead() { CloseFd(fds_[0]); }
  void CloseWrite() { CloseFd(fds_[1]); }

 private:
  int fds_[2] = {-1, -1};
};

int MillisUntil(std::chrono::steady_clock::time_point deadline) {
  const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
  if (remaining.count() <= 0) {
    return 0;
  }
  // Round up so a sub-millisecond remainder does not spin.
  return static_cast<int>(remaining.count()) + 1;
}

bool PopLine(std::string& buffer, std::string& line) {
  const auto newline = buffer.find('\n');
  if (newline == std::string::npos) {
    return false;
  }
  line = buffer.substr(0, newline);
  buffer.erase(0, newline + 1);
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  return true;
}

}  // namespace

std::string DescribeCommand(const std::vector<std::string>& command) {
  std::string text;
  for (const auto& part : command) {
    if (!text.empty()) {
      text.push_back(' ');
    }
    text += part;
  }
  return text;
}

std::unique_ptr<Subprocess> Subprocess::Start(const std::vector<std::string>& command,
                                              SubprocessOptions options) {
  if (command.empty() || command.front().empty()) {
    throw SubprocessStartError("launch command is empty");
  }
  // A tool that exits mid-write must surface as EPIPE, not kill the host.
  std::call_once(g_sigpipe_once, [] { ::signal(SIGPIPE, SIG_IGN); });

  PipePair stdin_pipe;
  PipePair stdout_pipe;
  PipePair stderr_pipe;
  PipePair exec_status;

  std::vector<char*> argv;
  argv.reserve(command.size() + 1);
  for (const auto& part : command) {
    argv.push_back(const_cast<char*>(part.c_str()));
  }
  argv.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) {
    throw SubprocessStartError("fork failed: " + ErrnoText(errno));
  }

  if (pid == 0) {
    // Only async-signal-safe calls between fork and exec.
    ::signal(SIGPIPE, SIG_DFL);
    if (::dup2(stdin_pipe.read_end(), STDIN_FILENO) < 0 ||
        ::dup2(stdout_pipe.write_end(), STDOUT_FILENO) < 0 ||
        ::dup2(stderr_pipe.write_end(), STDERR_FILENO) < 0) {
      const int error = errno;
      (void)!::write(exec_status.write_end(), &error, sizeof(error));
      ::_exit(127);
    }
    ::execvp(argv[0], argv.data());
    const int error = errno;
    (void)!::write(exec_status.write_end(), &error, sizeof(error));
    ::_exit(127);
  }

  stdin_pipe.CloseRead();
  stdout_pipe.CloseWrite();
  stderr_pipe.CloseWrite();
  exec_status.CloseWrite();

  // The status pipe is close-on-exec: EOF means exec succeeded, an int means
  // it failed with that errno.
  int exec_error = 0;
  ssize_t received = 0;
  do {
    received = ::read(exec_status.read_end(), &exec_error, sizeof(exec_error));
  } while (received < 0 && errno == EINTR);

  if (received == static_cast<ssize_t>(sizeof(exec_error))) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    throw SubprocessStartError("failed to launch '" + DescribeCommand(command) +
                               "': " + ErrnoText(exec_error));
  }

  // Writes must honour the call deadline even when the child stops reading.
  const int stdin_fd = stdin_pipe.write_end();
  const int stdin_flags = ::fcntl(stdin_fd, F_GETFL);
  if (stdin_flags < 0 || ::fcntl(stdin_fd, F_SETFL, stdin_flags | O_NONBLOCK) < 0) {
    const int error = errno;
    ::kill(pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    throw SubprocessStartError("failed to configure stdin of '" + DescribeCommand(command) +
                               "': " + ErrnoText(error));
  }

  return std::make_unique<Subprocess>(PrivateTag{}, pid, stdin_pipe.ReleaseWrite(),
                                      stdout_pipe.ReleaseRead(), stderr_pipe.ReleaseRead(),
                                      std::move(options));
}

Subprocess::Subprocess(PrivateTag, pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd,
                       SubprocessOptions options)
    : pid_(pid),
      options_(std::move(options)),
      stdin_fd_(stdin_fd),
      stdout_fd_(stdout_fd),
      stderr_fd_(stderr_fd) {
  stderr_thread_ = std::thread([this] { StderrLoop(); });
}

Subprocess::~Subprocess() {
  Terminate();
  CloseFd(stdout_fd_);
  CloseFd(stderr_fd_);
}

WriteResult Subprocess::WriteLine(const std::string& line, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::lock_guard<std::mutex> lock(write_mutex_);
  if (stdin_fd_ < 0) {
    return {false, false, "stdin is closed"};
  }

  const std::string payload = line + "\n";
  std::size_t written = 0;
  while (written < payload.size()) {
    const ssize_t n = ::write(stdin_fd_, payload.data() + written, payload.size() - written);
    if (n >= 0) {
      written += static_cast<std::size_t>(n);
      continue;
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno != EAGAIN && errno != EWOULDBLOCK) {
      return {false, false, "write to stdin failed: " + ErrnoText(errno)};
    }

    const int wait_ms = MillisUntil(deadline);
    if (wait_ms == 0) {
      return {false, true,
              "stdin not drained within timeout (" + std::to_string(written) + " of " +
                  std::to_string(payload.size()) + " bytes written)"};
    }
    pollfd descriptor{stdin_fd_, POLLOUT, 0};
    const int ready = ::poll(&descriptor, 1, wait_ms);
    if (ready < 0 && errno != EINTR) {
      return {false, false, "poll on stdin failed: " + ErrnoText(errno)};
    }
  }
  return {true, false, {}};
}

ReadResult Subprocess::ReadLine(std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  char chunk[kReadChunk];

  while (true) {
    ReadResult result;
    if (PopLine(read_buffer_, result.line)) {
      result.status = ReadStatus::kLine;
      return result;
    }
    if (read_buffer_.size() > options_.max_line_bytes) {
      return {ReadStatus::kIoError, {},
              "stdout line exceeds " + std::to_string(options_.max_line_bytes) + " bytes"};
    }
    if (stdout_eof_) {
      return {ReadStatus::kEof, {}, "stdout closed"};
    }

    const int wait_ms = MillisUntil(deadline);
    if (wait_ms == 0) {
      return {ReadStatus::kTimeout, {}, "no complete line within timeout"};
    }

    pollfd descriptor{stdout_fd_, POLLIN, 0};
    const int ready = ::poll(&descriptor, 1, wait_ms);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      return {ReadStatus::kIoError, {}, "poll on stdout failed: " + ErrnoText(errno)};
    }
    if (ready == 0) {
      continue;
    }

    const ssize_t n = ::read(stdout_fd_, chunk, sizeof(chunk));
    if (n > 0) {
      read_buffer_.append(chunk, static_cast<std::size_t>(n));
    } else if (n == 0) {
      stdout_eof_ = true;
    } else if (errno != EINTR) {
      return {ReadStatus::kIoError, {}, "read from stdout failed: " + ErrnoText(errno)};
    }
  }
}

void Subprocess::Terminate(std::chrono::milliseconds grace) {
  CloseStdin();
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!ReapLocked(false)) {
      ::kill(pid_, SIGTERM);
      const auto deadline = std::chrono::steady_clock::now() + grace;
      while (!ReapLocked(false) && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(kReapPollInterval);
      }
      if (!reaped_) {
        ::kill(pid_, SIGKILL);
        ReapLocked(true);
      }
    }
  }
  StopStderrReader();
}

bool Subprocess::IsRunning() {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return !ReapLocked(false);
}

std::optional<int> Subprocess::exit_status() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return exit_status_;
}

std::string Subprocess::StderrTail() const {
  std::lock_guard<std::mutex> lock(stderr_mutex_);
  std::string text;
  for (const auto& line : stderr_tail_) {
    if (!text.empty()) {
      text.push_back('\n');
    }
    text += line;
  }
  return text;
}

bool Subprocess::ReapLocked(bool block) {
  if (reaped_) {
    return true;
  }
  int status = 0;
  pid_t result = 0;
  do {
    result = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
  } while (result < 0 && errno == EINTR);

  if (result == 0) {
    return false;
  }
  reaped_ = true;
  if (result == pid_) {
    if (WIFEXITED(status)) {
      exit_status_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
      exit_status_ = 128 + WTERMSIG(status);
    }
  }
  return true;
}

void Subprocess::CloseStdin() {
  std::lock_guard<std::mutex> lock(write_mutex_);
  CloseFd(stdin_fd_);
}

void Subprocess::StderrLoop() {
  std::string pending;
  char chunk[kReadChunk];

  auto flush_line = [this](std::string line) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (options_.on_stderr_line) {
      options_.on_stderr_line(line);
    }
    std::lock_guard<std::mutex> lock(stderr_mutex_);
    stderr_tail_.push_back(std::move(line));
    while (stderr_tail_.size() > options_.stderr_tail_lines) {
      stderr_tail_.pop_front();
    }
  };

  while (true) {
    pollfd descriptor{stderr_fd_, POLLIN, 0};
    const int ready = ::poll(&descriptor, 1, kStderrPollMillis);
    if (ready < 0 && errno != EINTR) {
      break;
    }
    if (ready <= 0) {
      // Grandchildren may keep the pipe open after the child is gone.
      if (stderr_stop_.load()) {
        break;
      }
      continue;
    }
    const ssize_t n = ::read(stderr_fd_, chunk, sizeof(chunk));
    if (n == 0) {
      break;
    }
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    pending.append(chunk, static_cast<std::size_t>(n));
    std::string line;
    while (PopLine(pending, line)) {
      flush_line(std::move(line));
    }
    if (pending.size() > options_.max_line_bytes) {
      flush_line(std::move(pending));
      pending.clear();
    }
  }
  if (!pending.empty()) {
    flush_line(std::move(pending));
  }
}

void Subprocess::StopStderrReader() {
  stderr_stop_.store(true);
  std::call_once(stderr_join_once_, [this] {
    if (stderr_thread_.joinable()) {
      stderr_thread_.join();
    }
  });
}

}  // namespace platform
