#pragma once

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/tool_types.hpp"
#include "platform/subprocess.hpp"

namespace core {

enum class ToolStatus { kNotStarted = 0, kStarting, kReady, kBusy, kCrashed, kStopped };

const char* ToolStatusToString(ToolStatus status);

// How a lease ended; decides whether the process may serve the next call.
enum class LeaseOutcome { kClean = 0, kProtocolViolation, kTimeout, kIoError };

struct ManagerOptions {
  // How long a fresh process gets to print its tool-description line.
  std::chrono::milliseconds advertisement_wait{1000};
  std::chrono::milliseconds terminate_grace = platform::kDefaultTerminateGrace;
};

struct ToolProcessSnapshot {
  std::string name;
  ToolStatus status = ToolStatus::kNotStarted;
  pid_t pid = -1;
  std::optional<std::chrono::system_clock::time_point> started_at;
  std::uint64_t calls = 0;
  std::uint64_t restarts = 0;
  std::string advertised_description;
};

class ToolProcessManager;
struct ToolSlot;

// Exclusive use of one tool process for one round trip. Destroying an
// unreleased lease releases it with LeaseOutcome::kIoError.
class ToolLease {
 public:
  ToolLease(ToolLease&& other) noexcept;
  ToolLease& operator=(ToolLease&& other) noexcept;
  ~ToolLease();

  ToolLease(const ToolLease&) = delete;
  ToolLease& operator=(const ToolLease&) = delete;

  platform::Subprocess& process() const { return *process_; }
  const ToolDescriptor& descriptor() const;
  bool active() const { return slot_ != nullptr; }

  void Release(LeaseOutcome outcome);

 private:
  friend class ToolProcessManager;

  ToolLease(ToolProcessManager* manager, ToolSlot* slot, platform::Subprocess* process);

  ToolProcessManager* manager_ = nullptr;
  ToolSlot* slot_ = nullptr;
  platform::Subprocess* process_ = nullptr;
};

struct AcquireResult {
  std::optional<ToolLease> lease;
  ToolFailure failure;

  bool ok() const { return lease.has_value(); }
};

// Owns one process per tool name. Callers for the same tool are served one
// at a time in arrival order; different tools never wait on each other.
class ToolProcessManager {
 public:
  explicit ToolProcessManager(std::vector<ToolDescriptor> descriptors,
                              ManagerOptions options = {});
  ~ToolProcessManager();

  ToolProcessManager(const ToolProcessManager&) = delete;
  ToolProcessManager& operator=(const ToolProcessManager&) = delete;

  // Blocks until the caller's turn; starts the process if needed.
  AcquireResult Acquire(const std::string& tool_name);

  // Terminal. Terminates every process and waits for pending terminations.
  void Shutdown();

  const ToolDescriptor* FindDescriptor(const std::string& tool_name) const;
  std::vector<const ToolDescriptor*> Descriptors() const;
  std::vector<ToolProcessSnapshot> Snapshot() const;
  std::optional<ToolAdvertisement> Advertisement(const std::string& tool_name) const;

  std::uint64_t start_count() const { return start_count_.load(); }

 private:
  friend class ToolLease;

  void Release(ToolSlot& slot, LeaseOutcome outcome);
  std::unique_ptr<platform::Subprocess> Launch(ToolSlot& slot,
                                               std::optional<ToolAdvertisement>& advertisement);
  void ScheduleTermination(std::unique_ptr<platform::Subprocess> process);
  void ReapFinishedTerminations();

  const ManagerOptions options_;
  std::map<std::string, std::unique_ptr<ToolSlot>> slots_;
  std::atomic<std::uint64_t> start_count_{0};

  std::mutex terminations_mutex_;
  std::vector<std::future<void>> terminations_;
};

}  // namespace core
