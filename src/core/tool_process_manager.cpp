#include "core/tool_process_manager.hpp"

#include <algorithm>
#include <exception>
#include <iterator>
#include <stdexcept>
#include <utility>

#include "core/logging.hpp"
#include "core/protocol_codec.hpp"

namespace core {

using logging::LogDebug;
using logging::LogError;
using logging::LogInfo;
using logging::LogWarn;

struct ToolSlot {
  explicit ToolSlot(ToolDescriptor tool) : descriptor(std::move(tool)) {}

  const ToolDescriptor descriptor;

  std::mutex mutex;
  std::condition_variable turn;
  std::uint64_t next_ticket = 0;
  std::uint64_t now_serving = 0;
  // True from the moment a caller's ticket is served until it releases,
  // including while that caller is launching the process.
  bool leased = false;
  bool stopped = false;

  ToolStatus status = ToolStatus::kNotStarted;
  std::unique_ptr<platform::Subprocess> process;
  std::optional<std::chrono::system_clock::time_point> started_at;
  std::optional<ToolAdvertisement> advertisement;
  std::uint64_t calls = 0;
  std::uint64_t launches = 0;
};

namespace {

void FinishTurn(ToolSlot& slot) {
  slot.leased = false;
  ++slot.now_serving;
}

std::string DescribeExit(platform::Subprocess& process) {
  const auto status = process.exit_status();
  if (!status) {
    return "unknown status";
  }
  return "status " + std::to_string(*status);
}

void LogAdvertisement(const ToolDescriptor& descriptor, const ToolAdvertisement& advertisement) {
  bool matched = false;
  for (const auto& entry : advertisement.tools) {
    LogDebug("[" + descriptor.name + "] advertises '" + entry.name + "': " + entry.description);
    matched = matched || entry.name == descriptor.name;
  }
  if (!matched) {
    LogWarn("[" + descriptor.name + "] advertisement does not list a tool named '" +
            descriptor.name + "'");
  }
}

}  // namespace

const char* ToolStatusToString(ToolStatus status) {
  switch (status) {
    case ToolStatus::kNotStarted:
      return "NotStarted";
    case ToolStatus::kStarting:
      return "Starting";
    case ToolStatus::kReady:
      return "Ready";
    case ToolStatus::kBusy:
      return "Busy";
    case ToolStatus::kCrashed:
      return "Crashed";
    case ToolStatus::kStopped:
      return "Stopped";
  }
  return "NotStarted";
}

ToolLease::ToolLease(ToolProcessManager* manager, ToolSlot* slot, platform::Subprocess* process)
    : manager_(manager), slot_(slot), process_(process) {}

ToolLease::ToolLease(ToolLease&& other) noexcept
    : manager_(std::exchange(other.manager_, nullptr)),
      slot_(std::exchange(other.slot_, nullptr)),
      process_(std::exchange(other.process_, nullptr)) {}

ToolLease& ToolLease::operator=(ToolLease&& other) noexcept {
  if (this != &other) {
    if (slot_) {
      Release(LeaseOutcome::kIoError);
    }
    manager_ = std::exchange(other.manager_, nullptr);
    slot_ = std::exchange(other.slot_, nullptr);
    process_ = std::exchange(other.process_, nullptr);
  }
  return *this;
}

ToolLease::~ToolLease() {
  if (!slot_) {
    return;
  }
  try {
    LogWarn("[" + slot_->descriptor.name + "] lease dropped without an outcome; retiring process");
    Release(LeaseOutcome::kIoError);
  } catch (const std::exception& ex) {
    LogError(std::string{"Failed to release tool lease: "} + ex.what());
  }
}

const ToolDescriptor& ToolLease::descriptor() const {
  if (!slot_) {
    throw std::logic_error("lease has already been released");
  }
  return slot_->descriptor;
}

void ToolLease::Release(LeaseOutcome outcome) {
  if (!slot_) {
    return;
  }
  ToolProcessManager* manager = std::exchange(manager_, nullptr);
  ToolSlot* slot = std::exchange(slot_, nullptr);
  process_ = nullptr;
  manager->Release(*slot, outcome);
}

ToolProcessManager::ToolProcessManager(std::vector<ToolDescriptor> descriptors,
                                       ManagerOptions options)
    : options_(options) {
  for (auto& descriptor : descriptors) {
    if (descriptor.name.empty()) {
      throw std::invalid_argument("Tool descriptor without a name");
    }
    if (descriptor.launch_command.empty()) {
      throw std::invalid_argument("Tool '" + descriptor.name + "' has no launch command");
    }
    const std::string name = descriptor.name;
    const bool inserted =
        slots_.emplace(name, std::make_unique<ToolSlot>(std::move(descriptor))).second;
    if (!inserted) {
      throw std::invalid_argument("Duplicate tool name: " + name);
    }
  }
}

ToolProcessManager::~ToolProcessManager() {
  try {
    Shutdown();
  } catch (const std::exception& ex) {
    LogError(std::string{"Tool process shutdown failed: "} + ex.what());
  }
}

AcquireResult ToolProcessManager::Acquire(const std::string& tool_name) {
  AcquireResult result;
  const auto it = slots_.find(tool_name);
  if (it == slots_.end()) {
    result.failure = {FailureKind::kUnknownTool, "Unknown tool: " + tool_name};
    return result;
  }
  ToolSlot& slot = *it->second;
  ReapFinishedTerminations();

  std::unique_lock<std::mutex> lock(slot.mutex);
  if (slot.stopped) {
    result.failure = {FailureKind::kToolUnavailable, "Tool '" + tool_name + "' is stopped"};
    return result;
  }
  const std::uint64_t ticket = slot.next_ticket++;
  slot.turn.wait(lock, [&] { return slot.now_serving == ticket || slot.stopped; });
  if (slot.stopped) {
    if (slot.now_serving == ticket) {
      FinishTurn(slot);
      lock.unlock();
      slot.turn.notify_all();
    }
    result.failure = {FailureKind::kToolUnavailable, "Tool '" + tool_name + "' is stopped"};
    return result;
  }
  slot.leased = true;

  std::unique_ptr<platform::Subprocess> stale;
  if (slot.status == ToolStatus::kReady && slot.process && !slot.process->IsRunning()) {
    LogWarn("[" + tool_name + "] process " + std::to_string(slot.process->pid()) +
            " exited while idle (" + DescribeExit(*slot.process) + ")");
    slot.status = ToolStatus::kCrashed;
    stale = std::move(slot.process);
  }

  if (slot.status == ToolStatus::kNotStarted || slot.status == ToolStatus::kCrashed) {
    slot.status = ToolStatus::kStarting;
    lock.unlock();
    if (stale) {
      ScheduleTermination(std::move(stale));
    }

    std::optional<ToolAdvertisement> advertisement;
    std::unique_ptr<platform::Subprocess> fresh;
    std::string start_error;
    try {
      fresh = Launch(slot, advertisement);
    } catch (const std::exception& ex) {
      start_error = ex.what();
    }

    lock.lock();
    if (slot.stopped) {
      FinishTurn(slot);
      lock.unlock();
      slot.turn.notify_all();
      if (fresh) {
        ScheduleTermination(std::move(fresh));
      }
      result.failure = {FailureKind::kToolUnavailable, "Tool '" + tool_name + "' is stopped"};
      return result;
    }
    if (!fresh) {
      slot.status = ToolStatus::kCrashed;
      FinishTurn(slot);
      lock.unlock();
      slot.turn.notify_all();
      LogError("[" + tool_name + "] failed to start: " + start_error);
      result.failure = {FailureKind::kToolUnavailable, start_error};
      return result;
    }

    if (slot.launches > 0) {
      LogInfo("[" + tool_name + "] restarted as pid " + std::to_string(fresh->pid()));
    }
    slot.process = std::move(fresh);
    slot.started_at = std::chrono::system_clock::now();
    if (advertisement) {
      slot.advertisement = std::move(advertisement);
    }
    ++slot.launches;
    slot.status = ToolStatus::kReady;
  }

  slot.status = ToolStatus::kBusy;
  result.lease = ToolLease(this, &slot, slot.process.get());
  return result;
}

void ToolProcessManager::Release(ToolSlot& slot, LeaseOutcome outcome) {
  std::unique_ptr<platform::Subprocess> retired;
  {
    std::lock_guard<std::mutex> lock(slot.mutex);
    ++slot.calls;
    if (!slot.stopped) {
      switch (outcome) {
        case LeaseOutcome::kClean:
          slot.status = ToolStatus::kReady;
          break;
        case LeaseOutcome::kProtocolViolation:
          if (slot.process && slot.process->IsRunning()) {
            slot.status = ToolStatus::kReady;
          } else {
            slot.status = ToolStatus::kCrashed;
            retired = std::move(slot.process);
          }
          break;
        case LeaseOutcome::kTimeout:
        case LeaseOutcome::kIoError:
          slot.status = ToolStatus::kCrashed;
          retired = std::move(slot.process);
          break;
      }
    }
    FinishTurn(slot);
  }
  slot.turn.notify_all();

  if (retired) {
    LogWarn("[" + slot.descriptor.name + "] retiring process " + std::to_string(retired->pid()) +
            "; it will be restarted on the next call");
    ScheduleTermination(std::move(retired));
  }
}

std::unique_ptr<platform::Subprocess> ToolProcessManager::Launch(
    ToolSlot& slot, std::optional<ToolAdvertisement>& advertisement) {
  const ToolDescriptor& descriptor = slot.descriptor;
  const std::string name = descriptor.name;

  platform::SubprocessOptions process_options;
  process_options.on_stderr_line = [name](const std::string& line) {
    LogDebug("[" + name + "] stderr: " + line);
  };

  LogInfo("[" + name + "] starting: " + platform::DescribeCommand(descriptor.launch_command));
  auto process = platform::Subprocess::Start(descriptor.launch_command, process_options);
  ++start_count_;

  if (options_.advertisement_wait.count() <= 0) {
    return process;
  }

  const auto first = process->ReadLine(options_.advertisement_wait);
  switch (first.status) {
    case platform::ReadStatus::kLine:
      advertisement = protocol::DecodeAdvertisement(first.line);
      if (advertisement) {
        LogAdvertisement(descriptor, *advertisement);
      } else {
        LogWarn("[" + name + "] discarded unexpected startup line: " +
                protocol::TruncateForMessage(first.line));
      }
      break;
    case platform::ReadStatus::kTimeout:
      LogDebug("[" + name + "] no tool-description within " +
               std::to_string(options_.advertisement_wait.count()) + " ms");
      break;
    case platform::ReadStatus::kEof:
    case platform::ReadStatus::kIoError: {
      process->Terminate(options_.terminate_grace);
      std::string message = "Tool '" + name + "' exited during startup (" +
                            DescribeExit(*process) + ")";
      const std::string tail = process->StderrTail();
      if (!tail.empty()) {
        message += ": " + tail;
      }
      throw platform::SubprocessStartError(message);
    }
  }

  LogInfo("[" + name + "] ready as pid " + std::to_string(process->pid()));
  return process;
}

void ToolProcessManager::Shutdown() {
  std::vector<std::unique_ptr<platform::Subprocess>> retired;
  for (auto& entry : slots_) {
    ToolSlot& slot = *entry.second;
    std::unique_lock<std::mutex> lock(slot.mutex);
    if (slot.stopped) {
      continue;
    }
    slot.stopped = true;
    slot.turn.notify_all();
    // An in-flight call is bounded by its own deadline.
    slot.turn.wait(lock, [&slot] { return !slot.leased; });
    slot.status = ToolStatus::kStopped;
    if (slot.process) {
      LogInfo("[" + entry.first + "] stopping pid " + std::to_string(slot.process->pid()));
      retired.push_back(std::move(slot.process));
    }
  }

  for (auto& process : retired) {
    ScheduleTermination(std::move(process));
  }

  std::vector<std::future<void>> pending;
  {
    std::lock_guard<std::mutex> lock(terminations_mutex_);
    pending.swap(terminations_);
  }
  for (auto& termination : pending) {
    try {
      termination.get();
    } catch (const std::exception& ex) {
      LogError(std::string{"Tool process termination failed: "} + ex.what());
    }
  }
}

const ToolDescriptor* ToolProcessManager::FindDescriptor(const std::string& tool_name) const {
  const auto it = slots_.find(tool_name);
  if (it == slots_.end()) {
    return nullptr;
  }
  return &it->second->descriptor;
}

std::vector<const ToolDescriptor*> ToolProcessManager::Descriptors() const {
  std::vector<const ToolDescriptor*> descriptors;
  descriptors.reserve(slots_.size());
  for (const auto& entry : slots_) {
    descriptors.push_back(&entry.second->descriptor);
  }
  return descriptors;
}

std::vector<ToolProcessSnapshot> ToolProcessManager::Snapshot() const {
  std::vector<ToolProcessSnapshot> snapshots;
  snapshots.reserve(slots_.size());
  for (const auto& [name, slot] : slots_) {
    std::lock_guard<std::mutex> lock(slot->mutex);
    ToolProcessSnapshot snapshot;
    snapshot.name = name;
    snapshot.status = slot->status;
    snapshot.pid = slot->process ? slot->process->pid() : -1;
    snapshot.started_at = slot->started_at;
    snapshot.calls = slot->calls;
    snapshot.restarts = slot->launches > 0 ? slot->launches - 1 : 0;
    if (slot->advertisement) {
      for (const auto& entry : slot->advertisement->tools) {
        if (entry.name == name) {
          snapshot.advertised_description = entry.description;
        }
      }
    }
    snapshots.push_back(std::move(snapshot));
  }
  return snapshots;
}

std::optional<ToolAdvertisement> ToolProcessManager::Advertisement(
    const std::string& tool_name) const {
  const auto it = slots_.find(tool_name);
  if (it == slots_.end()) {
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lock(it->second->mutex);
  return it->second->advertisement;
}

void ToolProcessManager::ScheduleTermination(std::unique_ptr<platform::Subprocess> process) {
  const auto grace = options_.terminate_grace;
  auto termination = std::async(std::launch::async,
                                [process = std::move(process), grace]() mutable {
                                  process->Terminate(grace);
                                  process.reset();
                                });
  std::lock_guard<std::mutex> lock(terminations_mutex_);
  terminations_.push_back(std::move(termination));
}

void ToolProcessManager::ReapFinishedTerminations() {
  std::vector<std::future<void>> finished;
  {
    std::lock_guard<std::mutex> lock(terminations_mutex_);
    auto done = std::stable_partition(
        terminations_.begin(), terminations_.end(), [](const std::future<void>& termination) {
          return termination.wait_for(std::chrono::seconds(0)) != std::future_status::ready;
        });
    std::move(done, terminations_.end(), std::back_inserter(finished));
    terminations_.erase(done, terminations_.end());
  }
  for (auto& termination : finished) {
    try {
      termination.get();
    } catch (const std::exception& ex) {
      LogError(std::string{"Tool process termination failed: "} + ex.what());
    }
  }
}

}  // namespace core
