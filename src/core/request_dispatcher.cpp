#include "core/request_dispatcher.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "core/logging.hpp"
#include "core/protocol_codec.hpp"

namespace core {
namespace {

using logging::LogDebug;
using logging::LogInfo;
using logging::LogWarn;
using nlohmann::json;

bool MatchesType(const json& value, ParamType type) {
  switch (type) {
    case ParamType::kString:
      return value.is_string();
    case ParamType::kNumber:
      return value.is_number();
    case ParamType::kInteger:
      return value.is_number_integer();
    case ParamType::kBoolean:
      return value.is_boolean();
    case ParamType::kObject:
      return value.is_object();
    case ParamType::kArray:
      return value.is_array();
  }
  return false;
}

long long ElapsedMs(std::chrono::steady_clock::time_point since) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                               since)
      .count();
}

std::string WithStderr(std::string message, const platform::Subprocess& process) {
  const std::string tail = process.StderrTail();
  if (!tail.empty()) {
    message += "; stderr: " + tail;
  }
  return message;
}

}  // namespace

std::optional<std::string> ValidateInput(const InputSchema& schema, const json& input) {
  if (!input.is_object()) {
    return std::string{"Input must be a JSON object."};
  }
  for (const auto& [name, spec] : schema.params) {
    const auto it = input.find(name);
    if (it == input.end() || it->is_null()) {
      if (spec.required) {
        return "Missing required field '" + name + "'.";
      }
      continue;
    }
    if (!MatchesType(*it, spec.type)) {
      return "Field '" + name + "' must be of type " + ParamTypeToString(spec.type) + ".";
    }
    if (spec.required && spec.type == ParamType::kString && it->get<std::string>().empty()) {
      return "Field '" + name + "' must not be empty.";
    }
  }
  return std::nullopt;
}

json SelectDeclaredInput(const InputSchema& schema, const json& input) {
  json selected = json::object();
  for (const auto& entry : schema.params) {
    const auto it = input.find(entry.first);
    if (it != input.end() && !it->is_null()) {
      selected[entry.first] = *it;
    }
  }
  return selected;
}

RequestDispatcher::RequestDispatcher(ToolProcessManager& manager,
                                     std::chrono::milliseconds default_timeout)
    : manager_(manager), default_timeout_(default_timeout) {}

ToolResult RequestDispatcher::Invoke(const std::string& tool_name, const json& input,
                                     std::optional<std::chrono::milliseconds> timeout) {
  const ToolDescriptor* descriptor = manager_.FindDescriptor(tool_name);
  if (descriptor == nullptr) {
    return ToolResult::Failure(FailureKind::kUnknownTool, "Unknown tool: " + tool_name);
  }
  if (const auto problem = ValidateInput(descriptor->input_schema, input)) {
    LogDebug("Rejected call to '" + tool_name + "': " + *problem);
    return ToolResult::Failure(FailureKind::kInvalidInput, *problem);
  }

  ToolInvocation invocation;
  invocation.correlation_id = MakeCorrelationId(tool_name);
  invocation.tool_name = tool_name;
  invocation.input = SelectDeclaredInput(descriptor->input_schema, input);
  const auto budget = timeout.value_or(descriptor->timeout.value_or(default_timeout_));

  const auto queued_at = std::chrono::steady_clock::now();
  auto acquired = manager_.Acquire(tool_name);
  if (!acquired.ok()) {
    LogWarn("[" + invocation.correlation_id + "] " + tool_name + " unavailable: " +
            acquired.failure.message);
    return ToolResult::Failure(acquired.failure.kind, acquired.failure.message);
  }
  ToolLease lease = std::move(*acquired.lease);
  LogDebug("[" + invocation.correlation_id + "] " + tool_name + " leased after " +
           std::to_string(ElapsedMs(queued_at)) + " ms");

  try {
    return RoundTrip(lease, invocation, budget);
  } catch (const std::exception& ex) {
    lease.Release(LeaseOutcome::kIoError);
    LogWarn("[" + invocation.correlation_id + "] " + tool_name + " failed: " + ex.what());
    return ToolResult::Failure(FailureKind::kToolCrashed,
                               "Tool '" + tool_name + "' failed: " + ex.what());
  }
}

ToolResult RequestDispatcher::RoundTrip(ToolLease& lease, ToolInvocation& invocation,
                                        std::chrono::milliseconds budget) {
  const std::string& cid = invocation.correlation_id;
  const std::string& tool = invocation.tool_name;
  platform::Subprocess& process = lease.process();

  const auto started = std::chrono::steady_clock::now();
  invocation.deadline = started + budget;

  const auto written = process.WriteLine(protocol::Encode(invocation), budget);
  if (written.timed_out) {
    lease.Release(LeaseOutcome::kTimeout);
    const std::string message = "Tool '" + tool + "' did not accept the call within " +
                                std::to_string(budget.count()) + " ms";
    LogWarn("[" + cid + "] " + message + ": " + written.error);
    return ToolResult::Failure(FailureKind::kToolTimeout, message);
  }
  if (!written.ok) {
    const std::string message =
        WithStderr("Tool '" + tool + "' rejected the call: " + written.error, process);
    lease.Release(LeaseOutcome::kIoError);
    LogWarn("[" + cid + "] " + message);
    return ToolResult::Failure(FailureKind::kToolCrashed, message);
  }

  while (true) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        invocation.deadline - std::chrono::steady_clock::now());
    const auto read = process.ReadLine(std::max(remaining, std::chrono::milliseconds(0)));

    switch (read.status) {
      case platform::ReadStatus::kLine: {
        if (protocol::DecodeAdvertisement(read.line)) {
          LogDebug("[" + cid + "] skipped tool-description line from " + tool);
          continue;
        }
        ToolResult result = protocol::Decode(read.line);
        const bool clean = result.ok() || result.failure().kind == FailureKind::kToolError;
        lease.Release(clean ? LeaseOutcome::kClean : LeaseOutcome::kProtocolViolation);
        if (result.ok()) {
          LogInfo("[" + cid + "] " + tool + " ok in " + std::to_string(ElapsedMs(started)) +
                  " ms");
        } else {
          LogWarn("[" + cid + "] " + tool + " " + FailureKindToString(result.failure().kind) +
                  ": " + result.failure().message);
        }
        return result;
      }
      case platform::ReadStatus::kTimeout: {
        lease.Release(LeaseOutcome::kTimeout);
        const std::string message =
            "Tool '" + tool + "' did not reply within " + std::to_string(budget.count()) + " ms";
        LogWarn("[" + cid + "] " + message);
        return ToolResult::Failure(FailureKind::kToolTimeout, message);
      }
      case platform::ReadStatus::kEof:
      case platform::ReadStatus::kIoError: {
        const std::string reason = read.status == platform::ReadStatus::kEof
                                       ? "exited before replying"
                                       : "failed while replying: " + read.error;
        const std::string message = WithStderr("Tool '" + tool + "' " + reason, process);
        lease.Release(LeaseOutcome::kIoError);
        LogWarn("[" + cid + "] " + message);
        return ToolResult::Failure(FailureKind::kToolCrashed, message);
      }
    }
  }
}

}  // namespace core
