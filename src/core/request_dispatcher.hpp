#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "core/tool_process_manager.hpp"
#include "core/tool_types.hpp"
#include "nlohmann/json.hpp"

namespace core {

inline constexpr std::chrono::milliseconds kDefaultCallTimeout{10000};

// Returns a description of the first problem, or nullopt when `input` is an
// object that carries every required parameter with its declared type.
// Required strings must be non-empty.
std::optional<std::string> ValidateInput(const InputSchema& schema, const nlohmann::json& input);

// Only declared parameters are forwarded to the tool.
nlohmann::json SelectDeclaredInput(const InputSchema& schema, const nlohmann::json& input);

class RequestDispatcher {
 public:
  RequestDispatcher(ToolProcessManager& manager,
                    std::chrono::milliseconds default_timeout = kDefaultCallTimeout);

  // One round trip, never retried. The timeout bounds write to reply; when
  // unset the tool's configured timeout, then the default, applies.
  ToolResult Invoke(const std::string& tool_name, const nlohmann::json& input,
                    std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  ToolProcessManager& manager() const { return manager_; }

 private:
  ToolResult RoundTrip(ToolLease& lease, ToolInvocation& invocation,
                       std::chrono::milliseconds budget);

  ToolProcessManager& manager_;
  const std::chrono::milliseconds default_timeout_;
};

}  // namespace core
