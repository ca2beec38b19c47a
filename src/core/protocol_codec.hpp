#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "core/tool_types.hpp"

namespace core::protocol {

inline constexpr char kToolCall[] = "tool-call";
inline constexpr char kToolResult[] = "tool-result";
inline constexpr char kToolError[] = "tool-error";
inline constexpr char kToolDescription[] = "tool-description";

// Raw lines quoted in ProtocolViolation messages are cut to this many bytes.
inline constexpr std::size_t kMaxQuotedLineBytes = 200;

// Produces one line without the trailing '\n'. String values containing
// newlines are escaped, so the result never contains a raw line break.
std::string Encode(const ToolInvocation& invocation);

// Total: malformed or unexpected lines decode to a ProtocolViolation failure.
ToolResult Decode(const std::string& line);

// Returns the advertisement if the line is a "tool-description" message.
std::optional<ToolAdvertisement> DecodeAdvertisement(const std::string& line);

std::string TruncateForMessage(const std::string& line);

}  // namespace core::protocol
