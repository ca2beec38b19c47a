#include "core/tool_types.hpp"

#include <unistd.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cstdint>
#include <stdexcept>
#include <utility>

#include "xxhash.h"

namespace core {
namespace {

constexpr char kBase32Alphabet[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

std::atomic<std::uint64_t> g_invocation_sequence{0};

std::string EncodeBase32(const std::array<std::uint8_t, 10>& bytes) {
  std::string output;
  output.reserve(16);

  std::uint32_t buffer = 0;
  int bits = 0;
  for (const auto value : bytes) {
    buffer = (buffer << 8) | value;
    bits += 8;
    while (bits >= 5) {
      bits -= 5;
      output.push_back(kBase32Alphabet[(buffer >> bits) & 0x1Fu]);
    }
  }
  return output;
}

}  // namespace

ToolResult::ToolResult(std::variant<nlohmann::json, ToolFailure> value)
    : value_(std::move(value)) {}

ToolResult ToolResult::Success(nlohmann::json output) { return ToolResult(std::move(output)); }

ToolResult ToolResult::Failure(FailureKind kind, std::string message) {
  return ToolResult(ToolFailure{kind, std::move(message)});
}

const nlohmann::json& ToolResult::output() const {
  if (const auto* output = std::get_if<nlohmann::json>(&value_)) {
    return *output;
  }
  throw std::logic_error("ToolResult holds a failure, not an output");
}

const ToolFailure& ToolResult::failure() const {
  if (const auto* failure = std::get_if<ToolFailure>(&value_)) {
    return *failure;
  }
  throw std::logic_error("ToolResult holds an output, not a failure");
}

const char* FailureKindToString(FailureKind kind) {
  switch (kind) {
    case FailureKind::kInvalidInput:
      return "InvalidInput";
    case FailureKind::kUnknownTool:
      return "UnknownTool";
    case FailureKind::kToolUnavailable:
      return "ToolUnavailable";
    case FailureKind::kToolTimeout:
      return "ToolTimeout";
    case FailureKind::kToolCrashed:
      return "ToolCrashed";
    case FailureKind::kProtocolViolation:
      return "ProtocolViolation";
    case FailureKind::kToolError:
      return "ToolError";
  }
  return "ToolCrashed";
}

const char* ParamTypeToString(ParamType type) {
  switch (type) {
    case ParamType::kString:
      return "string";
    case ParamType::kNumber:
      return "number";
    case ParamType::kInteger:
      return "integer";
    case ParamType::kBoolean:
      return "boolean";
    case ParamType::kObject:
      return "object";
    case ParamType::kArray:
      return "array";
  }
  return "string";
}

std::optional<ParamType> ParseParamType(const std::string& value) {
  if (value == "string") {
    return ParamType::kString;
  }
  if (value == "number") {
    return ParamType::kNumber;
  }
  if (value == "integer") {
    return ParamType::kInteger;
  }
  if (value == "boolean") {
    return ParamType::kBoolean;
  }
  if (value == "object") {
    return ParamType::kObject;
  }
  if (value == "array") {
    return ParamType::kArray;
  }
  return std::nullopt;
}

std::string MakeCorrelationId(const std::string& tool_name) {
  const std::uint64_t sequence = ++g_invocation_sequence;
  const auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::string canonical = tool_name + "||" + std::to_string(sequence) + "||" +
                                std::to_string(::getpid()) + "||" + std::to_string(ticks);

  const XXH128_hash_t hash = XXH3_128bits(canonical.data(), canonical.size());
  XXH128_canonical_t hash_bytes;
  XXH128_canonicalFromHash(&hash_bytes, hash);

  std::array<std::uint8_t, 10> truncated{};
  std::copy(hash_bytes.digest + 6, hash_bytes.digest + 16, truncated.begin());
  return std::to_string(sequence) + "-" + EncodeBase32(truncated);
}

}  // namespace core
