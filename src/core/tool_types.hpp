#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "nlohmann/json.hpp"

namespace core {

enum class ParamType { kString = 0, kNumber, kInteger, kBoolean, kObject, kArray };

struct ParamSpec {
  ParamType type = ParamType::kString;
  bool required = false;
  std::string description;
};

struct InputSchema {
  std::map<std::string, ParamSpec> params;
};

struct ToolDescriptor {
  std::string name;
  std::string endpoint;
  std::string description;
  std::vector<std::string> launch_command;
  InputSchema input_schema;
  std::optional<std::chrono::milliseconds> timeout;
};

struct ToolInvocation {
  std::string correlation_id;
  std::string tool_name;
  nlohmann::json input;
  std::chrono::steady_clock::time_point deadline;
};

enum class FailureKind {
  kInvalidInput = 0,
  kUnknownTool,
  kToolUnavailable,
  kToolTimeout,
  kToolCrashed,
  kProtocolViolation,
  kToolError,
};

struct ToolFailure {
  FailureKind kind = FailureKind::kToolCrashed;
  std::string message;
};

class ToolResult {
 public:
  static ToolResult Success(nlohmann::json output);
  static ToolResult Failure(FailureKind kind, std::string message);

  bool ok() const { return std::holds_alternative<nlohmann::json>(value_); }
  const nlohmann::json& output() const;
  const ToolFailure& failure() const;

 private:
  explicit ToolResult(std::variant<nlohmann::json, ToolFailure> value);

  std::variant<nlohmann::json, ToolFailure> value_;
};

// Parsed "tool-description" line. Informational only.
struct ToolAdvertisement {
  struct Entry {
    std::string name;
    std::string description;
    nlohmann::json input_schema;
    nlohmann::json output_schema;
  };
  std::vector<Entry> tools;
};

const char* FailureKindToString(FailureKind kind);
const char* ParamTypeToString(ParamType type);
std::optional<ParamType> ParseParamType(const std::string& value);

// Unique for the lifetime of the process.
std::string MakeCorrelationId(const std::string& tool_name);

}  // namespace core
