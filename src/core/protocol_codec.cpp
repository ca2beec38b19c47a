#include "core/protocol_codec.hpp"

#include <utility>

namespace core::protocol {
namespace {

using nlohmann::json;

std::string Dump(const json& value) {
  return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

ToolResult Violation(const std::string& reason, const std::string& line) {
  return ToolResult::Failure(FailureKind::kProtocolViolation,
                             reason + ": " + TruncateForMessage(line));
}

std::string ErrorText(const json& message) {
  const auto it = message.find("error");
  if (it == message.end() || it->is_null()) {
    return "tool reported an error without a message";
  }
  if (it->is_string()) {
    return it->get<std::string>();
  }
  return Dump(*it);
}

std::string StringField(const json& object, const char* key) {
  const auto it = object.find(key);
  if (it == object.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

}  // namespace

std::string Encode(const ToolInvocation& invocation) {
  json message = {
      {"type", kToolCall},
      {"tool", invocation.tool_name},
      {"input", invocation.input.is_null() ? json::object() : invocation.input},
  };
  return Dump(message);
}

ToolResult Decode(const std::string& line) {
  const json message = json::parse(line, nullptr, false);
  if (message.is_discarded()) {
    return Violation("reply is not valid JSON", line);
  }
  if (!message.is_object()) {
    return Violation("reply is not a JSON object", line);
  }

  const std::string type = StringField(message, "type");
  if (type == kToolResult) {
    const auto output = message.find("output");
    if (output == message.end() || !output->is_object()) {
      return Violation("tool-result without an object 'output'", line);
    }
    return ToolResult::Success(*output);
  }
  // "error" is what older tools emit from their exception handler.
  if (type == kToolError || type == "error") {
    return ToolResult::Failure(FailureKind::kToolError, ErrorText(message));
  }
  if (type.empty()) {
    return Violation("reply has no 'type'", line);
  }
  return Violation("unrecognized reply type '" + type + "'", line);
}

std::optional<ToolAdvertisement> DecodeAdvertisement(const std::string& line) {
  const json message = json::parse(line, nullptr, false);
  if (message.is_discarded() || !message.is_object() ||
      StringField(message, "type") != kToolDescription) {
    return std::nullopt;
  }

  ToolAdvertisement advertisement;
  const auto tools = message.find("tools");
  if (tools == message.end() || !tools->is_array()) {
    return advertisement;
  }
  for (const auto& tool : *tools) {
    if (!tool.is_object()) {
      continue;
    }
    ToolAdvertisement::Entry entry;
    entry.name = StringField(tool, "name");
    entry.description = StringField(tool, "description");
    entry.input_schema = tool.value("input_schema", json::object());
    entry.output_schema = tool.value("output_schema", json::object());
    advertisement.tools.push_back(std::move(entry));
  }
  return advertisement;
}

std::string TruncateForMessage(const std::string& line) {
  if (line.size() <= kMaxQuotedLineBytes) {
    return line;
  }
  return line.substr(0, kMaxQuotedLineBytes) + "...";
}

}  // namespace core::protocol
