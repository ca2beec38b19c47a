#include "tools/line_tool.hpp"

#include <exception>
#include <iostream>

#include "core/logging.hpp"

namespace tools {
namespace {

using nlohmann::json;

json MakeError(const std::string& message) { return {{"type", "tool-error"}, {"error", message}}; }

void WriteMessage(std::ostream& out, const json& message) {
  out << message.dump(-1, ' ', false, json::error_handler_t::replace) << '\n';
  out.flush();
}

}  // namespace

json DescriptionMessage(const ToolSpec& spec) {
  return {{"type", "tool-description"},
          {"tools", json::array({{{"name", spec.name},
                                  {"description", spec.description},
                                  {"input_schema", spec.input_schema},
                                  {"output_schema", spec.output_schema}}})}};
}

json HandleLine(const ToolSpec& spec, const ToolHandler& handler, const std::string& line) {
  const json message = json::parse(line, nullptr, false);
  if (message.is_discarded() || !message.is_object()) {
    return MakeError("Message is not a JSON object");
  }
  if (message.value("type", std::string{}) != "tool-call") {
    return MakeError("Unsupported message type: " + message.value("type", std::string{}));
  }
  const std::string tool = message.value("tool", std::string{});
  if (tool != spec.name) {
    return MakeError("Unknown tool: " + tool);
  }
  const json input = message.value("input", json::object());
  try {
    return {{"type", "tool-result"}, {"output", handler(input)}};
  } catch (const std::exception& ex) {
    core::logging::LogWarn(spec.name + " failed: " + ex.what());
    return MakeError(ex.what());
  }
}

int RunLineTool(const ToolSpec& spec, const ToolHandler& handler, std::istream& in,
                std::ostream& out) {
  core::logging::InitializeFromEnvironment();
  core::logging::SetLogSink([](core::logging::LogLevel, const std::string& line) {
    std::cerr << line << std::endl;
  });

  WriteMessage(out, DescriptionMessage(spec));

  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      continue;
    }
    WriteMessage(out, HandleLine(spec, handler, line));
  }
  core::logging::LogDebug(spec.name + " reached end of input");
  return 0;
}

json LocationInputSchema() {
  return {{"type", "object"},
          {"properties", {{"location", {{"type", "string"}}}}},
          {"required", json::array({"location"})}};
}

}  // namespace tools
