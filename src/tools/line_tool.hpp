#pragma once

#include <functional>
#include <istream>
#include <ostream>
#include <string>

#include "nlohmann/json.hpp"

namespace tools {

struct ToolSpec {
  std::string name;
  std::string description;
  nlohmann::json input_schema;
  nlohmann::json output_schema;
};

// Returns the tool's output object; throwing reports a tool-error.
using ToolHandler = std::function<nlohmann::json(const nlohmann::json& input)>;

nlohmann::json DescriptionMessage(const ToolSpec& spec);

// Reply for one stdin line: tool-result on success, tool-error otherwise.
nlohmann::json HandleLine(const ToolSpec& spec, const ToolHandler& handler,
                          const std::string& line);

// Prints the description line, then answers each non-empty input line until
// EOF. Logging is redirected to stderr so stdout carries protocol only.
int RunLineTool(const ToolSpec& spec, const ToolHandler& handler, std::istream& in,
                std::ostream& out);

nlohmann::json LocationInputSchema();

}  // namespace tools
