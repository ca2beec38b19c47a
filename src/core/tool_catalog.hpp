#pragma once

#include <string>
#include <vector>

#include "core/tool_types.hpp"
#include "nlohmann/json.hpp"

namespace core {

// Built-in tools: get-forecast on /weather and get-time on /time, launched from
// the bundled executables in `tool_dir`.
std::vector<ToolDescriptor> DefaultToolCatalog(const std::string& tool_dir);

// Parses {"tools": [...]}. Throws std::invalid_argument naming the bad field.
std::vector<ToolDescriptor> ParseToolCatalog(const nlohmann::json& document);
std::vector<ToolDescriptor> LoadToolCatalog(const std::string& path);

// JSON-schema subset: {"type":"object","properties":{...},"required":[...]}.
InputSchema ParseInputSchema(const nlohmann::json& schema);
nlohmann::json InputSchemaToJson(const InputSchema& schema);

nlohmann::json ToolDescriptorToJson(const ToolDescriptor& descriptor);

}  // namespace core
