#include "core/tool_catalog.hpp"

#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace core {
namespace {

using nlohmann::json;

InputSchema LocationSchema(const std::string& description) {
  InputSchema schema;
  schema.params["location"] = ParamSpec{ParamType::kString, true, description};
  return schema;
}

std::string JoinPath(const std::string& dir, const std::string& file) {
  if (dir.empty()) {
    return file;
  }
  if (dir.back() == '/') {
    return dir + file;
  }
  return dir + "/" + file;
}

std::string RequireString(const json& object, const std::string& key, const std::string& where) {
  const auto it = object.find(key);
  if (it == object.end() || !it->is_string() || it->get<std::string>().empty()) {
    throw std::invalid_argument(where + ": field '" + key + "' is required and must be a string");
  }
  return it->get<std::string>();
}

std::vector<std::string> ParseCommand(const json& value, const std::string& where) {
  std::vector<std::string> command;
  if (value.is_string()) {
    // A plain string is split on whitespace; use an array for quoted arguments.
    std::istringstream stream(value.get<std::string>());
    std::string part;
    while (stream >> part) {
      command.push_back(part);
    }
  } else if (value.is_array()) {
    for (const auto& part : value) {
      if (!part.is_string()) {
        throw std::invalid_argument(where + ": 'command' entries must be strings");
      }
      command.push_back(part.get<std::string>());
    }
  } else {
    throw std::invalid_argument(where + ": 'command' must be a string or an array of strings");
  }
  if (command.empty()) {
    throw std::invalid_argument(where + ": 'command' must not be empty");
  }
  return command;
}

ToolDescriptor ParseTool(const json& tool, std::size_t index) {
  const std::string where = "tools[" + std::to_string(index) + "]";
  if (!tool.is_object()) {
    throw std::invalid_argument(where + " must be an object");
  }

  ToolDescriptor descriptor;
  descriptor.name = RequireString(tool, "name", where);
  const std::string named = "tool '" + descriptor.name + "'";

  descriptor.endpoint = tool.value("endpoint", "/" + descriptor.name);
  if (descriptor.endpoint.empty() || descriptor.endpoint.front() != '/') {
    descriptor.endpoint.insert(descriptor.endpoint.begin(), '/');
  }
  descriptor.description = tool.value("description", std::string{});

  const auto command = tool.find("command");
  if (command == tool.end()) {
    throw std::invalid_argument(named + ": field 'command' is required");
  }
  descriptor.launch_command = ParseCommand(*command, named);

  if (const auto schema = tool.find("input_schema"); schema != tool.end()) {
    descriptor.input_schema = ParseInputSchema(*schema);
  } else {
    descriptor.input_schema = LocationSchema("Place to query.");
  }

  if (const auto timeout = tool.find("timeout_ms"); timeout != tool.end()) {
    if (!timeout->is_number_integer() || timeout->get<long long>() <= 0) {
      throw std::invalid_argument(named + ": 'timeout_ms' must be a positive integer");
    }
    descriptor.timeout = std::chrono::milliseconds(timeout->get<long long>());
  }
  return descriptor;
}

}  // namespace

std::vector<ToolDescriptor> DefaultToolCatalog(const std::string& tool_dir) {
  ToolDescriptor weather;
  weather.name = "get-forecast";
  weather.endpoint = "/weather";
  weather.description = "Returns the current weather for a location";
  weather.launch_command = {JoinPath(tool_dir, "toolbridge_weather_tool")};
  weather.input_schema = LocationSchema("City or place name.");

  ToolDescriptor time;
  time.name = "get-time";
  time.endpoint = "/time";
  time.description = "Returns the current time for any location in the world";
  time.launch_command = {JoinPath(tool_dir, "toolbridge_time_tool")};
  time.input_schema = LocationSchema("City or place name.");

  return {weather, time};
}

std::vector<ToolDescriptor> ParseToolCatalog(const json& document) {
  if (!document.is_object()) {
    throw std::invalid_argument("Tool catalog must be a JSON object");
  }
  const auto tools = document.find("tools");
  if (tools == document.end() || !tools->is_array()) {
    throw std::invalid_argument("Tool catalog requires a 'tools' array");
  }

  std::vector<ToolDescriptor> descriptors;
  std::set<std::string> names;
  std::set<std::string> endpoints;
  for (std::size_t i = 0; i < tools->size(); ++i) {
    auto descriptor = ParseTool(tools->at(i), i);
    if (!names.insert(descriptor.name).second) {
      throw std::invalid_argument("Duplicate tool name: " + descriptor.name);
    }
    if (!endpoints.insert(descriptor.endpoint).second) {
      throw std::invalid_argument("Duplicate tool endpoint: " + descriptor.endpoint);
    }
    descriptors.push_back(std::move(descriptor));
  }
  if (descriptors.empty()) {
    throw std::invalid_argument("Tool catalog does not define any tools");
  }
  return descriptors;
}

std::vector<ToolDescriptor> LoadToolCatalog(const std::string& path) {
  std::ifstream input(path);
  if (!input) {
    throw std::invalid_argument("Cannot open tool catalog: " + path);
  }
  const json document = json::parse(input, nullptr, false);
  if (document.is_discarded()) {
    throw std::invalid_argument("Tool catalog is not valid JSON: " + path);
  }
  return ParseToolCatalog(document);
}

InputSchema ParseInputSchema(const json& schema) {
  if (!schema.is_object()) {
    throw std::invalid_argument("input_schema must be an object");
  }
  InputSchema parsed;
  const auto properties = schema.find("properties");
  if (properties != schema.end()) {
    if (!properties->is_object()) {
      throw std::invalid_argument("input_schema.properties must be an object");
    }
    for (const auto& [name, property] : properties->items()) {
      ParamSpec spec;
      const std::string type = property.is_object() ? property.value("type", "string") : "string";
      const auto parsed_type = ParseParamType(type);
      if (!parsed_type) {
        throw std::invalid_argument("input_schema property '" + name +
                                    "' has unsupported type '" + type + "'");
      }
      spec.type = *parsed_type;
      if (property.is_object()) {
        spec.description = property.value("description", std::string{});
      }
      parsed.params[name] = spec;
    }
  }

  const auto required = schema.find("required");
  if (required != schema.end()) {
    if (!required->is_array()) {
      throw std::invalid_argument("input_schema.required must be an array");
    }
    for (const auto& name : *required) {
      if (!name.is_string()) {
        throw std::invalid_argument("input_schema.required entries must be strings");
      }
      // A required name without a property entry defaults to string.
      parsed.params[name.get<std::string>()].required = true;
    }
  }
  return parsed;
}

json InputSchemaToJson(const InputSchema& schema) {
  json properties = json::object();
  json required = json::array();
  for (const auto& [name, spec] : schema.params) {
    json property = {{"type", ParamTypeToString(spec.type)}};
    if (!spec.description.empty()) {
      property["description"] = spec.description;
    }
    properties[name] = property;
    if (spec.required) {
      required.push_back(name);
    }
  }
  return {{"type", "object"}, {"properties", properties}, {"required", required}};
}

json ToolDescriptorToJson(const ToolDescriptor& descriptor) {
  json tool = {{"name", descriptor.name},
               {"endpoint", descriptor.endpoint},
               {"description", descriptor.description},
               {"inputSchema", InputSchemaToJson(descriptor.input_schema)}};
  if (descriptor.timeout) {
    tool["timeout_ms"] = descriptor.timeout->count();
  }
  return tool;
}

}  // namespace core
