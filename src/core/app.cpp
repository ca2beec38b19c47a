#include "core/app.hpp"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>

#include "core/logging.hpp"
#include "core/tool_catalog.hpp"
#include "core/tool_process_manager.hpp"
#include "nlohmann/json.hpp"
#include "platform/http_server.hpp"

namespace core {
namespace {

using core::logging::LogInfo;
using core::logging::LogWarn;
using nlohmann::json;

const auto kServerStart = std::chrono::steady_clock::now();

void ApplyCors(platform::HttpResponse& response) {
  response.headers["Access-Control-Allow-Origin"] = "*";
  response.headers["Access-Control-Allow-Methods"] = "GET,POST,OPTIONS";
  response.headers["Access-Control-Allow-Headers"] = "Content-Type";
}

platform::HttpResponse JsonResponse(const json& body, int status = 200) {
  platform::HttpResponse response;
  response.status = status;
  response.content_type = "application/json";
  response.body = body.dump(-1, ' ', false, json::error_handler_t::replace);
  ApplyCors(response);
  return response;
}

platform::HttpResponse FailureResponse(FailureKind kind, const std::string& message) {
  return JsonResponse(json{{"error", message}, {"kind", FailureKindToString(kind)}},
                      HttpStatusFor(kind));
}

platform::HttpResponse HandleCorsPreflight(const platform::HttpRequest&) {
  platform::HttpResponse response;
  response.status = 204;
  response.content_type = "text/plain";
  ApplyCors(response);
  return response;
}

std::string FormatIsoUtc(std::chrono::system_clock::time_point point) {
  const std::time_t time = std::chrono::system_clock::to_time_t(point);
  std::tm tm_snapshot{};
  gmtime_r(&time, &tm_snapshot);
  std::ostringstream oss;
  oss << std::put_time(&tm_snapshot, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

json SnapshotToJson(const ToolProcessSnapshot& snapshot) {
  json payload = {{"name", snapshot.name},
                  {"status", ToolStatusToString(snapshot.status)},
                  {"calls", snapshot.calls},
                  {"restarts", snapshot.restarts}};
  payload["pid"] = snapshot.pid > 0 ? json(snapshot.pid) : json(nullptr);
  payload["started_at"] =
      snapshot.started_at ? json(FormatIsoUtc(*snapshot.started_at)) : json(nullptr);
  if (!snapshot.advertised_description.empty()) {
    payload["advertised_description"] = snapshot.advertised_description;
  }
  return payload;
}

std::string GetEnv(const char* key, const std::string& fallback) {
  if (const char* value = std::getenv(key)) {
    return value;
  }
  return fallback;
}

long long ParsePositiveEnv(const char* key, long long fallback, long long max_value) {
  const char* raw = std::getenv(key);
  if (raw == nullptr) {
    return fallback;
  }
  try {
    const long long parsed = std::stoll(raw);
    if (parsed > 0 && parsed <= max_value) {
      return parsed;
    }
    LogWarn(std::string{key} + " is outside the valid range, falling back to " +
            std::to_string(fallback));
  } catch (const std::exception& ex) {
    LogWarn(std::string{"Failed to parse "} + key + ": " + ex.what());
  }
  return fallback;
}

}  // namespace

int HttpStatusFor(FailureKind kind) {
  switch (kind) {
    case FailureKind::kInvalidInput:
      return 400;
    case FailureKind::kUnknownTool:
      return 404;
    case FailureKind::kToolTimeout:
      return 504;
    case FailureKind::kToolUnavailable:
    case FailureKind::kToolCrashed:
    case FailureKind::kProtocolViolation:
    case FailureKind::kToolError:
      return 502;
  }
  return 502;
}

platform::HttpResponse RenderResult(const ToolResult& result) {
  if (result.ok()) {
    return JsonResponse(result.output());
  }
  return FailureResponse(result.failure().kind, result.failure().message);
}

void ConfigureServer(platform::HttpServer& server, RequestDispatcher& dispatcher) {
  ToolProcessManager& manager = dispatcher.manager();
  std::set<std::string> routes;

  for (const ToolDescriptor* descriptor : manager.Descriptors()) {
    const std::string tool_name = descriptor->name;
    auto handle_tool = [&dispatcher, tool_name](const platform::HttpRequest& request) {
      LogInfo("POST " + request.path + " tool=" + tool_name +
              " bytes=" + std::to_string(request.body.size()));
      const auto payload = json::parse(request.body, nullptr, false);
      if (payload.is_discarded()) {
        return FailureResponse(FailureKind::kInvalidInput, "Invalid JSON payload.");
      }
      if (!payload.is_object()) {
        return FailureResponse(FailureKind::kInvalidInput, "Payload must be a JSON object.");
      }
      return RenderResult(dispatcher.Invoke(tool_name, payload));
    };

    for (const std::string& path : {descriptor->endpoint, "/" + tool_name}) {
      if (!routes.insert(path).second) {
        continue;
      }
      server.AddHandler(platform::HttpMethod::kPost, path, handle_tool);
      server.AddHandler(platform::HttpMethod::kOptions, path, HandleCorsPreflight);
    }
  }

  auto handle_tools = [&manager](const platform::HttpRequest&) {
    json tools = json::array();
    for (const ToolDescriptor* descriptor : manager.Descriptors()) {
      json tool = ToolDescriptorToJson(*descriptor);
      if (const auto advertisement = manager.Advertisement(descriptor->name)) {
        json advertised = json::array();
        for (const auto& entry : advertisement->tools) {
          advertised.push_back({{"name", entry.name},
                                {"description", entry.description},
                                {"input_schema", entry.input_schema},
                                {"output_schema", entry.output_schema}});
        }
        tool["advertised"] = advertised;
      }
      tools.push_back(tool);
    }
    LogInfo("GET /tools");
    return JsonResponse(json{{"tools", tools}});
  };

  auto handle_health = [&manager](const platform::HttpRequest&) {
    const auto uptime_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                               std::chrono::steady_clock::now() - kServerStart)
                               .count();
    json tools = json::array();
    for (const auto& snapshot : manager.Snapshot()) {
      tools.push_back(SnapshotToJson(snapshot));
    }
    LogInfo("GET /health");
    return JsonResponse(json{{"status", "ok"},
                             {"uptime_ms", uptime_ms},
                             {"version", kVersion},
                             {"processes_started", manager.start_count()},
                             {"tools", tools}});
  };

  server.AddHandler(platform::HttpMethod::kGet, "/tools", handle_tools);
  server.AddHandler(platform::HttpMethod::kGet, "/health", handle_health);
  server.AddHandler(platform::HttpMethod::kOptions, "/tools", HandleCorsPreflight);
  server.AddHandler(platform::HttpMethod::kOptions, "/health", HandleCorsPreflight);
}

ServerConfig LoadServerConfig(const std::string& default_tool_dir) {
  ServerConfig config;
  config.host = GetEnv("TOOLBRIDGE_HOST", config.host);
  config.port = static_cast<int>(ParsePositiveEnv("TOOLBRIDGE_PORT", config.port, 65535));
  config.worker_threads = static_cast<std::size_t>(
      ParsePositiveEnv("TOOLBRIDGE_WORKERS", static_cast<long long>(config.worker_threads), 1024));
  config.call_timeout = std::chrono::milliseconds(ParsePositiveEnv(
      "TOOLBRIDGE_CALL_TIMEOUT_MS", config.call_timeout.count(), 24LL * 60 * 60 * 1000));
  config.tools_config_path = GetEnv("TOOLBRIDGE_TOOLS_CONFIG", "");
  config.tool_dir = GetEnv("TOOLBRIDGE_TOOL_DIR", default_tool_dir);
  return config;
}

std::vector<ToolDescriptor> LoadToolDescriptors(const ServerConfig& config) {
  if (config.tools_config_path.empty()) {
    LogInfo("Using built-in tool catalog from " + config.tool_dir);
    return DefaultToolCatalog(config.tool_dir);
  }
  LogInfo("Loading tool catalog from " + config.tools_config_path);
  return LoadToolCatalog(config.tools_config_path);
}

}  // namespace core
