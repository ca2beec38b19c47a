#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "core/request_dispatcher.hpp"
#include "core/tool_types.hpp"

namespace platform {
class HttpServer;
struct HttpResponse;
}  // namespace platform

namespace core {

inline constexpr char kVersion[] = "0.1.0";

struct ServerConfig {
  std::string host = "127.0.0.1";
  int port = 5000;
  std::size_t worker_threads = 8;
  std::chrono::milliseconds call_timeout = kDefaultCallTimeout;
  // Empty selects the built-in catalog.
  std::string tools_config_path;
  std::string tool_dir = ".";
};

// Registers POST <endpoint> and POST /<tool-name> for every tool, plus
// GET /tools, GET /health and CORS preflight routes.
void ConfigureServer(platform::HttpServer& server, RequestDispatcher& dispatcher);

ServerConfig LoadServerConfig(const std::string& default_tool_dir);
std::vector<ToolDescriptor> LoadToolDescriptors(const ServerConfig& config);

int HttpStatusFor(FailureKind kind);
platform::HttpResponse RenderResult(const ToolResult& result);

}  // namespace core
