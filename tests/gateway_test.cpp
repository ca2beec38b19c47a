#include <chrono>
#include <exception>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "core/app.hpp"
#include "core/request_dispatcher.hpp"
#include "core/tool_process_manager.hpp"
#include "nlohmann/json.hpp"
#include "platform/http_client.hpp"
#include "platform/http_server.hpp"
#include "test_support.hpp"

namespace {

using nlohmann::json;
using std::chrono::milliseconds;
using testing_support::Assert;
using testing_support::StubDescriptor;

std::vector<core::ToolDescriptor> TestCatalog(const std::string& hang_marker) {
  auto weather = StubDescriptor("get-forecast");
  weather.endpoint = "/weather";
  auto slow = StubDescriptor("slow", {"--mode", "hang", "--once-marker", hang_marker});
  slow.timeout = milliseconds(400);
  auto broken = StubDescriptor("broken");
  broken.launch_command = {"/nonexistent/toolbridge-broken-tool"};
  return {weather, slow, broken};
}

class TestServer {
 public:
  explicit TestServer(std::vector<core::ToolDescriptor> descriptors)
      : manager_(std::move(descriptors)), dispatcher_(manager_) {
    server_.SetWorkerThreads(4);
    core::ConfigureServer(server_, dispatcher_);
  }

  int Start(const std::string& host) {
    port_ = server_.Bind(host, 0);
    worker_ = std::thread([this] {
      try {
        server_.Run();
      } catch (const std::exception& ex) {
        std::lock_guard<std::mutex> lock(mutex_);
        error_ = ex.what();
      }
    });
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!server_.IsRunning() && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(milliseconds(10));
    }
    return port_;
  }

  void Stop() {
    server_.Stop();
    if (worker_.joinable()) {
      worker_.join();
    }
    manager_.Shutdown();
    std::lock_guard<std::mutex> lock(mutex_);
    if (!error_.empty()) {
      throw std::runtime_error(error_);
    }
  }

  core::ToolProcessManager& manager() { return manager_; }

 private:
  core::ToolProcessManager manager_;
  core::RequestDispatcher dispatcher_;
  platform::HttpServer server_;
  std::thread worker_;
  int port_ = 0;
  std::string error_;
  std::mutex mutex_;
};

json ParseBody(const platform::HttpClientResponse& response, const std::string& label) {
  const auto body = json::parse(response.body, nullptr, false);
  Assert(!body.is_discarded(), label + ": body must be JSON");
  return body;
}

void ExpectError(const platform::HttpClientResponse& response, int status,
                 const std::string& kind, const std::string& label) {
  Assert(response.status == status, label + ": expected HTTP " + std::to_string(status) +
                                        " but got " + std::to_string(response.status));
  const auto body = ParseBody(response, label);
  Assert(body.value("kind", "") == kind, label + ": expected kind " + kind);
  Assert(!body.value("error", "").empty(), label + ": error message must be present");
}

void RunTests() {
  testing_support::TempPath hang_marker("gateway-hang.marker");
  TestServer server(TestCatalog(hang_marker.str()));
  const int port = server.Start("127.0.0.1");
  Assert(port > 0, "Server must bind an ephemeral port");

  platform::HttpClient client("http://127.0.0.1:" + std::to_string(port), 10);

  const auto forecast = client.Post("/weather", R"({"location":"Seattle"})");
  Assert(forecast.status == 200, "POST /weather must succeed");
  Assert(ParseBody(forecast, "forecast").value("forecast", "") == "Sunny and 72°F in Seattle",
         "Forecast body mismatch");
  Assert(forecast.headers.count("Access-Control-Allow-Origin") == 1,
         "Responses must carry CORS headers");

  const auto by_name = client.Post("/get-forecast", R"({"location":"Paris"})");
  Assert(by_name.status == 200, "POST /<tool-name> must reach the same tool");

  ExpectError(client.Post("/weather", R"({})"), 400, "InvalidInput", "missing location");
  ExpectError(client.Post("/weather", R"({"location":""})"), 400, "InvalidInput",
              "empty location");
  ExpectError(client.Post("/weather", "{not json"), 400, "InvalidInput", "malformed body");
  ExpectError(client.Post("/weather", R"(["Seattle"])"), 400, "InvalidInput", "array body");
  ExpectError(client.Post("/slow", R"({"location":"x"})"), 504, "ToolTimeout", "hanging tool");
  ExpectError(client.Post("/broken", R"({"location":"x"})"), 502, "ToolUnavailable",
              "unlaunchable tool");

  const auto unknown = client.Post("/nowhere", R"({"location":"x"})");
  Assert(unknown.status == 404, "Unknown paths must be 404");

  const auto recovered = client.Post("/slow", R"({"location":"x"})");
  Assert(recovered.status == 200, "Tool must recover after a timeout");

  const auto tools = client.Get("/tools");
  Assert(tools.status == 200, "GET /tools must succeed");
  const auto tools_body = ParseBody(tools, "tools");
  Assert(tools_body.at("tools").size() == 3, "All configured tools must be listed");

  const auto health = client.Get("/health");
  Assert(health.status == 200, "GET /health must succeed");
  const auto health_body = ParseBody(health, "health");
  Assert(health_body.value("status", "") == "ok", "Health status mismatch");
  Assert(health_body.at("processes_started").get<long long>() >= 3,
         "Health must count started processes");
  for (const auto& tool : health_body.at("tools")) {
    if (tool.value("name", "") == "slow") {
      Assert(tool.value("restarts", 0) == 1, "Slow tool must have restarted once");
    }
  }

  server.Stop();
}

}  // namespace

int main() {
  try {
    RunTests();
  } catch (const std::exception& ex) {
    std::cerr << "Gateway test failure: " << ex.what() << std::endl;
    return 1;
  }
  return 0;
}
