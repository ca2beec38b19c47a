#include <pthread.h>
#include <signal.h>

#include <exception>
#include <filesystem>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "core/app.hpp"
#include "core/logging.hpp"
#include "core/request_dispatcher.hpp"
#include "core/tool_process_manager.hpp"
#include "platform/http_server.hpp"

namespace {

std::string ExecutableDir(const char* argv0) {
  std::error_code ec;
  auto path = std::filesystem::read_symlink("/proc/self/exe", ec);
  if (ec) {
    path = std::filesystem::absolute(argv0, ec);
  }
  const auto dir = path.parent_path();
  return dir.empty() ? std::string{"."} : dir.string();
}

}  // namespace

int main(int argc, char** argv) {
  core::logging::InitializeFromEnvironment();

  // Blocked before any thread exists so only the waiter below receives them.
  sigset_t stop_signals;
  sigemptyset(&stop_signals);
  sigaddset(&stop_signals, SIGINT);
  sigaddset(&stop_signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);

  auto config = core::LoadServerConfig(ExecutableDir(argv[0]));
  if (argc > 1) {
    config.tools_config_path = argv[1];
  }

  std::vector<core::ToolDescriptor> descriptors;
  try {
    descriptors = core::LoadToolDescriptors(config);
  } catch (const std::exception& ex) {
    core::logging::LogError(std::string{"Invalid tool configuration: "} + ex.what());
    return 1;
  }

  core::ToolProcessManager manager(std::move(descriptors));
  core::RequestDispatcher dispatcher(manager, config.call_timeout);

  platform::HttpServer server;
  server.SetWorkerThreads(config.worker_threads);
  core::ConfigureServer(server, dispatcher);

  std::thread signal_waiter([&server, stop_signals] {
    int received = 0;
    if (sigwait(&stop_signals, &received) == 0) {
      core::logging::LogInfo("Received signal " + std::to_string(received) + ", stopping");
    }
    server.Stop();
  });

  core::logging::LogInfo("Starting toolbridge " + std::string{core::kVersion} + " on " +
                         config.host + ":" + std::to_string(config.port));

  int exit_code = 0;
  try {
    server.Start(config.host, config.port);
  } catch (const std::exception& ex) {
    core::logging::LogError(std::string{"Server terminated with error: "} + ex.what());
    exit_code = 1;
  }

  pthread_kill(signal_waiter.native_handle(), SIGTERM);
  signal_waiter.join();

  manager.Shutdown();
  core::logging::LogInfo(exit_code == 0 ? "Server shut down gracefully." : "Server stopped.");
  return exit_code;
}
