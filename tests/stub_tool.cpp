// Scriptable line-protocol tool used by the tests.
//
//   --mode echo|silent|garbage|crash|hang|tool-error|deaf
//                        (deaf never reads stdin)
//   --delay-ms N         sleep before replying (echo only)
//   --once-marker PATH   crash/hang only on the first call ever; later calls
//                        (including in restarted processes) echo
//   --count-file PATH    append one line per process start
//   --no-advertise       skip the tool-description line
//   --name NAME          advertised tool name
//   --stderr TEXT        print TEXT to stderr on start

#include <unistd.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>

#include "nlohmann/json.hpp"

namespace {

using nlohmann::json;

struct StubOptions {
  std::string mode = "echo";
  int delay_ms = 0;
  std::string once_marker;
  std::string count_file;
  bool advertise = true;
  std::string name = "stub";
  std::string stderr_text;
};

StubOptions ParseArgs(int argc, char** argv) {
  StubOptions options;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    const bool has_value = i + 1 < argc;
    if (arg == "--mode" && has_value) {
      options.mode = argv[++i];
    } else if (arg == "--delay-ms" && has_value) {
      options.delay_ms = std::atoi(argv[++i]);
    } else if (arg == "--once-marker" && has_value) {
      options.once_marker = argv[++i];
    } else if (arg == "--count-file" && has_value) {
      options.count_file = argv[++i];
    } else if (arg == "--name" && has_value) {
      options.name = argv[++i];
    } else if (arg == "--stderr" && has_value) {
      options.stderr_text = argv[++i];
    } else if (arg == "--no-advertise") {
      options.advertise = false;
    }
  }
  return options;
}

long long NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

void Emit(const json& message) { std::cout << message.dump() << std::endl; }

// True the first time it is asked across all stub processes sharing `marker`.
bool FirstCall(const std::string& marker) {
  if (marker.empty()) {
    return true;
  }
  if (std::filesystem::exists(marker)) {
    return false;
  }
  std::ofstream(marker) << "seen\n";
  return true;
}

json EchoOutput(const json& input, long long started_at_ms) {
  json output = {{"echo", input}, {"pid", static_cast<long long>(::getpid())}};
  if (input.contains("location") && input["location"].is_string()) {
    output["forecast"] = "Sunny and 72°F in " + input["location"].get<std::string>();
  }
  output["started_at_ms"] = started_at_ms;
  output["finished_at_ms"] = NowMs();
  return output;
}

}  // namespace

int main(int argc, char** argv) {
  const StubOptions options = ParseArgs(argc, argv);

  if (!options.count_file.empty()) {
    std::ofstream(options.count_file, std::ios::app) << ::getpid() << "\n";
  }
  if (!options.stderr_text.empty()) {
    std::cerr << options.stderr_text << std::endl;
  }
  if (options.advertise) {
    Emit({{"type", "tool-description"},
          {"tools", json::array({{{"name", options.name},
                                  {"description", "stub tool in " + options.mode + " mode"},
                                  {"input_schema", json::object()},
                                  {"output_schema", json::object()}}})}});
  }

  if (options.mode == "deaf") {
    std::this_thread::sleep_for(std::chrono::minutes(10));
    return 0;
  }

  std::string line;
  while (std::getline(std::cin, line)) {
    if (line.empty()) {
      continue;
    }
    const long long started_at_ms = NowMs();
    const json message = json::parse(line, nullptr, false);
    const json input =
        message.is_object() ? message.value("input", json::object()) : json::object();

    if (options.mode == "silent") {
      continue;
    }
    if (options.mode == "garbage") {
      std::cout << "not-json" << std::endl;
      continue;
    }
    if (options.mode == "tool-error") {
      Emit({{"type", "tool-error"}, {"error", "stub refused the call"}});
      continue;
    }
    if (options.mode == "crash" && FirstCall(options.once_marker)) {
      std::cerr << "stub crashing on purpose" << std::endl;
      std::_Exit(3);
    }
    if (options.mode == "hang" && FirstCall(options.once_marker)) {
      std::this_thread::sleep_for(std::chrono::minutes(10));
    }
    if (options.delay_ms > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(options.delay_ms));
    }
    Emit({{"type", "tool-result"}, {"output", EchoOutput(input, started_at_ms)}});
  }
  return 0;
}
