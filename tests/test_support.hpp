#pragma once

#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/tool_types.hpp"

#ifndef TOOLBRIDGE_STUB_TOOL_PATH
#error "TOOLBRIDGE_STUB_TOOL_PATH must point at the stub tool executable"
#endif

namespace testing_support {

inline void Assert(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

// Unique per test process; removed on destruction.
class TempPath {
 public:
  explicit TempPath(const std::string& name)
      : path_((std::filesystem::temp_directory_path() /
               ("toolbridge-" + std::to_string(::getpid()) + "-" + name))
                  .string()) {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
  }
  ~TempPath() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
  }

  TempPath(const TempPath&) = delete;
  TempPath& operator=(const TempPath&) = delete;

  const std::string& str() const { return path_; }
  bool exists() const { return std::filesystem::exists(path_); }

 private:
  std::string path_;
};

inline std::size_t CountLines(const std::string& path) {
  std::ifstream in(path);
  std::size_t lines = 0;
  std::string line;
  while (std::getline(in, line)) {
    ++lines;
  }
  return lines;
}

inline core::InputSchema LocationSchema() {
  core::InputSchema schema;
  schema.params["location"] = core::ParamSpec{core::ParamType::kString, true, "City name"};
  return schema;
}

// Descriptor launching the stub with `args` appended.
inline core::ToolDescriptor StubDescriptor(const std::string& name,
                                           std::vector<std::string> args = {}) {
  core::ToolDescriptor descriptor;
  descriptor.name = name;
  descriptor.endpoint = "/" + name;
  descriptor.description = "stub " + name;
  descriptor.launch_command = {TOOLBRIDGE_STUB_TOOL_PATH, "--name", name};
  descriptor.launch_command.insert(descriptor.launch_command.end(), args.begin(), args.end());
  descriptor.input_schema = LocationSchema();
  return descriptor;
}

}  // namespace testing_support
