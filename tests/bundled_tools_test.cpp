#include <stdlib.h>

#include <exception>
#include <filesystem>
#include <iostream>
#include <string>

#include "core/request_dispatcher.hpp"
#include "core/tool_catalog.hpp"
#include "core/tool_process_manager.hpp"
#include "nlohmann/json.hpp"
#include "test_support.hpp"

#ifndef TOOLBRIDGE_BUNDLED_TOOL_DIR
#error "TOOLBRIDGE_BUNDLED_TOOL_DIR must point at the directory of the bundled tools"
#endif

namespace {

using nlohmann::json;
using testing_support::Assert;

bool HasField(const json& output, const char* key) {
  return output.contains(key) && output.at(key).is_string() &&
         !output.at(key).get<std::string>().empty();
}

void TestWeatherTool(core::RequestDispatcher& dispatcher) {
  const auto result = dispatcher.Invoke("get-forecast", {{"location", "Seattle"}});
  Assert(result.ok(), "get-forecast must succeed offline");
  const auto& output = result.output();
  Assert(output.value("location", "") == "Seattle", "Forecast must echo the location");
  Assert(HasField(output, "forecast"), "Forecast text must be present");
  Assert(output.at("forecast").get<std::string>().find("°F in Seattle") != std::string::npos,
         "Forecast must name temperature and location");
}

void TestTimeTool(core::RequestDispatcher& dispatcher) {
  const auto known = dispatcher.Invoke("get-time", {{"location", "Tokyo, Japan"}});
  Assert(known.ok(), "get-time must succeed for a known city");
  const auto& output = known.output();
  Assert(output.value("location", "") == "Tokyo, Japan", "Time must echo the location");
  Assert(HasField(output, "time") && HasField(output, "date") && HasField(output, "timezone"),
         "Time output must carry time, date and timezone");
  if (std::filesystem::exists("/usr/share/zoneinfo/Asia/Tokyo")) {
    Assert(output.value("timezone", "") == "Asia/Tokyo", "Tokyo must resolve to Asia/Tokyo");
  }

  const auto unknown = dispatcher.Invoke("get-time", {{"location", "Atlantis"}});
  Assert(unknown.ok(), "Unknown city still answers in UTC");
  Assert(unknown.output().value("timezone", "").rfind("Error:", 0) == 0,
         "Unknown city must report the lookup error in timezone");
  Assert(unknown.output().value("time", "").find("(UTC)") != std::string::npos,
         "Unknown city time must be marked UTC");
}

}  // namespace

int main() {
  try {
    ::setenv("TOOLBRIDGE_WEATHER_OFFLINE", "1", 1);
    core::ToolProcessManager manager(core::DefaultToolCatalog(TOOLBRIDGE_BUNDLED_TOOL_DIR));
    core::RequestDispatcher dispatcher(manager);
    TestWeatherTool(dispatcher);
    TestTimeTool(dispatcher);
    manager.Shutdown();
  } catch (const std::exception& ex) {
    std::cerr << "Bundled tools test failure: " << ex.what() << std::endl;
    return 1;
  }
  return 0;
}
