#include <cstdlib>
#include <exception>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>

#include "core/logging.hpp"
#include "nlohmann/json.hpp"
#include "platform/http_client.hpp"
#include "tools/line_tool.hpp"

namespace {

using nlohmann::json;

constexpr char kDefaultWeatherUrl[] = "http://wttr.in";
constexpr int kLookupTimeoutSeconds = 3;

bool OfflineMode() {
  const char* raw = std::getenv("TOOLBRIDGE_WEATHER_OFFLINE");
  return raw != nullptr && std::string{raw} == "1";
}

std::string WeatherBaseUrl() {
  if (const char* raw = std::getenv("TOOLBRIDGE_WEATHER_URL")) {
    return raw;
  }
  return kDefaultWeatherUrl;
}

std::string FormatForecast(const std::string& condition, const std::string& temperature_f,
                           const std::string& location) {
  return condition + " and " + temperature_f + "°F in " + location;
}

// wttr.in j1 format: current_condition[0].{temp_F, weatherDesc[0].value}.
std::string LookupForecast(const std::string& location) {
  platform::HttpClient client(WeatherBaseUrl(), kLookupTimeoutSeconds);
  const auto response = client.Get("/" + platform::UrlEncode(location), {{"format", "j1"}});
  if (response.status != 200) {
    throw std::runtime_error("weather service returned HTTP " + std::to_string(response.status));
  }
  const json payload = json::parse(response.body);
  const json& current = payload.at("current_condition").at(0);
  const std::string temperature = current.at("temp_F").get<std::string>();
  const std::string condition = current.at("weatherDesc").at(0).at("value").get<std::string>();
  return FormatForecast(condition, temperature, location);
}

std::string MockForecast(const std::string& location) {
  static const char* const kConditions[] = {"Sunny", "Cloudy", "Rainy", "Partly cloudy", "Windy"};
  std::random_device device;
  std::mt19937 engine(device());
  std::uniform_int_distribution<int> condition_pick(0, 4);
  std::uniform_int_distribution<int> temperature_pick(60, 84);
  return FormatForecast(kConditions[condition_pick(engine)],
                        std::to_string(temperature_pick(engine)), location);
}

json GetForecast(const json& input) {
  const std::string location = input.at("location").get<std::string>();
  if (location.empty()) {
    throw std::invalid_argument("location must not be empty");
  }
  if (!OfflineMode()) {
    try {
      return {{"location", location}, {"forecast", LookupForecast(location)}};
    } catch (const std::exception& ex) {
      core::logging::LogWarn("Weather lookup for '" + location + "' failed, using mock: " +
                             ex.what());
    }
  }
  return {{"location", location}, {"forecast", MockForecast(location)}};
}

}  // namespace

int main() {
  tools::ToolSpec spec;
  spec.name = "get-forecast";
  spec.description = "Get the current weather forecast for a location.";
  spec.input_schema = tools::LocationInputSchema();
  spec.output_schema = {
      {"type", "object"},
      {"properties", {{"location", {{"type", "string"}}}, {"forecast", {{"type", "string"}}}}},
      {"required", json::array({"location", "forecast"})}};
  return tools::RunLineTool(spec, GetForecast, std::cin, std::cout);
}
