#include <time.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>

#include "core/logging.hpp"
#include "nlohmann/json.hpp"
#include "tools/line_tool.hpp"

namespace {

using nlohmann::json;

constexpr char kZoneInfoDir[] = "/usr/share/zoneinfo/";

const std::map<std::string, std::string>& CityZones() {
  static const std::map<std::string, std::string> zones = {
      {"auckland", "Pacific/Auckland"},       {"beijing", "Asia/Shanghai"},
      {"berlin", "Europe/Berlin"},            {"cairo", "Africa/Cairo"},
      {"chicago", "America/Chicago"},         {"delhi", "Asia/Kolkata"},
      {"denver", "America/Denver"},           {"dubai", "Asia/Dubai"},
      {"hong kong", "Asia/Hong_Kong"},        {"johannesburg", "Africa/Johannesburg"},
      {"london", "Europe/London"},            {"los angeles", "America/Los_Angeles"},
      {"madrid", "Europe/Madrid"},            {"mexico city", "America/Mexico_City"},
      {"moscow", "Europe/Moscow"},            {"mumbai", "Asia/Kolkata"},
      {"new york", "America/New_York"},       {"paris", "Europe/Paris"},
      {"rome", "Europe/Rome"},                {"san francisco", "America/Los_Angeles"},
      {"sao paulo", "America/Sao_Paulo"},     {"seattle", "America/Los_Angeles"},
      {"seoul", "Asia/Seoul"},                {"shanghai", "Asia/Shanghai"},
      {"singapore", "Asia/Singapore"},        {"sydney", "Australia/Sydney"},
      {"tokyo", "Asia/Tokyo"},                {"toronto", "America/Toronto"},
      {"utc", "UTC"},
  };
  return zones;
}

// "Paris, France" -> "paris".
std::string NormalizeCity(const std::string& location) {
  std::string city = location.substr(0, location.find(','));
  const auto first = city.find_first_not_of(" \t");
  if (first == std::string::npos) {
    return {};
  }
  city = city.substr(first, city.find_last_not_of(" \t") - first + 1);
  std::transform(city.begin(), city.end(), city.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return city;
}

bool ZoneInstalled(const std::string& zone) {
  std::error_code ec;
  return zone == "UTC" || std::filesystem::exists(kZoneInfoDir + zone, ec);
}

std::string ResolveZone(const std::string& location) {
  const auto it = CityZones().find(NormalizeCity(location));
  if (it != CityZones().end() && ZoneInstalled(it->second)) {
    return it->second;
  }
  // Raw IANA names such as "Europe/Lisbon" are accepted as-is.
  if (location.find('/') != std::string::npos && location.find("..") == std::string::npos &&
      ZoneInstalled(location)) {
    return location;
  }
  return {};
}

std::tm LocalTime(const std::string& zone) {
  ::setenv("TZ", zone.c_str(), 1);
  ::tzset();
  const std::time_t now = std::time(nullptr);
  std::tm local{};
  if (::localtime_r(&now, &local) == nullptr) {
    throw std::runtime_error("localtime_r failed for " + zone);
  }
  return local;
}

std::string Format(const std::tm& value, const char* pattern) {
  std::ostringstream oss;
  oss << std::put_time(&value, pattern);
  return oss.str();
}

json GetTime(const json& input) {
  const std::string location = input.at("location").get<std::string>();
  if (location.empty()) {
    throw std::invalid_argument("location must not be empty");
  }
  const std::string zone = ResolveZone(location);
  if (zone.empty()) {
    core::logging::LogWarn("No timezone for '" + location + "', answering in UTC");
    const std::tm utc = LocalTime("UTC");
    return {{"location", location},
            {"timezone", "Error: Location '" + location + "' not found."},
            {"time", Format(utc, "%H:%M:%S") + " (UTC)"},
            {"date", Format(utc, "%Y-%m-%d")}};
  }
  const std::tm local = LocalTime(zone);
  return {{"location", location},
          {"timezone", zone},
          {"time", Format(local, "%H:%M:%S")},
          {"date", Format(local, "%Y-%m-%d")}};
}

}  // namespace

int main() {
  tools::ToolSpec spec;
  spec.name = "get-time";
  spec.description = "Get the current local time for a city.";
  spec.input_schema = tools::LocationInputSchema();
  spec.output_schema = {
      {"type", "object"},
      {"properties",
       {{"location", {{"type", "string"}}},
        {"time", {{"type", "string"}}},
        {"timezone", {{"type", "string"}}},
        {"date", {{"type", "string"}}}}},
      {"required", json::array({"location", "time", "timezone", "date"})}};
  return tools::RunLineTool(spec, GetTime, std::cin, std::cout);
}
