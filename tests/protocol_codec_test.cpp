#include <exception>
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>

#include "core/protocol_codec.hpp"
#include "core/tool_types.hpp"
#include "nlohmann/json.hpp"

namespace {

using nlohmann::json;

void Assert(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

void TestEncode() {
  core::ToolInvocation invocation;
  invocation.tool_name = "get-forecast";
  invocation.input = {{"location", "Seattle\nWA"}};

  const std::string line = core::protocol::Encode(invocation);
  Assert(line.find('\n') == std::string::npos, "Encoded call must be a single line");

  const auto message = json::parse(line);
  Assert(message.at("type") == "tool-call", "Encoded call type mismatch");
  Assert(message.at("tool") == "get-forecast", "Encoded tool name mismatch");
  Assert(message.at("input").at("location") == "Seattle\nWA", "Input must survive encoding");

  invocation.input = nullptr;
  const auto empty = json::parse(core::protocol::Encode(invocation));
  Assert(empty.at("input").is_object() && empty.at("input").empty(),
         "Missing input must encode as an empty object");
}

void TestDecodeResults() {
  const auto ok = core::protocol::Decode(
      R"({"type":"tool-result","output":{"forecast":"Sunny and 72°F in Seattle"}})");
  Assert(ok.ok(), "tool-result must decode as success");
  Assert(ok.output().at("forecast") == "Sunny and 72°F in Seattle", "Output mismatch");

  const auto tool_error = core::protocol::Decode(R"({"type":"tool-error","error":"no such city"})");
  Assert(!tool_error.ok(), "tool-error must decode as failure");
  Assert(tool_error.failure().kind == core::FailureKind::kToolError, "tool-error kind mismatch");
  Assert(tool_error.failure().message == "no such city", "tool-error message mismatch");

  const auto legacy = core::protocol::Decode(R"({"type":"error","error":"boom"})");
  Assert(!legacy.ok() && legacy.failure().kind == core::FailureKind::kToolError,
         "Legacy error replies are tool errors");

  bool threw = false;
  try {
    (void)ok.failure();
  } catch (const std::logic_error&) {
    threw = true;
  }
  Assert(threw, "Reading the failure of a success must throw");
}

void ExpectViolation(const std::string& line, const std::string& label) {
  const auto result = core::protocol::Decode(line);
  Assert(!result.ok(), label + ": must fail");
  Assert(result.failure().kind == core::FailureKind::kProtocolViolation,
         label + ": must be a protocol violation");
}

void TestDecodeViolations() {
  ExpectViolation("not-json", "garbage");
  ExpectViolation("", "empty line");
  ExpectViolation("[1,2,3]", "array");
  ExpectViolation(R"({"output":{}})", "missing type");
  ExpectViolation(R"({"type":"tool-result"})", "missing output");
  ExpectViolation(R"({"type":"tool-result","output":"text"})", "non-object output");
  ExpectViolation(R"({"type":"progress"})", "unknown type");

  const std::string long_line(1000, 'x');
  const auto result = core::protocol::Decode(long_line);
  Assert(result.failure().message.size() < 400, "Quoted reply must be truncated");
  Assert(result.failure().message.find("...") != std::string::npos,
         "Truncated reply must be marked");
}

void TestAdvertisement() {
  const auto advertisement = core::protocol::DecodeAdvertisement(
      R"({"type":"tool-description","tools":[{"name":"get-time","description":"Local time",)"
      R"("input_schema":{"type":"object"},"output_schema":{}}]})");
  Assert(advertisement.has_value(), "tool-description must decode");
  Assert(advertisement->tools.size() == 1, "Expected one advertised tool");
  Assert(advertisement->tools[0].name == "get-time", "Advertised name mismatch");
  Assert(advertisement->tools[0].description == "Local time", "Advertised description mismatch");

  Assert(!core::protocol::DecodeAdvertisement(R"({"type":"tool-result","output":{}})"),
         "Results are not advertisements");
  Assert(!core::protocol::DecodeAdvertisement("garbage"), "Garbage is not an advertisement");
}

void TestCorrelationIds() {
  std::set<std::string> ids;
  for (int i = 0; i < 100; ++i) {
    ids.insert(core::MakeCorrelationId("get-forecast"));
  }
  Assert(ids.size() == 100, "Correlation ids must be unique");
}

}  // namespace

int main() {
  try {
    TestEncode();
    TestDecodeResults();
    TestDecodeViolations();
    TestAdvertisement();
    TestCorrelationIds();
  } catch (const std::exception& ex) {
    std::cerr << "Protocol codec test failure: " << ex.what() << std::endl;
    return 1;
  }
  return 0;
}
