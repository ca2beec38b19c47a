#pragma once

#include <map>
#include <string>

namespace httplib {
class Response;
}

namespace platform {

struct HttpClientResponse {
  int status = 0;
  std::string content_type;
  std::string body;
  std::map<std::string, std::string> headers;
};

// Plain http:// only. Each call opens its own connection; throws
// std::runtime_error when no response arrives.
class HttpClient {
 public:
  explicit HttpClient(std::string base_url, int timeout_seconds = 5);

  HttpClientResponse Get(const std::string& path,
                         const std::map<std::string, std::string>& query = {}) const;
  HttpClientResponse Post(const std::string& path, const std::string& body,
                          const std::map<std::string, std::string>& query = {},
                          const std::string& content_type = "application/json") const;

 private:
  std::string BuildTarget(const std::string& path,
                          const std::map<std::string, std::string>& query) const;
  HttpClientResponse ConvertResponse(const httplib::Response& response) const;
  [[noreturn]] void Raise(const std::string& method, const std::string& target) const;

  std::string scheme_;
  std::string host_;
  int port_;
  int timeout_seconds_;
};

// Percent-encodes everything except RFC 3986 unreserved characters.
std::string UrlEncode(const std::string& value);

}  // namespace platform
