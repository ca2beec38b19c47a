#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace platform {

enum class HttpMethod { kGet = 0, kPost, kOptions };

struct HttpRequest {
  std::string method;
  std::string path;
  std::string body;
  std::map<std::string, std::string> query_params;
  std::map<std::string, std::string> headers;
};

struct HttpResponse {
  int status = 200;
  std::string content_type = "application/json";
  std::string body;
  std::map<std::string, std::string> headers;
};

using HttpHandler = std::function<HttpResponse(const HttpRequest&)>;

// Handlers run concurrently on the server's worker pool.
class HttpServer {
 public:
  HttpServer();
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  void AddHandler(HttpMethod method, const std::string& path, HttpHandler handler);
  void SetWorkerThreads(std::size_t count);

  // Bind then serve; blocks until Stop().
  void Start(const std::string& host, int port);
  // Port 0 binds an ephemeral port. Returns the bound port.
  int Bind(const std::string& host, int port);
  // Serves on the socket from Bind(); blocks until Stop().
  void Run();
  bool IsRunning() const;
  void Stop();

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace platform
