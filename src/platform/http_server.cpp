#include "platform/http_server.hpp"

#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>

#include "httplib.h"
#include "nlohmann/json.hpp"

namespace platform {

class HttpServer::Impl {
 public:
  httplib::Server server;
  std::mutex lifecycle_mutex;
  bool bound = false;
  bool running = false;
  std::string bound_address;
};

namespace {

HttpRequest ConvertRequest(const httplib::Request& req) {
  HttpRequest request;
  request.method = req.method;
  request.path = req.path;
  request.body = req.body;
  for (const auto& param : req.params) {
    request.query_params[param.first] = param.second;
  }
  for (const auto& header : req.headers) {
    request.headers[header.first] = header.second;
  }
  return request;
}

httplib::Server::Handler WrapHandler(HttpHandler handler) {
  return [handler = std::move(handler)](const httplib::Request& req,
                                        httplib::Response& res) {
    try {
      const HttpRequest request = ConvertRequest(req);
      HttpResponse response = handler(request);
      if (response.content_type.empty()) {
        response.content_type = "text/plain";
      }
      for (const auto& header : response.headers) {
        res.set_header(header.first.c_str(), header.second.c_str());
      }
      res.status = response.status;
      res.set_content(response.body, response.content_type);
    } catch (const std::exception& ex) {
      res.status = 500;
      res.set_content(nlohmann::json{{"error", ex.what()}, {"kind", "InternalError"}}.dump(),
                      "application/json");
    } catch (...) {
      res.status = 500;
      res.set_content(
          nlohmann::json{{"error", "Unhandled server error"}, {"kind", "InternalError"}}.dump(),
          "application/json");
    }
  };
}

}  // namespace

HttpServer::HttpServer() : impl_(std::make_unique<Impl>()) {}

HttpServer::~HttpServer() = default;

void HttpServer::AddHandler(HttpMethod method, const std::string& path, HttpHandler handler) {
  if (!handler) {
    throw std::invalid_argument("HTTP handler must not be empty");
  }

  auto wrapped_handler = WrapHandler(std::move(handler));

  switch (method) {
    case HttpMethod::kGet:
      impl_->server.Get(path, std::move(wrapped_handler));
      break;
    case HttpMethod::kPost:
      impl_->server.Post(path, std::move(wrapped_handler));
      break;
    case HttpMethod::kOptions:
      impl_->server.Options(path, std::move(wrapped_handler));
      break;
    default:
      throw std::invalid_argument("Unsupported HTTP method");
  }
}

void HttpServer::SetWorkerThreads(std::size_t count) {
  if (count == 0) {
    throw std::invalid_argument("HTTP worker thread count must be positive");
  }
  impl_->server.new_task_queue = [count] { return new httplib::ThreadPool(count); };
}

void HttpServer::Start(const std::string& host, int port) {
  Bind(host, port);
  Run();
}

int HttpServer::Bind(const std::string& host, int port) {
  std::lock_guard<std::mutex> lock(impl_->lifecycle_mutex);
  if (impl_->bound) {
    throw std::runtime_error("Server already bound to " + impl_->bound_address);
  }

  int bound_port = port;
  if (port == 0) {
    bound_port = impl_->server.bind_to_any_port(host);
  } else if (!impl_->server.bind_to_port(host, port)) {
    bound_port = -1;
  }
  if (bound_port <= 0) {
    throw std::runtime_error("Failed to bind HTTP server to " + host + ":" +
                             std::to_string(port));
  }
  impl_->bound = true;
  impl_->bound_address = host + ":" + std::to_string(bound_port);
  return bound_port;
}

void HttpServer::Run() {
  {
    std::lock_guard<std::mutex> lock(impl_->lifecycle_mutex);
    if (!impl_->bound) {
      throw std::runtime_error("Server must be bound before it can run");
    }
    if (impl_->running) {
      throw std::runtime_error("Server already running");
    }
    impl_->running = true;
  }

  const bool ok = impl_->server.listen_after_bind();

  std::string address;
  {
    std::lock_guard<std::mutex> lock(impl_->lifecycle_mutex);
    impl_->running = false;
    address = impl_->bound_address;
  }

  if (!ok) {
    throw std::runtime_error("HTTP server on " + address + " stopped with an error");
  }
}

bool HttpServer::IsRunning() const { return impl_->server.is_running(); }

void HttpServer::Stop() { impl_->server.stop(); }

}  // namespace platform
