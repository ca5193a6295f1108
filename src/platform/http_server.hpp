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

class HttpServer {
 public:
  HttpServer();
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // `pattern` is matched as a regular expression against the request path.
  void AddHandler(HttpMethod method, const std::string& pattern, HttpHandler handler);
  // Number of threads serving requests concurrently. Call before Start().
  void SetWorkerCount(std::size_t workers);
  // Blocks until Stop() is called; throws if the address cannot be bound.
  void Start(const std::string& host, int port);
  void Stop();
  bool IsRunning() const;

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

// Escapes regex metacharacters so a literal path can be passed to AddHandler.
std::string LiteralPathPattern(const std::string& path);

}  // namespace platform
