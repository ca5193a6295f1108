#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <string>

namespace httplib {
class Client;
struct Response;
}  // namespace httplib

namespace platform {

struct HttpClientResponse {
  int status = 0;
  std::string content_type;
  std::string body;
  std::map<std::string, std::string> headers;
};

// Blocking JSON client for one host. Each request opens its own connection,
// so one instance may be shared by several threads.
class HttpClient {
 public:
  HttpClient(std::string host, int port,
             std::chrono::seconds timeout = std::chrono::seconds(10));

  HttpClientResponse Get(const std::string& path) const;
  HttpClientResponse Post(const std::string& path, const std::string& body,
                          const std::string& content_type = "application/json") const;
  HttpClientResponse Options(const std::string& path) const;

 private:
  std::unique_ptr<httplib::Client> Connect() const;
  HttpClientResponse ConvertResponse(const httplib::Response& response) const;
  [[noreturn]] void Raise(const std::string& method, const std::string& path,
                          const std::string& reason) const;

  std::string host_;
  int port_;
  std::chrono::seconds timeout_;
};

}  // namespace platform
