#include "platform/http_client.hpp"

#include <cctype>
#include <stdexcept>
#include <string>
#include <utility>

#include "httplib.h"

namespace {

std::string Trim(const std::string& value) {
  std::size_t first = 0;
  std::size_t last = value.size();
  while (first < value.size() && std::isspace(static_cast<unsigned char>(value[first]))) {
    ++first;
  }
  while (last > first && std::isspace(static_cast<unsigned char>(value[last - 1]))) {
    --last;
  }
  return value.substr(first, last - first);
}

}  // namespace

namespace platform {

HttpClient::HttpClient(std::string host, int port, std::chrono::seconds timeout)
    : host_(std::move(host)), port_(port), timeout_(timeout) {
  if (port_ <= 0 || port_ > 65535) {
    throw std::invalid_argument("HTTP client port is out of range: " + std::to_string(port_));
  }
}

HttpClientResponse HttpClient::Get(const std::string& path) const {
  auto client = Connect();
  auto result = client->Get(path);
  if (!result) {
    Raise("GET", path, httplib::to_string(result.error()));
  }
  return ConvertResponse(result.value());
}

HttpClientResponse HttpClient::Post(const std::string& path, const std::string& body,
                                    const std::string& content_type) const {
  auto client = Connect();
  auto result = client->Post(path, body, content_type);
  if (!result) {
    Raise("POST", path, httplib::to_string(result.error()));
  }
  return ConvertResponse(result.value());
}

HttpClientResponse HttpClient::Options(const std::string& path) const {
  auto client = Connect();
  auto result = client->Options(path);
  if (!result) {
    Raise("OPTIONS", path, httplib::to_string(result.error()));
  }
  return ConvertResponse(result.value());
}

std::unique_ptr<httplib::Client> HttpClient::Connect() const {
  auto client = std::make_unique<httplib::Client>(host_, port_);
  client->set_connection_timeout(timeout_);
  client->set_read_timeout(timeout_);
  client->set_write_timeout(timeout_);
  return client;
}

HttpClientResponse HttpClient::ConvertResponse(const httplib::Response& result) const {
  HttpClientResponse response;
  response.status = result.status;
  response.content_type = Trim(result.get_header_value("Content-Type"));
  response.body = result.body;
  for (const auto& header : result.headers) {
    response.headers[header.first] = header.second;
  }
  return response;
}

[[noreturn]] void HttpClient::Raise(const std::string& method, const std::string& path,
                                    const std::string& reason) const {
  throw std::runtime_error(method + " http://" + host_ + ":" + std::to_string(port_) + path +
                           " failed: " + reason);
}

}  // namespace platform
