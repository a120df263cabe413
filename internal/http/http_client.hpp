#pragma once

#include <arrow/buffer.h>

#include <map>
#include <memory>
#include <string>

namespace devicefarm::http {

struct HttpRequest {
  std::string                        method = "GET";
  std::string                        url;
  std::map<std::string, std::string> headers;
  std::shared_ptr<arrow::Buffer>     body;
};

struct HttpResponse {
  int                                status = 0;
  // Names are lower-cased.
  std::map<std::string, std::string> headers;
  std::shared_ptr<arrow::Buffer>     body;

  std::string BodyString() const {
    return body ? body->ToString() : std::string();
  }
};

/*
  Blocking HTTP transport.

  Execute returns whatever status the server answered with; only failures to
  complete the exchange (resolve, connect, TLS, read, write, timeout) throw
  util::TransportError.
*/
class HttpClient {
 public:
  virtual ~HttpClient() = default;

  virtual HttpResponse Execute(const HttpRequest& request) = 0;
};

using HttpClientPtr = std::shared_ptr<HttpClient>;

} // namespace devicefarm::http
