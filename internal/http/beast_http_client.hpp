#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

#include <chrono>
#include <memory>
#include <string>

#include "internal/http/http_client.hpp"
#include "internal/http/url.hpp"

namespace devicefarm::http {

/*
  HttpClient over Boost.Beast.

  One connection per request, HTTP/1.1, TLS through OpenSSL for https URLs.
  Every network step (connect, handshake, write, read) is bounded by
  Options::timeout.
*/
class BeastHttpClient final : public HttpClient {
 public:
  struct Options {
    std::string               user_agent = "devicefarm-client/1.0";
    std::chrono::milliseconds timeout{std::chrono::minutes(5)};
    bool                      verify_tls = true;
  };

  explicit BeastHttpClient(Options options);

  HttpResponse Execute(const HttpRequest& request) override;

 private:
  template <typename Stream>
  HttpResponse Exchange(boost::asio::io_context& ioc, Stream& stream, const Url& url, const HttpRequest& request);

  Options                                     options_;
  std::unique_ptr<boost::asio::ssl::context> tls_;
};

} // namespace devicefarm::http
