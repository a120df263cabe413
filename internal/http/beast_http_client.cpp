#include "beast_http_client.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <cctype>
#include <utility>

#include "internal/util/errors.hpp"

namespace devicefarm::http {

namespace beast = boost::beast;
namespace bhttp = boost::beast::http;
namespace net   = boost::asio;
namespace ssl   = boost::asio::ssl;
using tcp       = boost::asio::ip::tcp;

namespace {

/*
  Runs one asynchronous step to completion on `ioc`.

  Beast only enforces tcp_stream deadlines on asynchronous operations, so
  blocking calls are expressed as "start async op, drain the context".
*/
template <typename Initiate>
void Await(net::io_context& ioc, Initiate&& initiate) {
  beast::error_code ec;
  initiate([&ec](beast::error_code result, auto&&...) { ec = result; });
  ioc.restart();
  ioc.run();
  if (ec) {
    throw beast::system_error(ec);
  }
}

std::string Lower(std::string value) {
  for (char& c : value) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return value;
}

} // namespace

BeastHttpClient::BeastHttpClient(Options options)
    : options_(std::move(options)), tls_(std::make_unique<ssl::context>(ssl::context::tls_client)) {
  if (options_.verify_tls) {
    tls_->set_default_verify_paths();
    tls_->set_verify_mode(ssl::verify_peer);
  } else {
    tls_->set_verify_mode(ssl::verify_none);
  }
}

HttpResponse BeastHttpClient::Execute(const HttpRequest& request) {
  Url url;
  try {
    url = ParseUrl(request.url);
  } catch (const std::invalid_argument& e) {
    throw util::TransportError(e.what());
  }

  try {
    net::io_context ioc;
    tcp::resolver   resolver(ioc);
    const auto      endpoints = resolver.resolve(url.host, url.port);

    if (url.IsTls()) {
      beast::ssl_stream<beast::tcp_stream> stream(ioc, *tls_);
      if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
        throw util::TransportError("TLS SNI setup failed for " + url.host);
      }
      if (options_.verify_tls) {
        stream.set_verify_callback(ssl::host_name_verification(url.host));
      }

      auto& lowest = beast::get_lowest_layer(stream);
      lowest.expires_after(options_.timeout);
      Await(ioc, [&](auto handler) { lowest.async_connect(endpoints, handler); });

      lowest.expires_after(options_.timeout);
      Await(ioc, [&](auto handler) { stream.async_handshake(ssl::stream_base::client, handler); });

      auto response = Exchange(ioc, stream, url, request);
      // The body is complete; skip close_notify, many object stores never answer it.
      lowest.close();
      return response;
    }

    beast::tcp_stream stream(ioc);
    stream.expires_after(options_.timeout);
    Await(ioc, [&](auto handler) { stream.async_connect(endpoints, handler); });

    auto response = Exchange(ioc, stream, url, request);
    stream.close();
    return response;
  } catch (const boost::system::system_error& e) {
    throw util::TransportError(request.method + " " + url.scheme + "://" + url.Authority() + url.path + " failed: " + e.code().message());
  }
}

template <typename Stream>
HttpResponse BeastHttpClient::Exchange(net::io_context& ioc, Stream& stream, const Url& url, const HttpRequest& request) {
  auto& lowest = beast::get_lowest_layer(stream);

  bhttp::request<bhttp::string_body> req{bhttp::string_to_verb(request.method), url.Target(), 11};
  req.set(bhttp::field::host, url.Authority());
  if (!options_.user_agent.empty()) {
    req.set(bhttp::field::user_agent, options_.user_agent);
  }
  for (const auto& [name, value] : request.headers) {
    req.set(name, value);
  }
  if (request.body) {
    req.body().assign(reinterpret_cast<const char*>(request.body->data()), static_cast<std::size_t>(request.body->size()));
  }
  req.prepare_payload();

  lowest.expires_after(options_.timeout);
  Await(ioc, [&](auto handler) { bhttp::async_write(stream, req, handler); });

  beast::flat_buffer                          buffer;
  bhttp::response_parser<bhttp::string_body> parser;
  parser.body_limit(boost::none);

  lowest.expires_after(options_.timeout);
  Await(ioc, [&](auto handler) { bhttp::async_read(stream, buffer, parser, handler); });

  auto res = parser.release();

  HttpResponse response;
  response.status = static_cast<int>(res.result_int());
  for (const auto& field : res) {
    response.headers[Lower(std::string(field.name_string()))] = std::string(field.value());
  }
  response.body = arrow::Buffer::FromString(std::move(res.body()));
  return response;
}

} // namespace devicefarm::http
