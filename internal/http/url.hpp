#pragma once

#include <string>

namespace devicefarm::http {

struct Url {
  std::string scheme;
  std::string host;
  std::string port;
  std::string path;
  std::string query;

  bool IsTls() const {
    return scheme == "https";
  }

  // Request target: path plus "?query" when present.
  std::string Target() const;

  // Host header value; the port is omitted when it is the scheme default.
  std::string Authority() const;
};

// Accepts http:// and https:// URLs. Throws std::invalid_argument otherwise.
Url ParseUrl(const std::string& url);

} // namespace devicefarm::http
