#include "url.hpp"

#include <cctype>
#include <stdexcept>

namespace devicefarm::http {

namespace {

std::string DefaultPort(const std::string& scheme) {
  return scheme == "https" ? "443" : "80";
}

} // namespace

std::string Url::Target() const {
  std::string target = path.empty() ? "/" : path;
  if (!query.empty()) {
    target += "?" + query;
  }
  return target;
}

std::string Url::Authority() const {
  if (port == DefaultPort(scheme)) {
    return host;
  }
  return host + ":" + port;
}

Url ParseUrl(const std::string& url) {
  const auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos) {
    throw std::invalid_argument("url has no scheme: " + url);
  }

  Url parsed;
  for (char c : url.substr(0, scheme_end)) {
    parsed.scheme.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (parsed.scheme != "http" && parsed.scheme != "https") {
    throw std::invalid_argument("unsupported url scheme: " + parsed.scheme);
  }

  const auto authority_begin = scheme_end + 3;
  auto       authority_end   = url.find_first_of("/?", authority_begin);
  if (authority_end == std::string::npos) {
    authority_end = url.size();
  }

  const auto authority = url.substr(authority_begin, authority_end - authority_begin);
  if (authority.empty()) {
    throw std::invalid_argument("url has no host: " + url);
  }

  const auto colon = authority.rfind(':');
  if (colon != std::string::npos && authority.find(']') == std::string::npos) {
    parsed.host = authority.substr(0, colon);
    parsed.port = authority.substr(colon + 1);
  } else {
    parsed.host = authority;
    parsed.port = DefaultPort(parsed.scheme);
  }

  const auto rest       = url.substr(authority_end);
  const auto query_mark = rest.find('?');
  if (query_mark == std::string::npos) {
    parsed.path = rest;
  } else {
    parsed.path  = rest.substr(0, query_mark);
    parsed.query = rest.substr(query_mark + 1);
  }
  if (parsed.path.empty()) {
    parsed.path = "/";
  }

  return parsed;
}

} // namespace devicefarm::http
