#pragma once

#include <string>

#include "internal/util/time.hpp"

namespace devicefarm::aws {

struct Credentials {
  std::string access_key_id;
  std::string secret_access_key;
  // Present only for temporary (STS) credentials.
  std::string session_token;
  // Epoch means the credentials do not expire.
  util::TimePoint expiration{};

  bool empty() const {
    return access_key_id.empty() || secret_access_key.empty();
  }
};

} // namespace devicefarm::aws
