#pragma once

#include <memory>
#include <string>

#include "internal/aws/credentials.hpp"

namespace devicefarm::aws {

/*
  Exchanges long-lived credentials for a temporary session of a role.
  Implementations throw util::CredentialsError when the exchange is refused
  or cannot be completed.
*/
class RoleExchanger {
 public:
  virtual ~RoleExchanger() = default;

  virtual Credentials AssumeRole(const std::string& role_arn, const std::string& session_name) = 0;
};

using RoleExchangerPtr = std::shared_ptr<RoleExchanger>;

} // namespace devicefarm::aws
