#pragma once

#include <aws/core/auth/AWSCredentialsProvider.h>

#include <chrono>
#include <mutex>
#include <string>

#include "internal/aws/credentials.hpp"
#include "internal/aws/role_exchanger.hpp"

namespace devicefarm::aws {

// Role sessions are renewed this long before they expire.
inline constexpr std::chrono::minutes kRoleRefreshMargin{5};

Aws::Auth::AWSCredentials ToSdkCredentials(const Credentials& credentials);

/*
  RoleCredentialsProvider

  Signs SDK requests with a temporary session of one role and renews the
  session through the RoleExchanger before it expires.

  The constructor performs the first exchange and throws
  util::CredentialsError when it fails. A later failed renewal is logged and
  the previous session is kept; the service then rejects the call with an
  expired-token error.
*/
class RoleCredentialsProvider final : public Aws::Auth::AWSCredentialsProvider {
 public:
  RoleCredentialsProvider(RoleExchangerPtr exchanger, std::string role_arn, std::string session_name);

  Aws::Auth::AWSCredentials GetAWSCredentials() override;

  // Exchanges now. Throws util::CredentialsError.
  void Renew();

  const std::string& session_name() const {
    return session_name_;
  }

 private:
  bool ExpiresSoon() const;

  RoleExchangerPtr exchanger_;
  std::string      role_arn_;
  std::string      session_name_;

  std::mutex  mutex_;
  Credentials current_;
};

} // namespace devicefarm::aws
