#pragma once

#include <aws/sts/STSClient.h>

#include <memory>
#include <string>

#include "internal/aws/credentials.hpp"
#include "internal/aws/role_exchanger.hpp"

namespace devicefarm::aws {

// STS is global; the SDK routes us-east-1 to sts.amazonaws.com.
inline constexpr const char* kStsRegion = "us-east-1";

/*
  RoleExchanger backed by the STS AssumeRole action.
*/
class StsRoleExchanger final : public RoleExchanger {
 public:
  explicit StsRoleExchanger(std::shared_ptr<Aws::STS::STSClient> sts);

  Credentials AssumeRole(const std::string& role_arn, const std::string& session_name) override;

 private:
  std::shared_ptr<Aws::STS::STSClient> sts_;
};

} // namespace devicefarm::aws
