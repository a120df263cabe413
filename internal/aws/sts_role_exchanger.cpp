#include "sts_role_exchanger.hpp"

#include <aws/sts/model/AssumeRoleRequest.h>

#include <stdexcept>
#include <utility>

#include "internal/aws/sdk_error.hpp"
#include "internal/util/errors.hpp"

namespace devicefarm::aws {

StsRoleExchanger::StsRoleExchanger(std::shared_ptr<Aws::STS::STSClient> sts) : sts_(std::move(sts)) {
  if (!sts_) {
    throw std::invalid_argument("StsRoleExchanger requires an STS client");
  }
}

Credentials StsRoleExchanger::AssumeRole(const std::string& role_arn, const std::string& session_name) {
  if (role_arn.empty()) {
    throw util::CredentialsError("role ARN is empty");
  }

  Aws::STS::Model::AssumeRoleRequest request;
  request.SetRoleArn(ToAws(role_arn));
  request.SetRoleSessionName(ToAws(session_name));

  const auto outcome = sts_->AssumeRole(request);
  if (!outcome.IsSuccess()) {
    try {
      ThrowSdkError("AssumeRole", outcome.GetError());
    } catch (const util::TransportError& e) {
      throw util::CredentialsError("AssumeRole " + role_arn + " failed: " + e.what());
    } catch (const util::ServiceError& e) {
      throw util::CredentialsError("AssumeRole " + role_arn + " rejected: " + e.what());
    }
  }

  const auto& sts = outcome.GetResult().GetCredentials();

  Credentials out;
  out.access_key_id     = ToStd(sts.GetAccessKeyId());
  out.secret_access_key = ToStd(sts.GetSecretAccessKey());
  out.session_token     = ToStd(sts.GetSessionToken());
  out.expiration        = util::FromEpochSeconds(static_cast<double>(sts.GetExpiration().Millis()) / 1000.0);
  if (out.empty()) {
    throw util::CredentialsError("AssumeRole " + role_arn + " returned no credentials");
  }
  return out;
}

} // namespace devicefarm::aws
