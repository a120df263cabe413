#include "role_credentials_provider.hpp"

#include <cstdint>
#include <utility>

#include "internal/aws/sdk_string.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace devicefarm::aws {

Aws::Auth::AWSCredentials ToSdkCredentials(const Credentials& credentials) {
  Aws::Auth::AWSCredentials out(ToAws(credentials.access_key_id), ToAws(credentials.secret_access_key),
                                ToAws(credentials.session_token));
  if (credentials.expiration != util::TimePoint{}) {
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(credentials.expiration.time_since_epoch());
    out.SetExpiration(Aws::Utils::DateTime(static_cast<int64_t>(millis.count())));
  }
  return out;
}

RoleCredentialsProvider::RoleCredentialsProvider(RoleExchangerPtr exchanger, std::string role_arn, std::string session_name)
    : exchanger_(std::move(exchanger)), role_arn_(std::move(role_arn)), session_name_(std::move(session_name)) {
  if (!exchanger_) {
    throw util::CredentialsError("aws.role_arn is set but no role exchanger is available");
  }
  Renew();
}

void RoleCredentialsProvider::Renew() {
  auto next = exchanger_->AssumeRole(role_arn_, session_name_);

  std::lock_guard<std::mutex> lock(mutex_);
  current_ = std::move(next);
}

bool RoleCredentialsProvider::ExpiresSoon() const {
  if (current_.expiration == util::TimePoint{}) {
    return false;
  }
  return util::Now() + kRoleRefreshMargin >= current_.expiration;
}

Aws::Auth::AWSCredentials RoleCredentialsProvider::GetAWSCredentials() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (ExpiresSoon()) {
    try {
      current_ = exchanger_->AssumeRole(role_arn_, session_name_);
      DEVICEFARM_LOG_INFO("role session renewed", {observability::StringField("role_arn", role_arn_)});
    } catch (const util::CredentialsError& e) {
      DEVICEFARM_LOG_ERROR("role session renewal failed",
                           {observability::StringField("role_arn", role_arn_), observability::StringField("error", e.what())});
    }
  }
  return ToSdkCredentials(current_);
}

} // namespace devicefarm::aws
