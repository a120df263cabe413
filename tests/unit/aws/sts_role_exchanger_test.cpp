#include "internal/aws/sts_role_exchanger.hpp"

#include <aws/core/auth/AWSCredentials.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/sts/STSErrors.h>
#include <aws/sts/model/AssumeRoleRequest.h>
#include <aws/sts/model/AssumeRoleResult.h>
#include <aws/sts/model/Credentials.h>

#include <cassert>
#include <cstdint>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/aws/role_credentials_provider.hpp"
#include "internal/aws/sdk_session.hpp"
#include "internal/util/errors.hpp"

using devicefarm::aws::Credentials;
using devicefarm::aws::RoleCredentialsProvider;
using devicefarm::aws::StsRoleExchanger;

namespace sts = Aws::STS::Model;

namespace {

constexpr const char* kRole = "arn:aws:iam::123456789012:role/DeviceFarmRunner";

/*
  STSClient answering AssumeRole with a canned outcome and remembering the
  last request.
*/
class CannedStsClient final : public Aws::STS::STSClient {
 public:
  CannedStsClient() : Aws::STS::STSClient(Aws::Auth::AWSCredentials("AKIDEXAMPLE", "secret"), Aws::Client::ClientConfiguration("default", true)) {}

  sts::AssumeRoleOutcome AssumeRole(const sts::AssumeRoleRequest& request) const override {
    last_role    = request.GetRoleArn();
    last_session = request.GetRoleSessionName();
    return answer;
  }

  sts::AssumeRoleOutcome answer;

  mutable Aws::String last_role;
  mutable Aws::String last_session;
};

sts::AssumeRoleOutcome Granted(const char* key_id) {
  sts::Credentials credentials;
  credentials.SetAccessKeyId(key_id);
  credentials.SetSecretAccessKey("tempsecret");
  credentials.SetSessionToken("tok");
  credentials.SetExpiration(Aws::Utils::DateTime(static_cast<int64_t>(1700000000000LL)));

  sts::AssumeRoleResult result;
  result.SetCredentials(credentials);
  return sts::AssumeRoleOutcome(result);
}

sts::AssumeRoleOutcome Refused(Aws::STS::STSErrors type, const char* name, Aws::Http::HttpResponseCode status) {
  Aws::Client::AWSError<Aws::STS::STSErrors> error(type, name, "not authorized to perform sts:AssumeRole", false);
  error.SetResponseCode(status);
  return sts::AssumeRoleOutcome(error);
}

void TestAssumeRoleReturnsSessionCredentials() {
  auto client    = std::make_shared<CannedStsClient>();
  client->answer = Granted("ASIATEMP");

  StsRoleExchanger exchanger(client);
  const auto       session = exchanger.AssumeRole(kRole, "devicefarm-abcd1234");

  assert(session.access_key_id == "ASIATEMP");
  assert(session.secret_access_key == "tempsecret");
  assert(session.session_token == "tok");
  assert(session.expiration == devicefarm::util::FromEpochSeconds(1700000000.0));

  assert(client->last_role == kRole);
  assert(client->last_session == "devicefarm-abcd1234");
}

void TestRefusedExchangeIsCredentialsError() {
  auto client    = std::make_shared<CannedStsClient>();
  client->answer = Refused(Aws::STS::STSErrors::ACCESS_DENIED, "AccessDenied", Aws::Http::HttpResponseCode::FORBIDDEN);

  bool caught = false;
  try {
    (void)StsRoleExchanger(client).AssumeRole(kRole, "devicefarm-x");
  } catch (const devicefarm::util::CredentialsError& e) {
    caught = true;
    assert(std::string(e.what()).find("rejected: AccessDenied (HTTP 403)") != std::string::npos);
  }
  assert(caught);
}

void TestUnreachableOrEmptyIsCredentialsError() {
  int failures = 0;

  auto unreachable    = std::make_shared<CannedStsClient>();
  unreachable->answer = Refused(Aws::STS::STSErrors::NETWORK_CONNECTION, "", Aws::Http::HttpResponseCode::REQUEST_NOT_MADE);
  try {
    (void)StsRoleExchanger(unreachable).AssumeRole(kRole, "s");
  } catch (const devicefarm::util::CredentialsError& e) {
    assert(std::string(e.what()).find("failed") != std::string::npos);
    ++failures;
  }

  auto empty    = std::make_shared<CannedStsClient>();
  empty->answer = sts::AssumeRoleOutcome(sts::AssumeRoleResult());
  try {
    (void)StsRoleExchanger(empty).AssumeRole(kRole, "s");
  } catch (const devicefarm::util::CredentialsError&) {
    ++failures;
  }

  assert(failures == 2);
}

/*
  Exchanger handing out sessions that expire `lifetime` from now. Can be
  switched to refuse.
*/
class ScriptedExchanger final : public devicefarm::aws::RoleExchanger {
 public:
  explicit ScriptedExchanger(std::chrono::minutes lifetime) : lifetime_(lifetime) {}

  Credentials AssumeRole(const std::string&, const std::string&) override {
    if (refuse) {
      throw devicefarm::util::CredentialsError("AssumeRole refused");
    }
    ++calls;
    Credentials credentials;
    credentials.access_key_id     = "ASIA" + std::to_string(calls);
    credentials.secret_access_key = "tempsecret";
    credentials.session_token     = "tok";
    credentials.expiration        = devicefarm::util::Now() + lifetime_;
    return credentials;
  }

  int  calls  = 0;
  bool refuse = false;

 private:
  std::chrono::minutes lifetime_;
};

void TestSessionRenewedNearExpiry() {
  auto                    short_lived = std::make_shared<ScriptedExchanger>(std::chrono::minutes(1));
  RoleCredentialsProvider provider(short_lived, kRole, "devicefarm-renew");
  assert(short_lived->calls == 1);

  assert(provider.GetAWSCredentials().GetAWSAccessKeyId() == "ASIA2");
  assert(short_lived->calls == 2);

  // A refused renewal keeps the last session.
  short_lived->refuse = true;
  assert(provider.GetAWSCredentials().GetAWSAccessKeyId() == "ASIA2");

  auto                    long_lived = std::make_shared<ScriptedExchanger>(std::chrono::minutes(60));
  RoleCredentialsProvider stable(long_lived, kRole, "devicefarm-stable");
  assert(stable.GetAWSCredentials().GetAWSAccessKeyId() == "ASIA1");
  assert(stable.GetAWSCredentials().GetAWSAccessKeyId() == "ASIA1");
  assert(long_lived->calls == 1);
}

void TestFirstExchangeFailureThrows() {
  auto exchanger    = std::make_shared<ScriptedExchanger>(std::chrono::minutes(60));
  exchanger->refuse = true;

  bool caught = false;
  try {
    RoleCredentialsProvider provider(exchanger, kRole, "devicefarm-x");
  } catch (const devicefarm::util::CredentialsError&) {
    caught = true;
  }
  assert(caught);
}

} // namespace

int main() {
  const auto sdk = devicefarm::aws::SdkSession::Acquire();

  TestAssumeRoleReturnsSessionCredentials();
  TestRefusedExchangeIsCredentialsError();
  TestUnreachableOrEmptyIsCredentialsError();
  TestSessionRenewedNearExpiry();
  TestFirstExchangeFailureThrows();

  std::cout << "sts_role_exchanger_test: pass\n";
  return 0;
}
