#include "factory.hpp"

#include <aws/devicefarm/DeviceFarmClient.h>
#include <aws/sts/STSClient.h>

#include <chrono>
#include <utility>

#include "internal/api/sdk_device_farm_api.hpp"
#include "internal/aws/credentials.hpp"
#include "internal/aws/role_credentials_provider.hpp"
#include "internal/aws/sdk_string.hpp"
#include "internal/aws/sts_role_exchanger.hpp"
#include "internal/http/beast_http_client.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/random.hpp"

namespace devicefarm::factory {

namespace {

constexpr std::size_t kSessionSuffixLength = 8;
constexpr const char* kAllocationTag       = "devicefarm-client";
constexpr long        kConnectTimeoutMs    = 10000;

aws::Credentials StaticCredentials(const devicefarm::runtime::config::ClientConfig& config) {
  const auto& configured = config.aws().credentials();

  aws::Credentials credentials;
  credentials.access_key_id     = configured.access_key_id();
  credentials.secret_access_key = configured.secret_access_key();
  credentials.session_token     = configured.session_token();
  return credentials;
}

std::shared_ptr<http::HttpClient> MakeHttpClient(const devicefarm::runtime::config::ClientConfig& config) {
  http::BeastHttpClient::Options options;
  if (!config.http().user_agent().empty()) {
    options.user_agent = config.http().user_agent();
  }
  if (config.http().timeout_ms() > 0) {
    options.timeout = std::chrono::milliseconds(config.http().timeout_ms());
  }
  options.verify_tls = !config.http().has_verify_tls() || config.http().verify_tls();
  return std::make_shared<http::BeastHttpClient>(std::move(options));
}

aws::RoleExchangerPtr MakeStsExchanger(const devicefarm::runtime::config::ClientConfig& config) {
  const auto sts = Aws::MakeShared<Aws::STS::STSClient>(
      kAllocationTag, aws::ToSdkCredentials(StaticCredentials(config)),
      MakeSdkConfiguration(config, aws::kStsRegion, config.aws().sts_endpoint()));
  return std::make_shared<aws::StsRoleExchanger>(sts);
}

} // namespace

std::string MakeSessionName() {
  return "devicefarm-" + util::RandomAlphanumeric(kSessionSuffixLength);
}

Aws::Client::ClientConfiguration MakeSdkConfiguration(const devicefarm::runtime::config::ClientConfig& config,
                                                      const std::string& region, const std::string& endpoint) {
  // Region and endpoint always come from config, not from instance metadata.
  Aws::Client::ClientConfiguration sdk("default", true);
  sdk.region = aws::ToAws(region);
  if (!endpoint.empty()) {
    sdk.endpointOverride = aws::ToAws(endpoint);
  }
  if (!config.http().user_agent().empty()) {
    sdk.userAgent = aws::ToAws(config.http().user_agent());
  }
  if (config.http().timeout_ms() > 0) {
    sdk.requestTimeoutMs = static_cast<long>(config.http().timeout_ms());
  }
  sdk.connectTimeoutMs = kConnectTimeoutMs;
  sdk.verifySSL        = !config.http().has_verify_tls() || config.http().verify_tls();
  return sdk;
}

std::shared_ptr<Aws::Auth::AWSCredentialsProvider> MakeCredentialsProvider(const devicefarm::runtime::config::ClientConfig& config,
                                                                           aws::RoleExchangerPtr exchanger) {
  const auto credentials = StaticCredentials(config);
  if (credentials.empty()) {
    throw util::CredentialsError("no AWS credentials configured (aws.credentials or AWS_ACCESS_KEY_ID/AWS_SECRET_ACCESS_KEY)");
  }

  const auto& role_arn = config.aws().role_arn();
  if (role_arn.empty()) {
    return Aws::MakeShared<Aws::Auth::SimpleAWSCredentialsProvider>(kAllocationTag, aws::ToSdkCredentials(credentials));
  }

  const auto session_name = MakeSessionName();
  DEVICEFARM_LOG_INFO("assuming role", {observability::StringField("role_arn", role_arn),
                                        observability::StringField("session", session_name)});
  return std::make_shared<aws::RoleCredentialsProvider>(std::move(exchanger), role_arn, session_name);
}

ClientDependencies BuildClient(const devicefarm::runtime::config::ClientConfig& config,
                               std::shared_ptr<poll::InterruptibleSleeper> sleeper) {
  auto sdk = aws::SdkSession::Acquire();

  aws::RoleExchangerPtr exchanger;
  if (!config.aws().role_arn().empty()) {
    exchanger = MakeStsExchanger(config);
  }

  auto deps = BuildClient(config, MakeHttpClient(config), std::move(exchanger), std::move(sleeper));
  deps.sdk  = std::move(sdk);
  return deps;
}

ClientDependencies BuildClient(const devicefarm::runtime::config::ClientConfig& config, std::shared_ptr<http::HttpClient> http,
                               aws::RoleExchangerPtr exchanger, std::shared_ptr<poll::InterruptibleSleeper> sleeper) {
  ClientDependencies deps;
  deps.sdk         = aws::SdkSession::Acquire();
  deps.http        = std::move(http);
  deps.credentials = MakeCredentialsProvider(config, std::move(exchanger));

  const auto region = config.aws().region().empty() ? std::string(api::kDeviceFarmRegion) : config.aws().region();
  const auto device_farm =
      Aws::MakeShared<Aws::DeviceFarm::DeviceFarmClient>(kAllocationTag, deps.credentials,
                                                         MakeSdkConfiguration(config, region, config.aws().endpoint()));
  deps.api = std::make_shared<api::SdkDeviceFarmApi>(device_farm);

  deps.sleeper = sleeper ? std::move(sleeper) : std::make_shared<poll::InterruptibleSleeper>();

  client::ClientOptions options;
  options.progress = observability::MakeProgressLogger(config);
  if (config.upload().poll_interval_ms() > 0) {
    options.poll.interval = std::chrono::milliseconds(config.upload().poll_interval_ms());
  }
  options.poll.timeout = std::chrono::milliseconds(config.upload().timeout_ms());
  options.sleeper      = deps.sleeper;

  deps.client = std::make_shared<client::DeviceFarmClient>(deps.api, deps.http, std::move(options));

  DEVICEFARM_LOG_INFO("device farm client ready", {observability::StringField("region", region)});
  return deps;
}

} // namespace devicefarm::factory
