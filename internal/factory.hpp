#pragma once

#include <aws/core/auth/AWSCredentialsProvider.h>
#include <aws/core/client/ClientConfiguration.h>

#include <memory>
#include <string>

#include "config/config.pb.h"

#include "client/cpp/devicefarm_client.h"
#include "internal/api/device_farm_api.hpp"
#include "internal/aws/role_exchanger.hpp"
#include "internal/aws/sdk_session.hpp"
#include "internal/http/http_client.hpp"
#include "internal/poll/sleeper.hpp"

namespace devicefarm::factory {

/*
  ClientDependencies

  Everything a DeviceFarmClient needs, owned together. `sdk` is declared
  first so the SDK outlives every client built on it. The sleeper is exposed
  so the caller can interrupt a pending upload wait from another thread.
*/
struct ClientDependencies {
  std::shared_ptr<aws::SdkSession>                   sdk;
  std::shared_ptr<Aws::Auth::AWSCredentialsProvider> credentials;
  std::shared_ptr<http::HttpClient>                  http;
  std::shared_ptr<api::DeviceFarmApi>                api;
  std::shared_ptr<poll::InterruptibleSleeper>        sleeper;
  std::shared_ptr<client::DeviceFarmClient>          client;
};

// "devicefarm-" followed by 8 random alphanumerics.
std::string MakeSessionName();

/*
  SDK client settings from config: region, endpoint override, user agent,
  request timeout and TLS verification. Requires a live SdkSession.
*/
Aws::Client::ClientConfiguration MakeSdkConfiguration(const devicefarm::runtime::config::ClientConfig& config,
                                                      const std::string& region, const std::string& endpoint);

/*
  Credentials the SDK signs with.

  Static credentials come from config. When aws.role_arn is set they are
  exchanged for a temporary session of that role through `exchanger`, once
  here and again before each session expires.
  Throws util::CredentialsError when nothing usable is configured or the
  first exchange fails.
*/
std::shared_ptr<Aws::Auth::AWSCredentialsProvider> MakeCredentialsProvider(const devicefarm::runtime::config::ClientConfig& config,
                                                                           aws::RoleExchangerPtr exchanger);

/*
  BuildClient

  Composition root: config -> sdk -> credentials -> api -> client.
  The only place that knows the concrete transport and API types. A null
  sleeper gets a fresh one.
*/
ClientDependencies BuildClient(const devicefarm::runtime::config::ClientConfig& config,
                               std::shared_ptr<poll::InterruptibleSleeper> sleeper = nullptr);

// Same, over a caller-supplied transfer client and role exchanger.
ClientDependencies BuildClient(const devicefarm::runtime::config::ClientConfig& config, std::shared_ptr<http::HttpClient> http,
                               aws::RoleExchangerPtr exchanger, std::shared_ptr<poll::InterruptibleSleeper> sleeper = nullptr);

} // namespace devicefarm::factory
