#pragma once

#include <arrow/result.h>
#include <arrow/status.h>
#include <spdlog/logger.h>

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "api/devicefarm/v1.hpp"
#include "internal/api/device_farm_api.hpp"
#include "internal/http/http_client.hpp"
#include "internal/model/artifact_category.hpp"
#include "internal/model/test_spec.hpp"
#include "internal/model/upload_type.hpp"
#include "internal/poll/sleeper.hpp"

namespace devicefarm::client {

inline constexpr std::int32_t kDefaultJobTimeoutMinutes = 60;
inline constexpr const char*  kUploadContentType        = "application/octet-stream";

struct ClientOptions {
  // Receives "[DeviceFarm] ..." progress lines. Null disables them.
  std::shared_ptr<spdlog::logger> progress;
  poll::PollPolicy                poll;
  // Defaults to an InterruptibleSleeper owned by the client.
  std::shared_ptr<poll::Sleeper>  sleeper;
};

struct ScheduleRunOptions {
  std::string                                 project_arn;
  std::string                                 name;
  std::string                                 device_pool_arn;
  devicefarm::v1::ScheduleRunTest             test;
  std::optional<std::string>                  app_arn;
  std::optional<devicefarm::v1::ScheduleRunConfiguration> configuration;
  std::int32_t                                job_timeout_minutes = kDefaultJobTimeoutMinutes;
};

/*
  Result of GetArtifacts.

  jobs / suites / tests map each resource path (segment 6 of the resource
  name) to the local directory created for it. artifacts lists the written
  files in download order.
*/
struct ArtifactCollection {
  std::map<std::string, std::filesystem::path> jobs;
  std::map<std::string, std::filesystem::path> suites;
  std::map<std::string, std::filesystem::path> tests;
  std::vector<std::filesystem::path>           artifacts;
};

class DeviceFarmClient {
 public:
  DeviceFarmClient(std::shared_ptr<api::DeviceFarmApi> api, std::shared_ptr<http::HttpClient> http, ClientOptions options = {});

  // Discovery

  arrow::Result<std::vector<devicefarm::v1::Project>> ListProjects() const;

  arrow::Result<devicefarm::v1::Project> GetProject(const std::string& name) const;

  arrow::Result<std::vector<devicefarm::v1::DevicePool>> ListDevicePools(const devicefarm::v1::Project& project) const;

  arrow::Result<devicefarm::v1::DevicePool> GetDevicePool(const devicefarm::v1::Project& project, const std::string& name) const;
  arrow::Result<devicefarm::v1::DevicePool> GetDevicePool(const std::string& project_name, const std::string& name) const;

  arrow::Result<std::vector<devicefarm::v1::Device>> ListDevices(const devicefarm::v1::Project& project) const;
  arrow::Result<std::vector<devicefarm::v1::Device>> ListDevices(const std::string& project_name) const;

  // std::nullopt when the account has no settings resource.
  arrow::Result<std::optional<devicefarm::v1::AccountSettings>> GetAccountSettings() const;

  // "ANDROID" or "IOS", any case. 0 for other platforms or missing settings.
  arrow::Result<std::int32_t> GetUnmeteredDeviceCount(const std::string& os) const;

  static arrow::Result<std::string> AppPlatformFor(const std::string& path);

  // Uploads. Each blocks until the service reports a terminal status.

  arrow::Result<devicefarm::v1::Upload> UploadApp(const devicefarm::v1::Project& project, const std::string& path) const;

  arrow::Result<devicefarm::v1::Upload> UploadExtraData(const devicefarm::v1::Project& project, const std::string& path) const;

  arrow::Result<devicefarm::v1::Upload> UploadTest(const devicefarm::v1::Project& project, const model::TestSpec& test) const;

  arrow::Result<devicefarm::v1::Upload> Upload(const devicefarm::v1::Project& project, const std::string& path,
                                               model::UploadType type) const;

  // Runs

  arrow::Result<devicefarm::v1::Run> ScheduleRun(const ScheduleRunOptions& options) const;

  arrow::Result<devicefarm::v1::Run> DescribeRun(const std::string& run_arn) const;

  arrow::Result<std::vector<devicefarm::v1::Job>>   ListJobs(const std::string& run_arn) const;
  arrow::Result<std::vector<devicefarm::v1::Suite>> ListSuites(const std::string& job_arn) const;
  arrow::Result<std::vector<devicefarm::v1::Test>>  ListTests(const std::string& suite_arn) const;

  arrow::Result<std::vector<devicefarm::v1::Artifact>> ListArtifacts(const std::string& run_arn, model::ArtifactCategory category) const;

  /*
    Downloads every artifact of a run into

        <destination>/<job dir>/<suite name>/<test name>/<artifact name>-<id>.<ext>

    Files written before a failure stay on disk.
  */
  arrow::Result<ArtifactCollection> GetArtifacts(const std::string& run_arn, const std::filesystem::path& destination) const;

 private:
  std::vector<devicefarm::v1::Project>    AllProjects() const;
  std::vector<devicefarm::v1::DevicePool> AllDevicePools(const std::string& project_arn) const;
  std::vector<devicefarm::v1::Device>     AllDevices(const std::string& project_arn) const;
  std::vector<devicefarm::v1::Job>        AllJobs(const std::string& run_arn) const;
  std::vector<devicefarm::v1::Suite>      AllSuites(const std::string& job_arn) const;
  std::vector<devicefarm::v1::Test>       AllTests(const std::string& suite_arn) const;
  std::vector<devicefarm::v1::Artifact>   AllArtifacts(const std::string& run_arn, model::ArtifactCategory category) const;

  devicefarm::v1::Project    FindProject(const std::string& name) const;
  devicefarm::v1::DevicePool FindDevicePool(const std::string& project_arn, const std::string& name) const;

  std::optional<devicefarm::v1::AccountSettings> FetchAccountSettings() const;

  devicefarm::v1::Upload UploadArtifact(const std::string& project_arn, const std::string& path, model::UploadType type) const;
  devicefarm::v1::Upload WaitForUpload(const devicefarm::v1::Upload& upload) const;

  std::shared_ptr<arrow::Buffer> Download(const devicefarm::v1::Artifact& artifact) const;

  void Progress(const std::string& message) const;

  std::shared_ptr<api::DeviceFarmApi> api_;
  std::shared_ptr<http::HttpClient>   http_;
  std::shared_ptr<spdlog::logger>     progress_;
  poll::PollPolicy                    poll_;
  std::shared_ptr<poll::Sleeper>      sleeper_;
};

} // namespace devicefarm::client
