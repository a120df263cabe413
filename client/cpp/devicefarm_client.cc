#include "client/cpp/devicefarm_client.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <exception>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

#include "internal/model/upload_status.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/arn.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/file_io.hpp"
#include "internal/util/result_layout.hpp"
#include "internal/util/status.hpp"

namespace devicefarm::client {

namespace {

namespace v1 = devicefarm::v1;

// Runs `fn`, translating internal exceptions into arrow::Status.
template <typename Fn>
auto Guarded(Fn&& fn) -> arrow::Result<decltype(fn())> {
  try {
    return fn();
  } catch (const std::exception& e) {
    return util::ToStatus(e);
  }
}

// Follows next_token until the service reports no further page.
template <typename Request, typename Fetch, typename Items>
auto CollectPages(Request request, Fetch fetch, Items items) {
  using Item = typename std::decay_t<decltype(items(fetch(request)))>::value_type;

  std::vector<Item> out;
  do {
    const auto response = fetch(request);
    const auto& page    = items(response);
    out.insert(out.end(), page.begin(), page.end());
    request.set_next_token(response.next_token());
  } while (!request.next_token().empty());
  return out;
}

std::string Upper(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return value;
}

void CreateDirectories(const std::filesystem::path& dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    throw std::runtime_error("cannot create directory " + dir.string() + ": " + ec.message());
  }
}

} // namespace

DeviceFarmClient::DeviceFarmClient(std::shared_ptr<api::DeviceFarmApi> api, std::shared_ptr<http::HttpClient> http, ClientOptions options)
    : api_(std::move(api)),
      http_(std::move(http)),
      progress_(std::move(options.progress)),
      poll_(options.poll),
      sleeper_(std::move(options.sleeper)) {
  if (!api_) {
    throw std::invalid_argument("DeviceFarmClient requires an api");
  }
  if (!http_) {
    throw std::invalid_argument("DeviceFarmClient requires an http client");
  }
  if (!sleeper_) {
    sleeper_ = std::make_shared<poll::InterruptibleSleeper>();
  }
}

void DeviceFarmClient::Progress(const std::string& message) const {
  if (progress_) {
    progress_->info("[DeviceFarm] {}", message);
  }
}

// ---------------------------------------------------------------------------
// Paged listings
// ---------------------------------------------------------------------------

std::vector<v1::Project> DeviceFarmClient::AllProjects() const {
  return CollectPages(
      v1::ListProjectsRequest{}, [this](const v1::ListProjectsRequest& r) { return api_->ListProjects(r); },
      [](const v1::ListProjectsResponse& r) -> const auto& { return r.projects(); });
}

std::vector<v1::DevicePool> DeviceFarmClient::AllDevicePools(const std::string& project_arn) const {
  v1::ListDevicePoolsRequest request;
  request.set_arn(project_arn);
  return CollectPages(
      request, [this](const v1::ListDevicePoolsRequest& r) { return api_->ListDevicePools(r); },
      [](const v1::ListDevicePoolsResponse& r) -> const auto& { return r.device_pools(); });
}

std::vector<v1::Device> DeviceFarmClient::AllDevices(const std::string& project_arn) const {
  v1::ListDevicesRequest request;
  request.set_arn(project_arn);
  return CollectPages(
      request, [this](const v1::ListDevicesRequest& r) { return api_->ListDevices(r); },
      [](const v1::ListDevicesResponse& r) -> const auto& { return r.devices(); });
}

std::vector<v1::Job> DeviceFarmClient::AllJobs(const std::string& run_arn) const {
  v1::ListJobsRequest request;
  request.set_arn(run_arn);
  return CollectPages(
      request, [this](const v1::ListJobsRequest& r) { return api_->ListJobs(r); },
      [](const v1::ListJobsResponse& r) -> const auto& { return r.jobs(); });
}

std::vector<v1::Suite> DeviceFarmClient::AllSuites(const std::string& job_arn) const {
  v1::ListSuitesRequest request;
  request.set_arn(job_arn);
  return CollectPages(
      request, [this](const v1::ListSuitesRequest& r) { return api_->ListSuites(r); },
      [](const v1::ListSuitesResponse& r) -> const auto& { return r.suites(); });
}

std::vector<v1::Test> DeviceFarmClient::AllTests(const std::string& suite_arn) const {
  v1::ListTestsRequest request;
  request.set_arn(suite_arn);
  return CollectPages(
      request, [this](const v1::ListTestsRequest& r) { return api_->ListTests(r); },
      [](const v1::ListTestsResponse& r) -> const auto& { return r.tests(); });
}

std::vector<v1::Artifact> DeviceFarmClient::AllArtifacts(const std::string& run_arn, model::ArtifactCategory category) const {
  v1::ListArtifactsRequest request;
  request.set_arn(run_arn);
  request.set_type(std::string(model::ToString(category)));
  return CollectPages(
      request, [this](const v1::ListArtifactsRequest& r) { return api_->ListArtifacts(r); },
      [](const v1::ListArtifactsResponse& r) -> const auto& { return r.artifacts(); });
}

// ---------------------------------------------------------------------------
// Discovery
// ---------------------------------------------------------------------------

v1::Project DeviceFarmClient::FindProject(const std::string& name) const {
  for (const auto& project : AllProjects()) {
    if (project.name() == name) {
      return project;
    }
  }
  throw util::NotFound("Project '" + name + "' not found.");
}

v1::DevicePool DeviceFarmClient::FindDevicePool(const std::string& project_arn, const std::string& name) const {
  for (const auto& pool : AllDevicePools(project_arn)) {
    if (pool.name() == name) {
      return pool;
    }
  }
  throw util::NotFound("DevicePool '" + name + "' not found.");
}

std::optional<v1::AccountSettings> DeviceFarmClient::FetchAccountSettings() const {
  try {
    return api_->GetAccountSettings(v1::GetAccountSettingsRequest{}).account_settings();
  } catch (const util::ServiceError& e) {
    if (!e.IsNotFound()) {
      throw;
    }
    return std::nullopt;
  }
}

arrow::Result<std::vector<v1::Project>> DeviceFarmClient::ListProjects() const {
  return Guarded([&] { return AllProjects(); });
}

arrow::Result<v1::Project> DeviceFarmClient::GetProject(const std::string& name) const {
  return Guarded([&] { return FindProject(name); });
}

arrow::Result<std::vector<v1::DevicePool>> DeviceFarmClient::ListDevicePools(const v1::Project& project) const {
  return Guarded([&] { return AllDevicePools(project.arn()); });
}

arrow::Result<v1::DevicePool> DeviceFarmClient::GetDevicePool(const v1::Project& project, const std::string& name) const {
  return Guarded([&] { return FindDevicePool(project.arn(), name); });
}

arrow::Result<v1::DevicePool> DeviceFarmClient::GetDevicePool(const std::string& project_name, const std::string& name) const {
  return Guarded([&] { return FindDevicePool(FindProject(project_name).arn(), name); });
}

arrow::Result<std::vector<v1::Device>> DeviceFarmClient::ListDevices(const v1::Project& project) const {
  return Guarded([&] { return AllDevices(project.arn()); });
}

arrow::Result<std::vector<v1::Device>> DeviceFarmClient::ListDevices(const std::string& project_name) const {
  return Guarded([&] { return AllDevices(FindProject(project_name).arn()); });
}

arrow::Result<std::optional<v1::AccountSettings>> DeviceFarmClient::GetAccountSettings() const {
  return Guarded([&] { return FetchAccountSettings(); });
}

arrow::Result<std::int32_t> DeviceFarmClient::GetUnmeteredDeviceCount(const std::string& os) const {
  return Guarded([&]() -> std::int32_t {
    const auto platform = Upper(os);
    if (platform != "ANDROID" && platform != "IOS") {
      return 0;
    }

    const auto settings = FetchAccountSettings();
    if (!settings) {
      return 0;
    }
    const auto& unmetered = settings->unmetered_devices();
    const auto  it        = unmetered.find(platform);
    return it == unmetered.end() ? 0 : it->second;
  });
}

arrow::Result<std::string> DeviceFarmClient::AppPlatformFor(const std::string& path) {
  return Guarded([&] { return model::AppPlatformFor(path); });
}

// ---------------------------------------------------------------------------
// Uploads
// ---------------------------------------------------------------------------

arrow::Result<v1::Upload> DeviceFarmClient::UploadApp(const v1::Project& project, const std::string& path) const {
  return Guarded([&] { return UploadArtifact(project.arn(), path, model::ClassifyApp(path)); });
}

arrow::Result<v1::Upload> DeviceFarmClient::UploadExtraData(const v1::Project& project, const std::string& path) const {
  return Guarded([&] { return UploadArtifact(project.arn(), path, model::ClassifyExtraData(path)); });
}

arrow::Result<v1::Upload> DeviceFarmClient::UploadTest(const v1::Project& project, const model::TestSpec& test) const {
  return Guarded([&] { return UploadArtifact(project.arn(), model::ArtifactPathOf(test), model::UploadTypeFor(test)); });
}

arrow::Result<v1::Upload> DeviceFarmClient::Upload(const v1::Project& project, const std::string& path, model::UploadType type) const {
  return Guarded([&] { return UploadArtifact(project.arn(), path, type); });
}

v1::Upload DeviceFarmClient::UploadArtifact(const std::string& project_arn, const std::string& path, model::UploadType type) const {
  if (path.empty()) {
    throw util::MissingArtifactPath("Must have an artifact path.");
  }
  const std::filesystem::path file(path);
  std::error_code             ec;
  if (!std::filesystem::is_regular_file(file, ec)) {
    throw util::LocalFileNotFound("File artifact " + path + " not found.");
  }

  const auto type_name = std::string(model::ToString(type));

  v1::CreateUploadRequest create;
  create.set_project_arn(project_arn);
  create.set_name(file.filename().string());
  create.set_type(type_name);
  create.set_content_type(kUploadContentType);
  const auto upload = api_->CreateUpload(create).upload();

  Progress("Uploading " + upload.name() + " as " + type_name + " (" + upload.arn() + ")");

  http::HttpRequest put;
  put.method                  = "PUT";
  put.url                     = upload.url();
  put.headers["Content-Type"] = upload.content_type();
  put.body                    = util::file_io::ReadFile(file);

  http::HttpResponse response;
  try {
    response = http_->Execute(put);
  } catch (const util::TransportError& e) {
    throw util::UploadTransportFailure("Upload of " + path + " failed: " + e.what());
  }
  if (response.status != 200) {
    throw util::UploadRejected("Upload returned non-200 responses: " + std::to_string(response.status), response.status);
  }

  return WaitForUpload(upload);
}

v1::Upload DeviceFarmClient::WaitForUpload(const v1::Upload& upload) const {
  v1::GetUploadRequest request;
  request.set_arn(upload.arn());

  std::chrono::milliseconds waited{0};
  auto                      previous = model::ParseUploadStatus(upload.status());
  while (true) {
    const auto current = api_->GetUpload(request).upload();
    const auto status  = model::ParseUploadStatus(current.status());

    if (!model::CanTransition(previous, status)) {
      DEVICEFARM_LOG_WARN("unexpected upload status", {observability::StringField("upload", upload.arn()),
                                                       observability::StringField("status", current.status())});
    }

    if (model::IsTerminal(status)) {
      if (status == model::UploadStatus::kFailed) {
        Progress("Upload " + upload.name() + " failed: " + current.metadata());
        throw util::UploadFailed("Upload " + upload.name() + " failed: " + current.metadata(), current.metadata());
      }
      Progress("Upload " + upload.name() + " succeeded.");
      return current;
    }
    if (status != model::UploadStatus::kUnspecified) {
      previous = status;
    }

    if (poll_.timeout.count() > 0 && waited + poll_.interval > poll_.timeout) {
      throw util::UploadTimedOut("Upload " + upload.name() + " did not finish within " + std::to_string(poll_.timeout.count()) +
                                 " ms (last status: " + current.status() + ")");
    }

    Progress("Waiting for upload " + upload.name() + " to be ready (current status: " + current.status() + ")");
    if (!sleeper_->SleepFor(poll_.interval)) {
      Progress("Thread interrupted while waiting for upload " + upload.name() + ".");
      throw util::WaitInterrupted("Thread interrupted while waiting for the upload to complete.");
    }
    waited += poll_.interval;
  }
}

// ---------------------------------------------------------------------------
// Runs
// ---------------------------------------------------------------------------

arrow::Result<v1::Run> DeviceFarmClient::ScheduleRun(const ScheduleRunOptions& options) const {
  return Guarded([&] {
    v1::ScheduleRunRequest request;
    request.set_project_arn(options.project_arn);
    request.set_name(options.name);
    request.set_device_pool_arn(options.device_pool_arn);
    *request.mutable_test() = options.test;

    if (options.job_timeout_minutes != kDefaultJobTimeoutMinutes) {
      request.mutable_execution_configuration()->set_job_timeout_minutes(options.job_timeout_minutes);
    }
    if (options.app_arn) {
      request.set_app_arn(*options.app_arn);
    }
    if (options.configuration) {
      *request.mutable_configuration() = *options.configuration;
    }

    return api_->ScheduleRun(request).run();
  });
}

arrow::Result<v1::Run> DeviceFarmClient::DescribeRun(const std::string& run_arn) const {
  return Guarded([&] {
    v1::GetRunRequest request;
    request.set_arn(run_arn);
    return api_->GetRun(request).run();
  });
}

arrow::Result<std::vector<v1::Job>> DeviceFarmClient::ListJobs(const std::string& run_arn) const {
  return Guarded([&] { return AllJobs(run_arn); });
}

arrow::Result<std::vector<v1::Suite>> DeviceFarmClient::ListSuites(const std::string& job_arn) const {
  return Guarded([&] { return AllSuites(job_arn); });
}

arrow::Result<std::vector<v1::Test>> DeviceFarmClient::ListTests(const std::string& suite_arn) const {
  return Guarded([&] { return AllTests(suite_arn); });
}

arrow::Result<std::vector<v1::Artifact>> DeviceFarmClient::ListArtifacts(const std::string& run_arn, model::ArtifactCategory category) const {
  return Guarded([&] { return AllArtifacts(run_arn, category); });
}

// ---------------------------------------------------------------------------
// Artifact collection
// ---------------------------------------------------------------------------

std::shared_ptr<arrow::Buffer> DeviceFarmClient::Download(const v1::Artifact& artifact) const {
  http::HttpRequest request;
  request.method = "GET";
  request.url    = artifact.url();

  const auto response = http_->Execute(request);
  if (response.status != 200) {
    throw util::TransportError("Download of " + artifact.arn() + " returned HTTP " + std::to_string(response.status));
  }
  return response.body ? response.body : arrow::Buffer::FromString(std::string());
}

arrow::Result<ArtifactCollection> DeviceFarmClient::GetArtifacts(const std::string& run_arn, const std::filesystem::path& destination) const {
  return Guarded([&] {
    ArtifactCollection out;

    for (const auto& job : AllJobs(run_arn)) {
      const auto dir = destination / util::layout::JobDirectoryName(job);
      CreateDirectories(dir);
      out.jobs[util::arn::ResourcePath(job.arn())] = dir;
    }

    for (const auto& [job_key, job_dir] : out.jobs) {
      for (const auto& suite : AllSuites(util::arn::WithResource(run_arn, "job", job_key))) {
        const auto dir = job_dir / util::layout::SuiteDirectoryName(suite);
        CreateDirectories(dir);
        out.suites[util::arn::ResourcePath(suite.arn())] = dir;
      }
    }

    for (const auto& [suite_key, suite_dir] : out.suites) {
      for (const auto& test : AllTests(util::arn::WithResource(run_arn, "suite", suite_key))) {
        const auto dir = suite_dir / util::layout::TestDirectoryName(test);
        CreateDirectories(dir);
        out.tests[util::arn::ResourcePath(test.arn())] = dir;
      }
    }

    for (const auto category : model::kAllArtifactCategories) {
      for (const auto& artifact : AllArtifacts(run_arn, category)) {
        const auto key  = util::arn::SplitLast(util::arn::ResourcePath(artifact.arn()));
        const auto test = out.tests.find(key.parent);
        if (test == out.tests.end()) {
          throw util::NotFound("No test directory for artifact " + artifact.arn());
        }

        const auto path = util::layout::ArtifactPath(test->second, artifact);
        util::file_io::WriteFile(path, Download(artifact));
        out.artifacts.push_back(path);
      }
    }

    return out;
  });
}

} // namespace devicefarm::client
