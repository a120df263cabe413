#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "client/cpp/devicefarm_client.h"
#include "internal/poll/sleeper.hpp"
#include "internal/util/status.hpp"
#include "tests/support/fake_device_farm_api.hpp"
#include "tests/support/fake_http_client.hpp"
#include "tests/support/recording_sleeper.hpp"

using devicefarm::client::ClientOptions;
using devicefarm::client::DeviceFarmClient;
using devicefarm::testing::FakeDeviceFarmApi;
using devicefarm::testing::FakeHttpClient;
using devicefarm::testing::RecordingSleeper;
using devicefarm::util::ErrorKind;
using devicefarm::util::KindOf;

namespace {

constexpr const char* kUploadUrl = "https://uploads.example.com/put/1";

struct Fixture {
  std::shared_ptr<FakeDeviceFarmApi>  api     = std::make_shared<FakeDeviceFarmApi>();
  std::shared_ptr<FakeHttpClient>     http    = std::make_shared<FakeHttpClient>();
  std::shared_ptr<RecordingSleeper>   sleeper = std::make_shared<RecordingSleeper>();
  std::shared_ptr<std::ostringstream> lines   = std::make_shared<std::ostringstream>();
  std::unique_ptr<DeviceFarmClient>   client;
  devicefarm::v1::Project             project;

  explicit Fixture(std::chrono::milliseconds timeout = std::chrono::milliseconds(0)) {
    api->created_upload.set_arn("arn:aws:devicefarm:us-west-2:123456789012:upload:project-1/upload-1");
    api->created_upload.set_url(kUploadUrl);
    api->created_upload.set_content_type("application/octet-stream");

    auto sink   = std::make_shared<spdlog::sinks::ostream_sink_mt>(*lines);
    auto logger = std::make_shared<spdlog::logger>("upload_test", sink);
    logger->set_pattern("%v");

    ClientOptions options;
    options.progress     = logger;
    options.sleeper      = sleeper;
    options.poll.timeout = timeout;
    client = std::make_unique<DeviceFarmClient>(api, http, options);

    project.set_arn("arn:aws:devicefarm:us-west-2:123456789012:project:project-1");
    project.set_name("project");
  }
};

std::filesystem::path WriteArtifact(const std::string& name, const std::string& content) {
  const auto dir = std::filesystem::temp_directory_path() / "devicefarm_upload_tests";
  std::filesystem::create_directories(dir);
  const auto    path = dir / name;
  std::ofstream out(path, std::ios::binary);
  out << content;
  return path;
}

void TestPendingPendingSucceededWaitsTwice() {
  Fixture f;
  f.api->upload_statuses = {"PROCESSING", "PROCESSING", "SUCCEEDED"};
  const auto path        = WriteArtifact("app.apk", "apk-bytes");

  auto upload = f.client->UploadApp(f.project, path.string());
  assert(upload.ok());
  assert(upload->status() == "SUCCEEDED");

  assert(f.sleeper->waits.size() == 2);
  for (const auto& wait : f.sleeper->waits) {
    assert(wait == std::chrono::milliseconds(5000));
  }
  assert(f.api->get_upload_requests.size() == 3);

  // CreateUpload request shape.
  assert(f.api->create_requests.size() == 1);
  const auto& create = f.api->create_requests.front();
  assert(create.name() == "app.apk");
  assert(create.project_arn() == f.project.arn());
  assert(create.type() == "ANDROID_APP");
  assert(create.content_type() == "application/octet-stream");

  // One PUT of the file bytes with the returned content type.
  assert(f.http->requests.size() == 1);
  const auto& put = f.http->requests.front();
  assert(put.method == "PUT");
  assert(put.url == kUploadUrl);
  assert(put.headers.at("Content-Type") == "application/octet-stream");
  assert(put.body->ToString() == "apk-bytes");

  const auto text = f.lines->str();
  assert(text.find("[DeviceFarm] Waiting for upload app.apk") != std::string::npos);
  assert(text.find("current status: PROCESSING") != std::string::npos);
}

void TestFailedUploadCarriesMetadata() {
  Fixture f;
  f.api->upload_statuses = {"PROCESSING", "FAILED"};
  f.api->upload_metadata = R"({"errorMessage":"Invalid APK"})";
  const auto path        = WriteArtifact("broken.apk", "x");

  auto upload = f.client->UploadApp(f.project, path.string());
  assert(!upload.ok());
  assert(KindOf(upload.status()) == ErrorKind::kUploadFailed);
  assert(upload.status().message().find("Invalid APK") != std::string::npos);
  assert(f.sleeper->waits.size() == 1);
}

void TestInterruptedWaitIsAnError() {
  Fixture f;
  f.api->upload_statuses = {"PROCESSING", "PROCESSING", "SUCCEEDED"};
  f.sleeper->interrupt_at = 0;
  const auto path         = WriteArtifact("app2.apk", "x");

  auto upload = f.client->UploadApp(f.project, path.string());
  assert(!upload.ok());
  assert(KindOf(upload.status()) == ErrorKind::kWaitInterrupted);
  assert(upload.status().IsCancelled());
}

void TestTimeoutBoundsTheWait() {
  Fixture f(std::chrono::milliseconds(12000));
  const auto path = WriteArtifact("slow.apk", "x");

  // Never leaves PROCESSING.
  auto upload = f.client->UploadApp(f.project, path.string());
  assert(!upload.ok());
  assert(KindOf(upload.status()) == ErrorKind::kUploadTimedOut);
  assert(f.sleeper->waits.size() == 2);
}

void TestMissingAndAbsentPaths() {
  Fixture f;

  auto empty = f.client->UploadExtraData(f.project, "");
  assert(KindOf(empty.status()) == ErrorKind::kUnrecognizedArtifactType);

  auto missing_path = f.client->Upload(f.project, "", devicefarm::model::UploadType::kAndroidApp);
  assert(KindOf(missing_path.status()) == ErrorKind::kMissingArtifactPath);
  assert(missing_path.status().message() == "Must have an artifact path.");

  auto absent = f.client->UploadApp(f.project, "/nonexistent/dir/app.apk");
  assert(KindOf(absent.status()) == ErrorKind::kLocalFileNotFound);
  assert(absent.status().message().find("/nonexistent/dir/app.apk") != std::string::npos);

  auto unknown = f.client->UploadApp(f.project, "app.exe");
  assert(KindOf(unknown.status()) == ErrorKind::kUnrecognizedArtifactType);

  assert(f.api->create_requests.empty());
  assert(f.http->requests.empty());
}

void TestRejectedAndUnreachablePut() {
  {
    Fixture f;
    f.http->statuses[std::string("PUT ") + kUploadUrl] = 403;
    const auto path                                    = WriteArtifact("data.zip", "zip");

    auto upload = f.client->UploadExtraData(f.project, path.string());
    assert(KindOf(upload.status()) == ErrorKind::kUploadRejected);
    assert(upload.status().message().find("403") != std::string::npos);
    assert(f.api->get_upload_requests.empty());
  }
  {
    Fixture f;
    f.http->unreachable.push_back(kUploadUrl);
    const auto path = WriteArtifact("data2.zip", "zip");

    auto upload = f.client->UploadExtraData(f.project, path.string());
    assert(KindOf(upload.status()) == ErrorKind::kUploadTransportFailure);
  }
}

void TestUploadTestUsesFrameworkType() {
  Fixture f;
  f.api->upload_statuses = {"SUCCEEDED"};
  const auto path        = WriteArtifact("tests.zip", "py");

  const devicefarm::model::TestSpec spec = devicefarm::model::AppiumTest{devicefarm::model::AppiumFlavor::kPython, true, path.string()};
  auto                              upload = f.client->UploadTest(f.project, spec);
  assert(upload.ok());
  assert(f.api->create_requests.front().type() == "APPIUM_WEB_PYTHON_TEST_PACKAGE");
  assert(f.sleeper->waits.empty());
}

void TestOutOfOrderStatusIsLoggedAndPolled() {
  auto captured = std::make_shared<std::ostringstream>();
  auto previous = spdlog::default_logger();
  spdlog::set_default_logger(
      std::make_shared<spdlog::logger>("upload_status_capture", std::make_shared<spdlog::sinks::ostream_sink_mt>(*captured)));

  Fixture f;
  f.api->upload_statuses = {"PROCESSING", "INITIALIZED", "RESTARTING", "SUCCEEDED"};
  const auto path        = WriteArtifact("order.apk", "apk");

  auto upload = f.client->UploadApp(f.project, path.string());
  spdlog::set_default_logger(previous);

  assert(upload.ok());
  assert(upload->status() == "SUCCEEDED");
  assert(f.sleeper->waits.size() == 3);

  const auto text = captured->str();
  assert(text.find("unexpected upload status") != std::string::npos);
  assert(text.find("status=INITIALIZED") != std::string::npos);
  assert(text.find("status=RESTARTING") != std::string::npos);
}

// A signal taken while the client is still being built must end the first wait.
void TestInterruptBeforeClientExistsEndsFirstWait() {
  auto sleeper = std::make_shared<devicefarm::poll::InterruptibleSleeper>();
  sleeper->Interrupt();

  auto api = std::make_shared<FakeDeviceFarmApi>();
  api->created_upload.set_url(kUploadUrl);
  api->upload_statuses = {"PROCESSING", "SUCCEEDED"};

  ClientOptions options;
  options.sleeper = sleeper;
  DeviceFarmClient client(api, std::make_shared<FakeHttpClient>(), options);

  devicefarm::v1::Project project;
  project.set_arn("arn:aws:devicefarm:us-west-2:123456789012:project:project-1");
  const auto path = WriteArtifact("early.apk", "x");

  const auto start  = std::chrono::steady_clock::now();
  auto       upload = client.UploadApp(project, path.string());
  assert(!upload.ok());
  assert(KindOf(upload.status()) == ErrorKind::kWaitInterrupted);
  assert(std::chrono::steady_clock::now() - start < std::chrono::seconds(4));
}

void TestNullProgressSinkIsSilent() {
  auto api     = std::make_shared<FakeDeviceFarmApi>();
  auto http    = std::make_shared<FakeHttpClient>();
  auto sleeper = std::make_shared<RecordingSleeper>();
  api->created_upload.set_url(kUploadUrl);
  api->upload_statuses = {"INITIALIZED", "SUCCEEDED"};

  ClientOptions options;
  options.sleeper = sleeper;
  DeviceFarmClient client(api, http, options);

  devicefarm::v1::Project project;
  project.set_arn("arn:aws:devicefarm:us-west-2:123456789012:project:project-1");
  const auto path = WriteArtifact("quiet.ipa", "ipa");

  auto upload = client.UploadApp(project, path.string());
  assert(upload.ok());
  assert(api->create_requests.front().type() == "IOS_APP");
  assert(sleeper->waits.size() == 1);
}

} // namespace

int main() {
  TestPendingPendingSucceededWaitsTwice();
  TestFailedUploadCarriesMetadata();
  TestInterruptedWaitIsAnError();
  TestTimeoutBoundsTheWait();
  TestMissingAndAbsentPaths();
  TestRejectedAndUnreachablePut();
  TestUploadTestUsesFrameworkType();
  TestOutOfOrderStatusIsLoggedAndPolled();
  TestInterruptBeforeClientExistsEndsFirstWait();
  TestNullProgressSinkIsSilent();

  std::cout << "upload_test: pass\n";
  return 0;
}
