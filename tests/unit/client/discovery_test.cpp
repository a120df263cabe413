#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "client/cpp/devicefarm_client.h"
#include "internal/util/status.hpp"
#include "tests/support/fake_device_farm_api.hpp"
#include "tests/support/fake_http_client.hpp"

using devicefarm::client::DeviceFarmClient;
using devicefarm::testing::FakeDeviceFarmApi;
using devicefarm::testing::FakeHttpClient;
using devicefarm::util::ErrorKind;
using devicefarm::util::KindOf;

namespace {

constexpr const char* kProjectArn = "arn:aws:devicefarm:us-west-2:123456789012:project:p-2";

devicefarm::v1::Project MakeProject(const std::string& id, const std::string& name) {
  devicefarm::v1::Project project;
  project.set_arn("arn:aws:devicefarm:us-west-2:123456789012:project:" + id);
  project.set_name(name);
  return project;
}

std::shared_ptr<FakeDeviceFarmApi> MakeApi() {
  auto api = std::make_shared<FakeDeviceFarmApi>();
  api->projects = {MakeProject("p-0", "my app"), MakeProject("p-1", "My App (staging)"), MakeProject("p-2", "My App"),
                   MakeProject("p-3", "Other")};

  devicefarm::v1::DevicePool top;
  top.set_arn("arn:aws:devicefarm:us-west-2::devicepool:top");
  top.set_name("Top Devices");
  devicefarm::v1::DevicePool mine;
  mine.set_arn("arn:aws:devicefarm:us-west-2:123456789012:devicepool:p-2/pool-1");
  mine.set_name("Pixels");
  api->device_pools[kProjectArn] = {top, mine};

  for (int i = 0; i < 5; ++i) {
    devicefarm::v1::Device device;
    device.set_arn("arn:aws:devicefarm:us-west-2::device:" + std::to_string(i));
    device.set_os(std::to_string(10 + i));
    api->devices[kProjectArn].push_back(device);
  }
  return api;
}

void TestGetProjectIsExactAndCaseSensitive() {
  auto             api = MakeApi();
  DeviceFarmClient client(api, std::make_shared<FakeHttpClient>());

  auto project = client.GetProject("My App");
  assert(project.ok());
  assert(project->arn() == kProjectArn);

  auto missing = client.GetProject("MY APP");
  assert(!missing.ok());
  assert(missing.status().IsKeyError());
  assert(KindOf(missing.status()) == ErrorKind::kNotFound);
  assert(missing.status().message().find("MY APP") != std::string::npos);

  // Substring match is not enough.
  assert(KindOf(client.GetProject("App").status()) == ErrorKind::kNotFound);
}

void TestListsFollowPagination() {
  auto             api = MakeApi();
  DeviceFarmClient client(api, std::make_shared<FakeHttpClient>());

  auto projects = client.ListProjects();
  assert(projects.ok());
  assert(projects->size() == 4);
  assert((*projects)[3].name() == "Other");

  auto devices = client.ListDevices(std::string("My App"));
  assert(devices.ok());
  assert(devices->size() == 5);
  assert(devices->back().os() == "14");
}

void TestDevicePoolLookup() {
  auto             api = MakeApi();
  DeviceFarmClient client(api, std::make_shared<FakeHttpClient>());

  auto pool = client.GetDevicePool(std::string("My App"), "Pixels");
  assert(pool.ok());
  assert(pool->arn() == "arn:aws:devicefarm:us-west-2:123456789012:devicepool:p-2/pool-1");

  auto project = client.GetProject("My App");
  assert(project.ok());
  auto pools = client.ListDevicePools(*project);
  assert(pools.ok() && pools->size() == 2);

  auto missing = client.GetDevicePool(*project, "pixels");
  assert(KindOf(missing.status()) == ErrorKind::kNotFound);
  assert(missing.status().message().find("pixels") != std::string::npos);

  auto no_project = client.GetDevicePool(std::string("Nope"), "Pixels");
  assert(KindOf(no_project.status()) == ErrorKind::kNotFound);
}

void TestAccountSettingsNotFoundIsAbsent() {
  auto             api = MakeApi();
  DeviceFarmClient client(api, std::make_shared<FakeHttpClient>());

  auto settings = client.GetAccountSettings();
  assert(settings.ok());
  assert(!settings->has_value());

  auto count = client.GetUnmeteredDeviceCount("android");
  assert(count.ok() && *count == 0);

  // Any other service error still propagates.
  api->account_settings_error = "AccessDeniedException";
  auto denied                 = client.GetAccountSettings();
  assert(!denied.ok());
  assert(KindOf(denied.status()) == ErrorKind::kService);
}

void TestUnmeteredDeviceCount() {
  auto api = MakeApi();
  devicefarm::v1::AccountSettings settings;
  (*settings.mutable_unmetered_devices())["ANDROID"] = 3;
  api->account_settings                              = settings;
  DeviceFarmClient client(api, std::make_shared<FakeHttpClient>());

  auto android = client.GetUnmeteredDeviceCount("Android");
  assert(android.ok() && *android == 3);

  auto ios = client.GetUnmeteredDeviceCount("IOS");
  assert(ios.ok() && *ios == 0);

  auto other = client.GetUnmeteredDeviceCount("WINDOWS");
  assert(other.ok() && *other == 0);
}

void TestAppPlatform() {
  auto android = DeviceFarmClient::AppPlatformFor("build/app-debug.apk");
  assert(android.ok() && *android == "Android");

  auto unknown = DeviceFarmClient::AppPlatformFor("app.aab");
  assert(!unknown.ok());
  assert(KindOf(unknown.status()) == ErrorKind::kUnrecognizedArtifactType);
}

} // namespace

int main() {
  TestGetProjectIsExactAndCaseSensitive();
  TestListsFollowPagination();
  TestDevicePoolLookup();
  TestAccountSettingsNotFoundIsAbsent();
  TestUnmeteredDeviceCount();
  TestAppPlatform();

  std::cout << "discovery_test: pass\n";
  return 0;
}
