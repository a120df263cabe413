#pragma once

#include <aws/devicefarm/DeviceFarmClient.h>

#include <memory>

#include "internal/api/device_farm_api.hpp"

namespace devicefarm::api {

// Device Farm is only served from us-west-2.
inline constexpr const char* kDeviceFarmRegion = "us-west-2";

/*
  DeviceFarmApi over the AWS SDK client.

  The SDK signs, serializes and retries; this class only converts between
  the protobuf messages and the SDK model and rethrows SDK errors as
  util::ServiceError / util::TransportError.
*/
class SdkDeviceFarmApi final : public DeviceFarmApi {
 public:
  explicit SdkDeviceFarmApi(std::shared_ptr<Aws::DeviceFarm::DeviceFarmClient> client);

  v1::ListProjectsResponse    ListProjects(const v1::ListProjectsRequest& request) override;
  v1::ListDevicePoolsResponse ListDevicePools(const v1::ListDevicePoolsRequest& request) override;
  v1::ListDevicesResponse     ListDevices(const v1::ListDevicesRequest& request) override;

  v1::GetAccountSettingsResponse GetAccountSettings(const v1::GetAccountSettingsRequest& request) override;

  v1::CreateUploadResponse CreateUpload(const v1::CreateUploadRequest& request) override;
  v1::GetUploadResponse    GetUpload(const v1::GetUploadRequest& request) override;

  v1::ScheduleRunResponse ScheduleRun(const v1::ScheduleRunRequest& request) override;
  v1::GetRunResponse      GetRun(const v1::GetRunRequest& request) override;

  v1::ListJobsResponse      ListJobs(const v1::ListJobsRequest& request) override;
  v1::ListSuitesResponse    ListSuites(const v1::ListSuitesRequest& request) override;
  v1::ListTestsResponse     ListTests(const v1::ListTestsRequest& request) override;
  v1::ListArtifactsResponse ListArtifacts(const v1::ListArtifactsRequest& request) override;

 private:
  std::shared_ptr<Aws::DeviceFarm::DeviceFarmClient> client_;
};

} // namespace devicefarm::api
