#pragma once

#include <memory>

#include "api/devicefarm/v1.hpp"

namespace devicefarm::api {

/*
  Remote Device Farm API, one method per service action.

  One call per page: the caller follows next_token. Service-side errors throw
  util::ServiceError, transport failures throw util::TransportError.
*/
class DeviceFarmApi {
 public:
  virtual ~DeviceFarmApi() = default;

  virtual v1::ListProjectsResponse    ListProjects(const v1::ListProjectsRequest& request)       = 0;
  virtual v1::ListDevicePoolsResponse ListDevicePools(const v1::ListDevicePoolsRequest& request) = 0;
  virtual v1::ListDevicesResponse     ListDevices(const v1::ListDevicesRequest& request)         = 0;

  virtual v1::GetAccountSettingsResponse GetAccountSettings(const v1::GetAccountSettingsRequest& request) = 0;

  virtual v1::CreateUploadResponse CreateUpload(const v1::CreateUploadRequest& request) = 0;
  virtual v1::GetUploadResponse    GetUpload(const v1::GetUploadRequest& request)       = 0;

  virtual v1::ScheduleRunResponse ScheduleRun(const v1::ScheduleRunRequest& request) = 0;
  virtual v1::GetRunResponse      GetRun(const v1::GetRunRequest& request)           = 0;

  virtual v1::ListJobsResponse      ListJobs(const v1::ListJobsRequest& request)           = 0;
  virtual v1::ListSuitesResponse    ListSuites(const v1::ListSuitesRequest& request)       = 0;
  virtual v1::ListTestsResponse     ListTests(const v1::ListTestsRequest& request)         = 0;
  virtual v1::ListArtifactsResponse ListArtifacts(const v1::ListArtifactsRequest& request) = 0;
};

using DeviceFarmApiPtr = std::shared_ptr<DeviceFarmApi>;

} // namespace devicefarm::api
