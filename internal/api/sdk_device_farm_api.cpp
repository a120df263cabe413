#include "sdk_device_farm_api.hpp"

#include <stdexcept>
#include <utility>

#include "internal/api/sdk_model.hpp"
#include "internal/aws/sdk_error.hpp"

namespace devicefarm::api {

namespace {

// The result of a successful outcome, converted; otherwise the SDK error rethrown.
template <typename Outcome>
auto Unpack(const char* action, const Outcome& outcome) {
  if (!outcome.IsSuccess()) {
    aws::ThrowSdkError(action, outcome.GetError());
  }
  return sdk_model::FromSdk(outcome.GetResult());
}

} // namespace

SdkDeviceFarmApi::SdkDeviceFarmApi(std::shared_ptr<Aws::DeviceFarm::DeviceFarmClient> client) : client_(std::move(client)) {
  if (!client_) {
    throw std::invalid_argument("SdkDeviceFarmApi requires a Device Farm client");
  }
}

v1::ListProjectsResponse SdkDeviceFarmApi::ListProjects(const v1::ListProjectsRequest& request) {
  return Unpack("ListProjects", client_->ListProjects(sdk_model::ToSdk(request)));
}

v1::ListDevicePoolsResponse SdkDeviceFarmApi::ListDevicePools(const v1::ListDevicePoolsRequest& request) {
  return Unpack("ListDevicePools", client_->ListDevicePools(sdk_model::ToSdk(request)));
}

v1::ListDevicesResponse SdkDeviceFarmApi::ListDevices(const v1::ListDevicesRequest& request) {
  return Unpack("ListDevices", client_->ListDevices(sdk_model::ToSdk(request)));
}

v1::GetAccountSettingsResponse SdkDeviceFarmApi::GetAccountSettings(const v1::GetAccountSettingsRequest& request) {
  return Unpack("GetAccountSettings", client_->GetAccountSettings(sdk_model::ToSdk(request)));
}

v1::CreateUploadResponse SdkDeviceFarmApi::CreateUpload(const v1::CreateUploadRequest& request) {
  return Unpack("CreateUpload", client_->CreateUpload(sdk_model::ToSdk(request)));
}

v1::GetUploadResponse SdkDeviceFarmApi::GetUpload(const v1::GetUploadRequest& request) {
  return Unpack("GetUpload", client_->GetUpload(sdk_model::ToSdk(request)));
}

v1::ScheduleRunResponse SdkDeviceFarmApi::ScheduleRun(const v1::ScheduleRunRequest& request) {
  return Unpack("ScheduleRun", client_->ScheduleRun(sdk_model::ToSdk(request)));
}

v1::GetRunResponse SdkDeviceFarmApi::GetRun(const v1::GetRunRequest& request) {
  return Unpack("GetRun", client_->GetRun(sdk_model::ToSdk(request)));
}

v1::ListJobsResponse SdkDeviceFarmApi::ListJobs(const v1::ListJobsRequest& request) {
  return Unpack("ListJobs", client_->ListJobs(sdk_model::ToSdk(request)));
}

v1::ListSuitesResponse SdkDeviceFarmApi::ListSuites(const v1::ListSuitesRequest& request) {
  return Unpack("ListSuites", client_->ListSuites(sdk_model::ToSdk(request)));
}

v1::ListTestsResponse SdkDeviceFarmApi::ListTests(const v1::ListTestsRequest& request) {
  return Unpack("ListTests", client_->ListTests(sdk_model::ToSdk(request)));
}

v1::ListArtifactsResponse SdkDeviceFarmApi::ListArtifacts(const v1::ListArtifactsRequest& request) {
  return Unpack("ListArtifacts", client_->ListArtifacts(sdk_model::ToSdk(request)));
}

} // namespace devicefarm::api
