#include "sdk_model.hpp"

#include <aws/devicefarm/model/ArtifactCategory.h>
#include <aws/devicefarm/model/ArtifactType.h>
#include <aws/devicefarm/model/BillingMethod.h>
#include <aws/devicefarm/model/DeviceAvailability.h>
#include <aws/devicefarm/model/DeviceFormFactor.h>
#include <aws/devicefarm/model/DevicePlatform.h>
#include <aws/devicefarm/model/DevicePoolType.h>
#include <aws/devicefarm/model/ExecutionResult.h>
#include <aws/devicefarm/model/ExecutionStatus.h>
#include <aws/devicefarm/model/TestType.h>
#include <aws/devicefarm/model/UploadCategory.h>
#include <aws/devicefarm/model/UploadStatus.h>
#include <aws/devicefarm/model/UploadType.h>

#include <string>

#include "internal/aws/sdk_string.hpp"

namespace devicefarm::api::sdk_model {

namespace {

using aws::ToAws;
using aws::ToStd;

double Seconds(const Aws::Utils::DateTime& time) {
  return time.SecondsWithMSPrecision();
}

// ---------------------------------------------------------------------------
// Resources
// ---------------------------------------------------------------------------

v1::Counters Convert(const df::Counters& in) {
  v1::Counters out;
  out.set_total(in.GetTotal());
  out.set_passed(in.GetPassed());
  out.set_failed(in.GetFailed());
  out.set_warned(in.GetWarned());
  out.set_errored(in.GetErrored());
  out.set_stopped(in.GetStopped());
  out.set_skipped(in.GetSkipped());
  return out;
}

v1::DeviceMinutes Convert(const df::DeviceMinutes& in) {
  v1::DeviceMinutes out;
  out.set_total(in.GetTotal());
  out.set_metered(in.GetMetered());
  out.set_unmetered(in.GetUnmetered());
  return out;
}

v1::Project Convert(const df::Project& in) {
  v1::Project out;
  out.set_arn(ToStd(in.GetArn()));
  out.set_name(ToStd(in.GetName()));
  out.set_default_job_timeout_minutes(in.GetDefaultJobTimeoutMinutes());
  out.set_created(Seconds(in.GetCreated()));
  return out;
}

v1::DevicePool Convert(const df::DevicePool& in) {
  v1::DevicePool out;
  out.set_arn(ToStd(in.GetArn()));
  out.set_name(ToStd(in.GetName()));
  out.set_description(ToStd(in.GetDescription()));
  out.set_type(ToStd(df::DevicePoolTypeMapper::GetNameForDevicePoolType(in.GetType())));
  out.set_max_devices(in.GetMaxDevices());
  return out;
}

v1::Device Convert(const df::Device& in) {
  v1::Device out;
  out.set_arn(ToStd(in.GetArn()));
  out.set_name(ToStd(in.GetName()));
  out.set_manufacturer(ToStd(in.GetManufacturer()));
  out.set_model(ToStd(in.GetModel()));
  out.set_model_id(ToStd(in.GetModelId()));
  out.set_form_factor(ToStd(df::DeviceFormFactorMapper::GetNameForDeviceFormFactor(in.GetFormFactor())));
  out.set_platform(ToStd(df::DevicePlatformMapper::GetNameForDevicePlatform(in.GetPlatform())));
  out.set_os(ToStd(in.GetOs()));
  if (in.ResolutionHasBeenSet()) {
    out.mutable_resolution()->set_width(in.GetResolution().GetWidth());
    out.mutable_resolution()->set_height(in.GetResolution().GetHeight());
  }
  out.set_heap_size(in.GetHeapSize());
  out.set_memory(in.GetMemory());
  out.set_carrier(ToStd(in.GetCarrier()));
  out.set_radio(ToStd(in.GetRadio()));
  out.set_remote_access_enabled(in.GetRemoteAccessEnabled());
  out.set_remote_debug_enabled(in.GetRemoteDebugEnabled());
  out.set_fleet_type(ToStd(in.GetFleetType()));
  out.set_fleet_name(ToStd(in.GetFleetName()));
  out.set_availability(ToStd(df::DeviceAvailabilityMapper::GetNameForDeviceAvailability(in.GetAvailability())));
  return out;
}

v1::Upload Convert(const df::Upload& in) {
  v1::Upload out;
  out.set_arn(ToStd(in.GetArn()));
  out.set_name(ToStd(in.GetName()));
  out.set_created(Seconds(in.GetCreated()));
  out.set_type(ToStd(df::UploadTypeMapper::GetNameForUploadType(in.GetType())));
  out.set_status(ToStd(df::UploadStatusMapper::GetNameForUploadStatus(in.GetStatus())));
  out.set_url(ToStd(in.GetUrl()));
  out.set_metadata(ToStd(in.GetMetadata()));
  out.set_content_type(ToStd(in.GetContentType()));
  out.set_message(ToStd(in.GetMessage()));
  out.set_category(ToStd(df::UploadCategoryMapper::GetNameForUploadCategory(in.GetCategory())));
  return out;
}

v1::Run Convert(const df::Run& in) {
  v1::Run out;
  out.set_arn(ToStd(in.GetArn()));
  out.set_name(ToStd(in.GetName()));
  out.set_type(ToStd(df::TestTypeMapper::GetNameForTestType(in.GetType())));
  out.set_platform(ToStd(df::DevicePlatformMapper::GetNameForDevicePlatform(in.GetPlatform())));
  out.set_created(Seconds(in.GetCreated()));
  out.set_status(ToStd(df::ExecutionStatusMapper::GetNameForExecutionStatus(in.GetStatus())));
  out.set_result(ToStd(df::ExecutionResultMapper::GetNameForExecutionResult(in.GetResult())));
  out.set_started(Seconds(in.GetStarted()));
  out.set_stopped(Seconds(in.GetStopped()));
  if (in.CountersHasBeenSet()) {
    *out.mutable_counters() = Convert(in.GetCounters());
  }
  out.set_message(ToStd(in.GetMessage()));
  out.set_total_jobs(in.GetTotalJobs());
  out.set_completed_jobs(in.GetCompletedJobs());
  out.set_billing_method(ToStd(df::BillingMethodMapper::GetNameForBillingMethod(in.GetBillingMethod())));
  if (in.DeviceMinutesHasBeenSet()) {
    *out.mutable_device_minutes() = Convert(in.GetDeviceMinutes());
  }
  out.set_app_upload(ToStd(in.GetAppUpload()));
  out.set_device_pool_arn(ToStd(in.GetDevicePoolArn()));
  return out;
}

// Fields shared by jobs, suites and tests.
template <typename Sdk, typename Message>
void FillExecution(const Sdk& in, Message* out) {
  out->set_arn(ToStd(in.GetArn()));
  out->set_name(ToStd(in.GetName()));
  out->set_type(ToStd(df::TestTypeMapper::GetNameForTestType(in.GetType())));
  out->set_created(Seconds(in.GetCreated()));
  out->set_status(ToStd(df::ExecutionStatusMapper::GetNameForExecutionStatus(in.GetStatus())));
  out->set_result(ToStd(df::ExecutionResultMapper::GetNameForExecutionResult(in.GetResult())));
  out->set_started(Seconds(in.GetStarted()));
  out->set_stopped(Seconds(in.GetStopped()));
  if (in.CountersHasBeenSet()) {
    *out->mutable_counters() = Convert(in.GetCounters());
  }
  out->set_message(ToStd(in.GetMessage()));
  if (in.DeviceMinutesHasBeenSet()) {
    *out->mutable_device_minutes() = Convert(in.GetDeviceMinutes());
  }
}

v1::Job Convert(const df::Job& in) {
  v1::Job out;
  FillExecution(in, &out);
  if (in.DeviceHasBeenSet()) {
    *out.mutable_device() = Convert(in.GetDevice());
  }
  out.set_instance_arn(ToStd(in.GetInstanceArn()));
  out.set_video_endpoint(ToStd(in.GetVideoEndpoint()));
  out.set_video_capture(in.GetVideoCapture());
  return out;
}

v1::Suite Convert(const df::Suite& in) {
  v1::Suite out;
  FillExecution(in, &out);
  return out;
}

v1::Test Convert(const df::Test& in) {
  v1::Test out;
  FillExecution(in, &out);
  return out;
}

v1::Artifact Convert(const df::Artifact& in) {
  v1::Artifact out;
  out.set_arn(ToStd(in.GetArn()));
  out.set_name(ToStd(in.GetName()));
  out.set_type(ToStd(df::ArtifactTypeMapper::GetNameForArtifactType(in.GetType())));
  out.set_extension(ToStd(in.GetExtension()));
  out.set_url(ToStd(in.GetUrl()));
  return out;
}

v1::AccountSettings Convert(const df::AccountSettings& in) {
  v1::AccountSettings out;
  out.set_aws_account_number(ToStd(in.GetAwsAccountNumber()));
  for (const auto& entry : in.GetUnmeteredDevices()) {
    (*out.mutable_unmetered_devices())[ToStd(df::DevicePlatformMapper::GetNameForDevicePlatform(entry.first))] = entry.second;
  }
  for (const auto& entry : in.GetUnmeteredRemoteAccessDevices()) {
    (*out.mutable_unmetered_remote_access_devices())[ToStd(df::DevicePlatformMapper::GetNameForDevicePlatform(entry.first))] =
        entry.second;
  }
  out.set_max_job_timeout_minutes(in.GetMaxJobTimeoutMinutes());
  out.set_default_job_timeout_minutes(in.GetDefaultJobTimeoutMinutes());
  for (const auto& entry : in.GetMaxSlots()) {
    (*out.mutable_max_slots())[ToStd(entry.first)] = entry.second;
  }
  out.set_skip_app_resign(in.GetSkipAppResign());
  return out;
}

template <typename Sdk, typename Repeated>
void AppendAll(const Aws::Vector<Sdk>& items, Repeated* out) {
  for (const auto& item : items) {
    *out->Add() = Convert(item);
  }
}

// ---------------------------------------------------------------------------
// Request parts
// ---------------------------------------------------------------------------

// Paged requests: an empty token means "first page" and is not sent.
template <typename Sdk, typename Message>
Sdk ArnAndToken(const Message& request) {
  Sdk out;
  if (!request.arn().empty()) {
    out.SetArn(ToAws(request.arn()));
  }
  if (!request.next_token().empty()) {
    out.SetNextToken(ToAws(request.next_token()));
  }
  return out;
}

df::ScheduleRunTest Convert(const v1::ScheduleRunTest& in) {
  df::ScheduleRunTest out;
  out.SetType(df::TestTypeMapper::GetTestTypeForName(ToAws(in.type())));
  if (!in.test_package_arn().empty()) {
    out.SetTestPackageArn(ToAws(in.test_package_arn()));
  }
  if (!in.test_spec_arn().empty()) {
    out.SetTestSpecArn(ToAws(in.test_spec_arn()));
  }
  if (!in.filter().empty()) {
    out.SetFilter(ToAws(in.filter()));
  }
  for (const auto& entry : in.parameters()) {
    out.AddParameters(ToAws(entry.first), ToAws(entry.second));
  }
  return out;
}

df::ScheduleRunConfiguration Convert(const v1::ScheduleRunConfiguration& in) {
  df::ScheduleRunConfiguration out;
  if (!in.extra_data_package_arn().empty()) {
    out.SetExtraDataPackageArn(ToAws(in.extra_data_package_arn()));
  }
  if (!in.network_profile_arn().empty()) {
    out.SetNetworkProfileArn(ToAws(in.network_profile_arn()));
  }
  if (!in.locale().empty()) {
    out.SetLocale(ToAws(in.locale()));
  }
  if (in.has_location()) {
    df::Location location;
    location.SetLatitude(in.location().latitude());
    location.SetLongitude(in.location().longitude());
    out.SetLocation(location);
  }
  if (in.has_radios()) {
    df::Radios radios;
    radios.SetWifi(in.radios().wifi());
    radios.SetBluetooth(in.radios().bluetooth());
    radios.SetNfc(in.radios().nfc());
    radios.SetGps(in.radios().gps());
    out.SetRadios(radios);
  }
  for (const auto& app : in.auxiliary_apps()) {
    out.AddAuxiliaryApps(ToAws(app));
  }
  if (!in.billing_method().empty()) {
    out.SetBillingMethod(df::BillingMethodMapper::GetBillingMethodForName(ToAws(in.billing_method())));
  }
  return out;
}

df::ExecutionConfiguration Convert(const v1::ExecutionConfiguration& in) {
  df::ExecutionConfiguration out;
  if (in.job_timeout_minutes() > 0) {
    out.SetJobTimeoutMinutes(in.job_timeout_minutes());
  }
  if (in.accounts_cleanup()) {
    out.SetAccountsCleanup(true);
  }
  if (in.app_packages_cleanup()) {
    out.SetAppPackagesCleanup(true);
  }
  if (in.video_capture()) {
    out.SetVideoCapture(true);
  }
  if (in.skip_app_resign()) {
    out.SetSkipAppResign(true);
  }
  return out;
}

} // namespace

// ---------------------------------------------------------------------------
// Requests
// ---------------------------------------------------------------------------

df::ListProjectsRequest ToSdk(const v1::ListProjectsRequest& request) {
  return ArnAndToken<df::ListProjectsRequest>(request);
}

df::ListDevicePoolsRequest ToSdk(const v1::ListDevicePoolsRequest& request) {
  auto out = ArnAndToken<df::ListDevicePoolsRequest>(request);
  if (!request.type().empty()) {
    out.SetType(df::DevicePoolTypeMapper::GetDevicePoolTypeForName(ToAws(request.type())));
  }
  return out;
}

df::ListDevicesRequest ToSdk(const v1::ListDevicesRequest& request) {
  return ArnAndToken<df::ListDevicesRequest>(request);
}

df::GetAccountSettingsRequest ToSdk(const v1::GetAccountSettingsRequest&) {
  return df::GetAccountSettingsRequest();
}

df::CreateUploadRequest ToSdk(const v1::CreateUploadRequest& request) {
  df::CreateUploadRequest out;
  out.SetProjectArn(ToAws(request.project_arn()));
  out.SetName(ToAws(request.name()));
  out.SetType(df::UploadTypeMapper::GetUploadTypeForName(ToAws(request.type())));
  if (!request.content_type().empty()) {
    out.SetContentType(ToAws(request.content_type()));
  }
  return out;
}

df::GetUploadRequest ToSdk(const v1::GetUploadRequest& request) {
  df::GetUploadRequest out;
  out.SetArn(ToAws(request.arn()));
  return out;
}

df::ScheduleRunRequest ToSdk(const v1::ScheduleRunRequest& request) {
  df::ScheduleRunRequest out;
  out.SetProjectArn(ToAws(request.project_arn()));
  if (!request.app_arn().empty()) {
    out.SetAppArn(ToAws(request.app_arn()));
  }
  out.SetDevicePoolArn(ToAws(request.device_pool_arn()));
  if (!request.name().empty()) {
    out.SetName(ToAws(request.name()));
  }
  out.SetTest(Convert(request.test()));
  if (request.has_configuration()) {
    out.SetConfiguration(Convert(request.configuration()));
  }
  if (request.has_execution_configuration()) {
    out.SetExecutionConfiguration(Convert(request.execution_configuration()));
  }
  return out;
}

df::GetRunRequest ToSdk(const v1::GetRunRequest& request) {
  df::GetRunRequest out;
  out.SetArn(ToAws(request.arn()));
  return out;
}

df::ListJobsRequest ToSdk(const v1::ListJobsRequest& request) {
  return ArnAndToken<df::ListJobsRequest>(request);
}

df::ListSuitesRequest ToSdk(const v1::ListSuitesRequest& request) {
  return ArnAndToken<df::ListSuitesRequest>(request);
}

df::ListTestsRequest ToSdk(const v1::ListTestsRequest& request) {
  return ArnAndToken<df::ListTestsRequest>(request);
}

df::ListArtifactsRequest ToSdk(const v1::ListArtifactsRequest& request) {
  auto out = ArnAndToken<df::ListArtifactsRequest>(request);
  out.SetType(df::ArtifactCategoryMapper::GetArtifactCategoryForName(ToAws(request.type())));
  return out;
}

// ---------------------------------------------------------------------------
// Results
// ---------------------------------------------------------------------------

v1::ListProjectsResponse FromSdk(const df::ListProjectsResult& result) {
  v1::ListProjectsResponse out;
  AppendAll(result.GetProjects(), out.mutable_projects());
  out.set_next_token(ToStd(result.GetNextToken()));
  return out;
}

v1::ListDevicePoolsResponse FromSdk(const df::ListDevicePoolsResult& result) {
  v1::ListDevicePoolsResponse out;
  AppendAll(result.GetDevicePools(), out.mutable_device_pools());
  out.set_next_token(ToStd(result.GetNextToken()));
  return out;
}

v1::ListDevicesResponse FromSdk(const df::ListDevicesResult& result) {
  v1::ListDevicesResponse out;
  AppendAll(result.GetDevices(), out.mutable_devices());
  out.set_next_token(ToStd(result.GetNextToken()));
  return out;
}

v1::GetAccountSettingsResponse FromSdk(const df::GetAccountSettingsResult& result) {
  v1::GetAccountSettingsResponse out;
  *out.mutable_account_settings() = Convert(result.GetAccountSettings());
  return out;
}

v1::CreateUploadResponse FromSdk(const df::CreateUploadResult& result) {
  v1::CreateUploadResponse out;
  *out.mutable_upload() = Convert(result.GetUpload());
  return out;
}

v1::GetUploadResponse FromSdk(const df::GetUploadResult& result) {
  v1::GetUploadResponse out;
  *out.mutable_upload() = Convert(result.GetUpload());
  return out;
}

v1::ScheduleRunResponse FromSdk(const df::ScheduleRunResult& result) {
  v1::ScheduleRunResponse out;
  *out.mutable_run() = Convert(result.GetRun());
  return out;
}

v1::GetRunResponse FromSdk(const df::GetRunResult& result) {
  v1::GetRunResponse out;
  *out.mutable_run() = Convert(result.GetRun());
  return out;
}

v1::ListJobsResponse FromSdk(const df::ListJobsResult& result) {
  v1::ListJobsResponse out;
  AppendAll(result.GetJobs(), out.mutable_jobs());
  out.set_next_token(ToStd(result.GetNextToken()));
  return out;
}

v1::ListSuitesResponse FromSdk(const df::ListSuitesResult& result) {
  v1::ListSuitesResponse out;
  AppendAll(result.GetSuites(), out.mutable_suites());
  out.set_next_token(ToStd(result.GetNextToken()));
  return out;
}

v1::ListTestsResponse FromSdk(const df::ListTestsResult& result) {
  v1::ListTestsResponse out;
  AppendAll(result.GetTests(), out.mutable_tests());
  out.set_next_token(ToStd(result.GetNextToken()));
  return out;
}

v1::ListArtifactsResponse FromSdk(const df::ListArtifactsResult& result) {
  v1::ListArtifactsResponse out;
  AppendAll(result.GetArtifacts(), out.mutable_artifacts());
  out.set_next_token(ToStd(result.GetNextToken()));
  return out;
}

} // namespace devicefarm::api::sdk_model
