#pragma once

#include <aws/devicefarm/model/CreateUploadRequest.h>
#include <aws/devicefarm/model/CreateUploadResult.h>
#include <aws/devicefarm/model/GetAccountSettingsRequest.h>
#include <aws/devicefarm/model/GetAccountSettingsResult.h>
#include <aws/devicefarm/model/GetRunRequest.h>
#include <aws/devicefarm/model/GetRunResult.h>
#include <aws/devicefarm/model/GetUploadRequest.h>
#include <aws/devicefarm/model/GetUploadResult.h>
#include <aws/devicefarm/model/ListArtifactsRequest.h>
#include <aws/devicefarm/model/ListArtifactsResult.h>
#include <aws/devicefarm/model/ListDevicePoolsRequest.h>
#include <aws/devicefarm/model/ListDevicePoolsResult.h>
#include <aws/devicefarm/model/ListDevicesRequest.h>
#include <aws/devicefarm/model/ListDevicesResult.h>
#include <aws/devicefarm/model/ListJobsRequest.h>
#include <aws/devicefarm/model/ListJobsResult.h>
#include <aws/devicefarm/model/ListProjectsRequest.h>
#include <aws/devicefarm/model/ListProjectsResult.h>
#include <aws/devicefarm/model/ListSuitesRequest.h>
#include <aws/devicefarm/model/ListSuitesResult.h>
#include <aws/devicefarm/model/ListTestsRequest.h>
#include <aws/devicefarm/model/ListTestsResult.h>
#include <aws/devicefarm/model/ScheduleRunRequest.h>
#include <aws/devicefarm/model/ScheduleRunResult.h>

#include "api/devicefarm/v1.hpp"

namespace devicefarm::api::sdk_model {

/*
  Conversion between the client's protobuf messages and the SDK model.

  SDK enumerations travel as their wire names. Optional request fields are
  only set on the SDK side when the message carries a value, so the service
  applies its own defaults for everything else.
*/

namespace df = Aws::DeviceFarm::Model;

df::ListProjectsRequest       ToSdk(const v1::ListProjectsRequest& request);
df::ListDevicePoolsRequest    ToSdk(const v1::ListDevicePoolsRequest& request);
df::ListDevicesRequest        ToSdk(const v1::ListDevicesRequest& request);
df::GetAccountSettingsRequest ToSdk(const v1::GetAccountSettingsRequest& request);
df::CreateUploadRequest       ToSdk(const v1::CreateUploadRequest& request);
df::GetUploadRequest          ToSdk(const v1::GetUploadRequest& request);
df::ScheduleRunRequest        ToSdk(const v1::ScheduleRunRequest& request);
df::GetRunRequest             ToSdk(const v1::GetRunRequest& request);
df::ListJobsRequest           ToSdk(const v1::ListJobsRequest& request);
df::ListSuitesRequest         ToSdk(const v1::ListSuitesRequest& request);
df::ListTestsRequest          ToSdk(const v1::ListTestsRequest& request);
df::ListArtifactsRequest      ToSdk(const v1::ListArtifactsRequest& request);

v1::ListProjectsResponse       FromSdk(const df::ListProjectsResult& result);
v1::ListDevicePoolsResponse    FromSdk(const df::ListDevicePoolsResult& result);
v1::ListDevicesResponse        FromSdk(const df::ListDevicesResult& result);
v1::GetAccountSettingsResponse FromSdk(const df::GetAccountSettingsResult& result);
v1::CreateUploadResponse       FromSdk(const df::CreateUploadResult& result);
v1::GetUploadResponse          FromSdk(const df::GetUploadResult& result);
v1::ScheduleRunResponse        FromSdk(const df::ScheduleRunResult& result);
v1::GetRunResponse             FromSdk(const df::GetRunResult& result);
v1::ListJobsResponse           FromSdk(const df::ListJobsResult& result);
v1::ListSuitesResponse         FromSdk(const df::ListSuitesResult& result);
v1::ListTestsResponse          FromSdk(const df::ListTestsResult& result);
v1::ListArtifactsResponse      FromSdk(const df::ListArtifactsResult& result);

} // namespace devicefarm::api::sdk_model
