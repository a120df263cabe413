#pragma once

#include <arrow/status.h>

#include <exception>
#include <memory>
#include <string>

#include "internal/util/errors.hpp"

namespace devicefarm::util {

enum class ErrorKind {
  kUnknown = 0,

  kNotFound,
  kUnrecognizedArtifactType,
  kMissingArtifactPath,
  kLocalFileNotFound,
  kUploadTransportFailure,
  kUploadRejected,
  kUploadFailed,
  kUploadTimedOut,
  kWaitInterrupted,

  kMalformedArn,
  kTransport,
  kService,
  kCredentials,
};

const char* ErrorKindName(ErrorKind kind);

/*
  Attached to every arrow::Status produced by ToStatus so callers can branch
  on the precise kind instead of the coarse arrow::StatusCode.
*/
class ErrorDetail final : public arrow::StatusDetail {
 public:
  static constexpr const char* kTypeId = "devicefarm::util::ErrorDetail";

  explicit ErrorDetail(ErrorKind kind) : kind_(kind) {
  }

  const char* type_id() const override {
    return kTypeId;
  }

  std::string ToString() const override;

  ErrorKind kind() const {
    return kind_;
  }

 private:
  ErrorKind kind_;
};

/*
  Converts internal exceptions into arrow::Status.
*/
arrow::Status ToStatus(const std::exception& e);

// kUnknown for OK statuses and statuses without an ErrorDetail.
ErrorKind KindOf(const arrow::Status& status);

} // namespace devicefarm::util
