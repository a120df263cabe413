#include "status.hpp"

namespace devicefarm::util {

namespace {

arrow::Status Make(arrow::StatusCode code, ErrorKind kind, const std::exception& e) {
  return arrow::Status(code, e.what(), std::make_shared<ErrorDetail>(kind));
}

} // namespace

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNotFound:
      return "NotFound";
    case ErrorKind::kUnrecognizedArtifactType:
      return "UnrecognizedArtifactType";
    case ErrorKind::kMissingArtifactPath:
      return "MissingArtifactPath";
    case ErrorKind::kLocalFileNotFound:
      return "LocalFileNotFound";
    case ErrorKind::kUploadTransportFailure:
      return "UploadTransportFailure";
    case ErrorKind::kUploadRejected:
      return "UploadRejected";
    case ErrorKind::kUploadFailed:
      return "UploadFailed";
    case ErrorKind::kUploadTimedOut:
      return "UploadTimedOut";
    case ErrorKind::kWaitInterrupted:
      return "WaitInterrupted";
    case ErrorKind::kMalformedArn:
      return "MalformedArn";
    case ErrorKind::kTransport:
      return "Transport";
    case ErrorKind::kService:
      return "Service";
    case ErrorKind::kCredentials:
      return "Credentials";
    case ErrorKind::kUnknown:
    default:
      return "Unknown";
  }
}

std::string ErrorDetail::ToString() const {
  return ErrorKindName(kind_);
}

arrow::Status ToStatus(const std::exception& e) {
  using arrow::StatusCode;

  if (dynamic_cast<const NotFound*>(&e)) {
    return Make(StatusCode::KeyError, ErrorKind::kNotFound, e);
  }
  if (dynamic_cast<const UnrecognizedArtifactType*>(&e)) {
    return Make(StatusCode::Invalid, ErrorKind::kUnrecognizedArtifactType, e);
  }
  if (dynamic_cast<const MissingArtifactPath*>(&e)) {
    return Make(StatusCode::Invalid, ErrorKind::kMissingArtifactPath, e);
  }
  if (dynamic_cast<const LocalFileNotFound*>(&e)) {
    return Make(StatusCode::IOError, ErrorKind::kLocalFileNotFound, e);
  }
  if (dynamic_cast<const UploadTransportFailure*>(&e)) {
    return Make(StatusCode::IOError, ErrorKind::kUploadTransportFailure, e);
  }
  if (dynamic_cast<const UploadRejected*>(&e)) {
    return Make(StatusCode::IOError, ErrorKind::kUploadRejected, e);
  }
  if (dynamic_cast<const UploadFailed*>(&e)) {
    return Make(StatusCode::ExecutionError, ErrorKind::kUploadFailed, e);
  }
  if (dynamic_cast<const UploadTimedOut*>(&e)) {
    return Make(StatusCode::Cancelled, ErrorKind::kUploadTimedOut, e);
  }
  if (dynamic_cast<const WaitInterrupted*>(&e)) {
    return Make(StatusCode::Cancelled, ErrorKind::kWaitInterrupted, e);
  }
  if (dynamic_cast<const MalformedArn*>(&e)) {
    return Make(StatusCode::Invalid, ErrorKind::kMalformedArn, e);
  }
  if (dynamic_cast<const TransportError*>(&e)) {
    return Make(StatusCode::IOError, ErrorKind::kTransport, e);
  }
  if (dynamic_cast<const ServiceError*>(&e)) {
    return Make(StatusCode::IOError, ErrorKind::kService, e);
  }
  if (dynamic_cast<const CredentialsError*>(&e)) {
    return Make(StatusCode::Invalid, ErrorKind::kCredentials, e);
  }

  return arrow::Status::UnknownError(e.what());
}

ErrorKind KindOf(const arrow::Status& status) {
  if (status.ok() || !status.detail()) {
    return ErrorKind::kUnknown;
  }
  if (std::string(status.detail()->type_id()) != ErrorDetail::kTypeId) {
    return ErrorKind::kUnknown;
  }
  return static_cast<const ErrorDetail&>(*status.detail()).kind();
}

} // namespace devicefarm::util
