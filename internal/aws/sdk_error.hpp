#pragma once

#include <aws/core/client/AWSError.h>
#include <aws/core/http/HttpResponse.h>

#include <string>

#include "internal/aws/sdk_string.hpp"
#include "internal/util/errors.hpp"

namespace devicefarm::aws {

// "com.amazonaws.devicefarm#NotFoundException:..." -> "NotFoundException"
std::string NormalizeErrorCode(const std::string& exception_name);

/*
  Rethrows an SDK error as the client's own exception types.

  A request that never got an answer becomes util::TransportError. Anything
  the service answered becomes util::ServiceError carrying the error code and
  HTTP status; the message reads "<code> (HTTP <status>): <message>".
*/
template <typename ErrorType>
[[noreturn]] void ThrowSdkError(const std::string& action, const Aws::Client::AWSError<ErrorType>& error) {
  if (error.GetErrorType() == ErrorType::NETWORK_CONNECTION ||
      error.GetResponseCode() == Aws::Http::HttpResponseCode::REQUEST_NOT_MADE) {
    throw util::TransportError(action + ": " + ToStd(error.GetMessage()));
  }

  const int status = static_cast<int>(error.GetResponseCode());
  auto      code   = NormalizeErrorCode(ToStd(error.GetExceptionName()));
  if (code.empty()) {
    code = "HTTP" + std::to_string(status);
  }
  throw util::ServiceError(code + " (HTTP " + std::to_string(status) + "): " + ToStd(error.GetMessage()), code, status);
}

} // namespace devicefarm::aws
