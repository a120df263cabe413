#pragma once

#include <cstdint>
#include <string_view>

namespace devicefarm::model {

/*
  Upload lifecycle as reported by the service:

      INITIALIZED → PROCESSING → SUCCEEDED
                              ↘ FAILED

  Terminal states never change again.
*/
enum class UploadStatus : std::uint8_t {
  kUnspecified = 0,
  kInitialized = 1,
  kProcessing = 2,
  kSucceeded = 3,
  kFailed = 4,
};

// Case-insensitive; unrecognized strings map to kUnspecified and are polled again.
UploadStatus ParseUploadStatus(std::string_view status);

constexpr bool IsTerminal(UploadStatus status) {
  return status == UploadStatus::kSucceeded || status == UploadStatus::kFailed;
}

constexpr bool CanTransition(UploadStatus from, UploadStatus to) {
  if (from == to) {
    return true;
  }
  if (IsTerminal(from)) {
    return false;
  }
  if (to == UploadStatus::kUnspecified) {
    return false;
  }

  return static_cast<std::uint8_t>(to) >= static_cast<std::uint8_t>(from);
}

} // namespace devicefarm::model
