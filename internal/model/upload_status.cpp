#include "upload_status.hpp"

#include <cctype>
#include <string>

namespace devicefarm::model {

UploadStatus ParseUploadStatus(std::string_view status) {
  std::string upper;
  upper.reserve(status.size());
  for (char c : status) {
    upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }

  if (upper == "INITIALIZED") return UploadStatus::kInitialized;
  if (upper == "PROCESSING") return UploadStatus::kProcessing;
  if (upper == "SUCCEEDED") return UploadStatus::kSucceeded;
  if (upper == "FAILED") return UploadStatus::kFailed;
  return UploadStatus::kUnspecified;
}

} // namespace devicefarm::model
