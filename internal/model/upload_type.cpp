#include "upload_type.hpp"

#include <cctype>

#include "internal/util/errors.hpp"

namespace devicefarm::model {

bool HasExtension(std::string_view path, std::string_view extension) {
  if (path.size() < extension.size()) {
    return false;
  }
  const auto tail = path.substr(path.size() - extension.size());
  for (std::size_t i = 0; i < extension.size(); ++i) {
    const auto a = std::tolower(static_cast<unsigned char>(tail[i]));
    const auto b = std::tolower(static_cast<unsigned char>(extension[i]));
    if (a != b) {
      return false;
    }
  }
  return true;
}

UploadType ClassifyApp(const std::string& path) {
  if (HasExtension(path, ".apk")) {
    return UploadType::kAndroidApp;
  }
  if (HasExtension(path, ".ipa") || HasExtension(path, ".zip")) {
    return UploadType::kIosApp;
  }
  throw util::UnrecognizedArtifactType("Unknown app artifact to upload: " + path);
}

UploadType ClassifyExtraData(const std::string& path) {
  if (HasExtension(path, ".zip")) {
    return UploadType::kExternalData;
  }
  throw util::UnrecognizedArtifactType("Unknown extra data file artifact to upload: " + path);
}

std::string AppPlatformFor(const std::string& path) {
  if (HasExtension(path, ".apk")) {
    return "Android";
  }
  if (HasExtension(path, ".ipa")) {
    return "IOS";
  }
  throw util::UnrecognizedArtifactType("Unknown app artifact to upload: " + path);
}

} // namespace devicefarm::model
