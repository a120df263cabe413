#pragma once

#include <array>
#include <cstdint>
#include <string_view>

namespace devicefarm::model {

enum class ArtifactCategory : std::uint8_t {
  kScreenshot = 0,
  kFile = 1,
  kLog = 2,
};

inline constexpr std::array<ArtifactCategory, 3> kAllArtifactCategories = {
    ArtifactCategory::kScreenshot,
    ArtifactCategory::kFile,
    ArtifactCategory::kLog,
};

// Wire value of ListArtifactsRequest.type.
constexpr std::string_view ToString(ArtifactCategory category) {
  switch (category) {
    case ArtifactCategory::kScreenshot:
      return "SCREENSHOT";
    case ArtifactCategory::kFile:
      return "FILE";
    case ArtifactCategory::kLog:
      return "LOG";
  }
  return "FILE";
}

} // namespace devicefarm::model
