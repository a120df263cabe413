#pragma once

#include <aws/core/utils/memory/stl/AWSString.h>

#include <string>

namespace devicefarm::aws {

// Aws::String uses the SDK allocator when custom memory management is on.
inline std::string ToStd(const Aws::String& value) {
  return std::string(value.c_str(), value.size());
}

inline Aws::String ToAws(const std::string& value) {
  return Aws::String(value.c_str(), value.size());
}

} // namespace devicefarm::aws
