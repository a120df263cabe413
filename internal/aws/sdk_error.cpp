#include "sdk_error.hpp"

namespace devicefarm::aws {

std::string NormalizeErrorCode(const std::string& exception_name) {
  std::string code = exception_name;

  const auto hash = code.rfind('#');
  if (hash != std::string::npos) {
    code = code.substr(hash + 1);
  }
  const auto colon = code.find(':');
  if (colon != std::string::npos) {
    code = code.substr(0, colon);
  }
  return code;
}

} // namespace devicefarm::aws
