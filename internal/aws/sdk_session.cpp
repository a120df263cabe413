#include "sdk_session.hpp"

#include <mutex>

#include "internal/observability/logging.hpp"

namespace devicefarm::aws {

std::shared_ptr<SdkSession> SdkSession::Acquire() {
  static std::mutex                mutex;
  static std::weak_ptr<SdkSession> current;

  std::lock_guard<std::mutex> lock(mutex);
  if (auto session = current.lock()) {
    return session;
  }

  std::shared_ptr<SdkSession> session(new SdkSession());
  current = session;
  return session;
}

SdkSession::SdkSession() {
  options_.loggingOptions.logLevel = Aws::Utils::Logging::LogLevel::Off;
  Aws::InitAPI(options_);
  DEVICEFARM_LOG_INFO("aws sdk initialized");
}

SdkSession::~SdkSession() {
  Aws::ShutdownAPI(options_);
}

} // namespace devicefarm::aws
