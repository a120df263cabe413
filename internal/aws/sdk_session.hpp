#pragma once

#include <aws/core/Aws.h>

#include <memory>

namespace devicefarm::aws {

/*
  SdkSession

  Holds Aws::InitAPI for as long as any owner lives; the last owner runs
  Aws::ShutdownAPI. Every SDK client must be destroyed before its session.
*/
class SdkSession {
 public:
  static std::shared_ptr<SdkSession> Acquire();

  ~SdkSession();

  SdkSession(const SdkSession&)            = delete;
  SdkSession& operator=(const SdkSession&) = delete;

 private:
  SdkSession();

  Aws::SDKOptions options_;
};

} // namespace devicefarm::aws
