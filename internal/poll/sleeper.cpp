#include "sleeper.hpp"

namespace devicefarm::poll {

bool InterruptibleSleeper::SleepFor(std::chrono::milliseconds duration) {
  std::unique_lock<std::mutex> lock(mutex_);
  return !cv_.wait_for(lock, duration, [this] { return interrupted_; });
}

void InterruptibleSleeper::Interrupt() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    interrupted_ = true;
  }
  cv_.notify_all();
}

void InterruptibleSleeper::Reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  interrupted_ = false;
}

bool InterruptibleSleeper::interrupted() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return interrupted_;
}

} // namespace devicefarm::poll
