#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace devicefarm::poll {

/*
  Suspension point of polling loops.

  SleepFor returns false when the wait was interrupted before the full
  duration elapsed; callers surface that as WaitInterrupted.
*/
class Sleeper {
 public:
  virtual ~Sleeper() = default;

  virtual bool SleepFor(std::chrono::milliseconds duration) = 0;
};

/*
  Sleeper that another thread can wake early.

  Once interrupted, every later SleepFor returns false immediately until
  Reset() is called.
*/
class InterruptibleSleeper final : public Sleeper {
 public:
  bool SleepFor(std::chrono::milliseconds duration) override;

  void Interrupt();
  void Reset();

  bool interrupted() const;

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  bool                    interrupted_ = false;
};

struct PollPolicy {
  std::chrono::milliseconds interval{5000};
  // Zero waits without bound.
  std::chrono::milliseconds timeout{0};
};

} // namespace devicefarm::poll
