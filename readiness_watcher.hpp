#ifndef READINESS_WATCHER_HPP
#define READINESS_WATCHER_HPP

#include <chrono>

class RemoteShell;

class Sleeper {
 public:
  virtual ~Sleeper() = default;
  virtual void sleep_for(std::chrono::seconds duration) = 0;
};

class ThreadSleeper : public Sleeper {
 public:
  void sleep_for(std::chrono::seconds duration) override;
};

// Polls the guest over ssh until it answers or the deadline passes.
//
// Elapsed time is counted in whole poll intervals: every failed probe is
// followed by one sleep, and the wait ends once the sleeps add up to the
// timeout. A probe that throws counts as a failed attempt. Blocks the caller.
class ReadinessWatcher {
 public:
  ReadinessWatcher(RemoteShell& shell, Sleeper& sleeper);

  // Returns the time spent waiting. Throws DeviceError(Timeout).
  std::chrono::seconds wait_ready(int port,
                                  std::chrono::seconds timeout = std::chrono::seconds(60),
                                  std::chrono::seconds interval = std::chrono::seconds(5));

 private:
  RemoteShell& shell_;
  Sleeper& sleeper_;
};

#endif // READINESS_WATCHER_HPP
