#include "readiness_watcher.hpp"

#include <string>
#include <thread>

#include "device_error.hpp"
#include "log.hpp"
#include "remote_shell.hpp"

namespace {

// Per attempt, independent of the overall deadline.
const std::chrono::seconds kProbeConnectTimeout(5);

}  // namespace

void ThreadSleeper::sleep_for(std::chrono::seconds duration) {
  std::this_thread::sleep_for(duration);
}

ReadinessWatcher::ReadinessWatcher(RemoteShell& shell, Sleeper& sleeper)
    : shell_(shell), sleeper_(sleeper) {}

std::chrono::seconds ReadinessWatcher::wait_ready(int port, std::chrono::seconds timeout,
                                                  std::chrono::seconds interval) {
  if (interval.count() <= 0) {
    throw UsageError("Poll interval must be positive");
  }

  // A stale host key only matters if the guest answers; go on probing.
  try {
    shell_.forget_host(port);
  } catch (const std::exception& e) {
    log_warning(std::string("Could not forget host key: ") + e.what());
  }

  std::string lastError;
  std::chrono::seconds elapsed(0);
  while (elapsed < timeout) {
    try {
      if (shell_.probe(port, kProbeConnectTimeout)) {
        log_info("SSH connection successful");
        return elapsed;
      }
    } catch (const std::exception& e) {
      lastError = e.what();
    }
    sleeper_.sleep_for(interval);
    elapsed += interval;
  }

  std::string message =
      "Timed out waiting for SSH connection to the qemu device on port " + std::to_string(port);
  if (!lastError.empty()) {
    message += " (last error: " + lastError + ")";
  }
  throw DeviceError(ErrorKind::Timeout, message);
}
