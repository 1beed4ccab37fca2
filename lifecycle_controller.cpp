#include "lifecycle_controller.hpp"

#include "device_error.hpp"
#include "guest_identity.hpp"
#include "instance_launcher.hpp"
#include "log.hpp"
#include "port_allocator.hpp"
#include "readiness_watcher.hpp"
#include "remote_shell.hpp"

const char* to_string(LifecycleState state) {
  switch (state) {
    case LifecycleState::Uninitialized: return "uninitialized";
    case LifecycleState::PortAllocated: return "port_allocated";
    case LifecycleState::BridgeReady:   return "bridge_ready";
    case LifecycleState::Launched:      return "launched";
    case LifecycleState::Running:       return "running";
    case LifecycleState::Failed:        return "failed";
    case LifecycleState::Stopping:      return "stopping";
    case LifecycleState::Stopped:       return "stopped";
  }
  return "unknown";
}

LifecycleController::LifecycleController(PortAllocator& ports, BridgeProvisioner& bridges,
                                         InstanceLauncher& launcher, ReadinessWatcher& watcher,
                                         GuestIdentityResolver& resolver, RemoteShell& shell)
    : ports_(ports), bridges_(bridges), launcher_(launcher), watcher_(watcher),
      resolver_(resolver), shell_(shell) {}

void LifecycleController::fail(const std::string& stage) {
  handle_.state = LifecycleState::Failed;
  failedStage_ = stage;
}

InstanceHandle LifecycleController::start(const InstanceConfig& config) {
  handle_ = InstanceHandle();
  failedStage_.clear();

  std::string stage = "port allocation";
  try {
    handle_.port = ports_.allocate(config.portRangeStart, config.portRangeEnd);
    handle_.state = LifecycleState::PortAllocated;

    if (config.bridgeEnabled) {
      stage = "bridge setup";
      handle_.bridge = bridges_.ensure_bridge(handle_.port);
    }
    handle_.state = LifecycleState::BridgeReady;

    stage = "launch";
    launcher_.launch(config, handle_.port, handle_.bridge ? &*handle_.bridge : nullptr);
    handle_.state = LifecycleState::Launched;

    stage = "readiness";
    watcher_.wait_ready(handle_.port, config.readyTimeout, config.pollInterval);
  } catch (const std::exception&) {
    fail(stage);
    throw;
  }

  handle_.state = LifecycleState::Running;
  log_success("QEMU device is up");

  if (handle_.bridge) {
    try {
      handle_.guestIp = resolver_.resolve_ip(handle_.port, handle_.bridge->hostIp);
      log_success("Device IP is: " + *handle_.guestIp);
    } catch (const DeviceError& e) {
      // Still usable without the address.
      log_warning("Can't find device IP address: " + std::string(e.what()));
    }
  }
  return handle_;
}

void LifecycleController::stop(int port) {
  handle_ = InstanceHandle();
  handle_.port = port;
  handle_.state = LifecycleState::Stopping;
  failedStage_.clear();

  ProcessResult result;
  std::string reason;
  try {
    result = shell_.exec(port, {"shutdown", "-h", "0"});
  } catch (const std::exception& e) {
    result.exitCode = -1;
    reason = std::string(": ") + e.what();
  }
  if (result.exitCode != 0) {
    fail("shutdown");
    throw DeviceError(ErrorKind::ShutdownFailed,
                      "Shutdown command failed to send to port " + std::to_string(port) + reason);
  }

  handle_.state = LifecycleState::Stopped;
  log_success("Shutdown sent to the device on port " + std::to_string(port));
}
