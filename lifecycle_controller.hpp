#ifndef LIFECYCLE_CONTROLLER_HPP
#define LIFECYCLE_CONTROLLER_HPP

#include <optional>
#include <string>

#include "bridge_provisioner.hpp"
#include "instance_config.hpp"

class PortAllocator;
class InstanceLauncher;
class ReadinessWatcher;
class GuestIdentityResolver;
class RemoteShell;

enum class LifecycleState {
  Uninitialized,
  PortAllocated,
  BridgeReady,
  Launched,
  Running,
  Failed,
  Stopping,
  Stopped
};

const char* to_string(LifecycleState state);

struct InstanceHandle {
  int port = 0;
  std::optional<BridgeDescriptor> bridge;
  LifecycleState state = LifecycleState::Uninitialized;
  // Only set when running on the bridge and the guest reported an address.
  std::optional<std::string> guestIp;
};

// Drives one instance from nothing to reachable, and shuts it down by port.
//
// A failing stage stops the sequence, leaves the state at Failed and rethrows;
// stages already done are not undone. In particular a provisioned bridge stays
// up for the next run.
class LifecycleController {
 public:
  LifecycleController(PortAllocator& ports, BridgeProvisioner& bridges,
                      InstanceLauncher& launcher, ReadinessWatcher& watcher,
                      GuestIdentityResolver& resolver, RemoteShell& shell);

  InstanceHandle start(const InstanceConfig& config);

  // Sends the shutdown command to whatever answers on `port`.
  // Throws DeviceError(ShutdownFailed).
  void stop(int port);

  LifecycleState state() const { return handle_.state; }
  const InstanceHandle& handle() const { return handle_; }
  // Name of the stage that failed last, empty if none did.
  const std::string& failed_stage() const { return failedStage_; }

 private:
  void fail(const std::string& stage);

  PortAllocator& ports_;
  BridgeProvisioner& bridges_;
  InstanceLauncher& launcher_;
  ReadinessWatcher& watcher_;
  GuestIdentityResolver& resolver_;
  RemoteShell& shell_;

  InstanceHandle handle_;
  std::string failedStage_;
};

#endif // LIFECYCLE_CONTROLLER_HPP
