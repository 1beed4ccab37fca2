#ifndef INSTANCE_LAUNCHER_HPP
#define INSTANCE_LAUNCHER_HPP

#include <string>
#include <vector>

#include "bridge_provisioner.hpp"
#include "instance_config.hpp"

class ProcessRunner;

// Starts the emulator in the background with -daemonize.
class InstanceLauncher {
 public:
  explicit InstanceLauncher(ProcessRunner& runner,
                            std::string emulator = "qemu-system-x86_64");

  // Emulator arguments for the instance forwarded on `port`. `bridge` may be
  // null when bridging is off.
  std::vector<std::string> build_arguments(const InstanceConfig& config, int port,
                                           const BridgeDescriptor* bridge) const;

  // Returns once the emulator has detached, with the arguments it was given.
  // Throws DeviceError(LaunchFailed) if the image is unusable (before anything
  // is spawned) or the emulator exits nonzero.
  std::vector<std::string> launch(const InstanceConfig& config, int port,
                                  const BridgeDescriptor* bridge);

 private:
  ProcessRunner& runner_;
  std::string emulator_;
};

#endif // INSTANCE_LAUNCHER_HPP
