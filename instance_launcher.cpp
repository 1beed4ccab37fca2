#include "instance_launcher.hpp"

#include <filesystem>
#include <sstream>
#include <unistd.h>      // For access()
#include <utility>

#include "device_error.hpp"
#include "log.hpp"
#include "process_runner.hpp"

namespace {

// qemu option values use ',' as separator; a literal comma is written twice.
std::string escape_option_value(const std::string& value) {
  std::string escaped;
  for (char c : value) {
    escaped += c;
    if (c == ',') {
      escaped += ',';
    }
  }
  return escaped;
}

std::string memory_option(const InstanceConfig& config) {
  std::ostringstream option;
  // qemu refuses hotplug slots without room above the initial size.
  if (config.maxMemoryMb && *config.maxMemoryMb > config.memoryMb) {
    option << "size=" << config.memoryMb << "M,slots=1,maxmem=" << *config.maxMemoryMb << "M";
  } else {
    option << config.memoryMb << "M";
  }
  return option.str();
}

void check_image(const std::string& imagePath) {
  if (imagePath.empty()) {
    throw DeviceError(ErrorKind::LaunchFailed,
                      "Providing a QEMU image is mandatory, use the --image flag");
  }
  std::error_code ec;
  if (!std::filesystem::is_regular_file(imagePath, ec)) {
    throw DeviceError(ErrorKind::LaunchFailed, "Image not found: " + imagePath);
  }
  if (access(imagePath.c_str(), R_OK) != 0) {
    throw DeviceError(ErrorKind::LaunchFailed, "Image is not readable: " + imagePath);
  }
}

}  // namespace

InstanceLauncher::InstanceLauncher(ProcessRunner& runner, std::string emulator)
    : runner_(runner), emulator_(std::move(emulator)) {}

std::vector<std::string> InstanceLauncher::build_arguments(const InstanceConfig& config, int port,
                                                           const BridgeDescriptor* bridge) const {
  std::ostringstream userNet;
  userNet << "user,hostfwd=tcp::" << port << "-:" << kGuestSshPort;
  for (const PortForward& forward : config.portForwards) {
    userNet << ",hostfwd=tcp::" << forward.hostPort << "-:" << forward.guestPort;
  }

  std::vector<std::string> args = {
      "-device", "ahci,id=ahci",
      "-drive", "file=" + escape_option_value(config.imagePath) +
                ",media=disk,cache=none,format=raw,if=none,id=disk",
      "-device", "ide-hd,drive=disk,bus=ahci.0",
      "-net", "nic,model=virtio",
      "-net", userNet.str()};

  if (bridge) {
    args.insert(args.end(), bridge->netdevArgs.begin(), bridge->netdevArgs.end());
  }

  const std::vector<std::string> tail = {
      "-m", memory_option(config),
      "-display", "none",
      "-daemonize",
      "-machine", config.machineType,
      "-smp", std::to_string(config.cpuCount),
      "-cpu", config.cpuModel};
  args.insert(args.end(), tail.begin(), tail.end());
  return args;
}

std::vector<std::string> InstanceLauncher::launch(const InstanceConfig& config, int port,
                                                  const BridgeDescriptor* bridge) {
  check_image(config.imagePath);

  std::vector<std::string> args = build_arguments(config, port, bridge);
  log_warning("Trying to start QEMU device");
  log_info("Emulator command: " + format_command(emulator_, args));

  int status = 0;
  try {
    status = runner_.run(emulator_, args);
  } catch (const std::exception& e) {
    throw DeviceError(ErrorKind::LaunchFailed,
                      "Failed to start qemu device: " + std::string(e.what()));
  }
  if (status != 0) {
    throw DeviceError(ErrorKind::LaunchFailed,
                      "Failed to start qemu device, emulator exited with " + std::to_string(status));
  }

  log_info("Starting QEMU device on background, please wait... (around one minute)");
  return args;
}
