#include "cli.hpp"

#include <sstream>

#include "device_error.hpp"
#include "host_capabilities.hpp"
#include "lifecycle_controller.hpp"
#include "log.hpp"
#include "process_runner.hpp"

namespace {

// Value following an option; throws if the command line ends.
std::string take_value(int argc, char* argv[], int& i, const std::string& option) {
  if (i + 1 >= argc) {
    throw UsageError("Option " + option + " requires a value");
  }
  return argv[++i];
}

void parse_port_range(const std::string& text, InstanceConfig& config) {
  std::string::size_type dash = text.find('-');
  if (dash == std::string::npos) {
    throw UsageError("Port range must look like <start>-<end>, got " + text);
  }
  config.portRangeStart = parse_int(text.substr(0, dash), "port range start");
  config.portRangeEnd = parse_int(text.substr(dash + 1), "port range end");
}

}  // namespace

CliOptions parse_cli(int argc, char* argv[]) {
  CliOptions options;
  bool stopRequested = false;
  bool daemonRequested = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      options.mode = CliMode::Help;
      return options;
    } else if (arg == "-i" || arg == "--image") {
      options.config.imagePath = take_value(argc, argv, i, arg);
    } else if (arg == "-B" || arg == "--bridge") {
      options.config.bridgeEnabled = true;
    } else if (arg == "-P" || arg == "--port_forward") {
      options.config.portForwards.push_back(parse_port_forward(take_value(argc, argv, i, arg)));
    } else if (arg == "-R" || arg == "--ram") {
      options.config.memoryMb = parse_memory_size(take_value(argc, argv, i, arg));
    } else if (arg == "--max_ram") {
      options.config.maxMemoryMb = parse_memory_size(take_value(argc, argv, i, arg));
    } else if (arg == "-C" || arg == "--cpu") {
      options.config.cpuCount = parse_int(take_value(argc, argv, i, arg), "CPU count");
    } else if (arg == "-s" || arg == "--stop") {
      stopRequested = true;
      options.stopPort = parse_int(take_value(argc, argv, i, arg), "port");
    } else if (arg == "--port_range") {
      parse_port_range(take_value(argc, argv, i, arg), options.config);
    } else if (arg == "--network_template") {
      options.networkTemplate = take_value(argc, argv, i, arg);
    } else if (arg == "--timeout") {
      options.config.readyTimeout =
          std::chrono::seconds(parse_int(take_value(argc, argv, i, arg), "timeout"));
    } else if (arg == "--skip_packages") {
      options.skipPackages = true;
    } else if (arg == "--no_color") {
      options.color = false;
    } else if (arg == "--daemon") {
      daemonRequested = true;
      // The socket path is optional.
      if (i + 1 < argc && argv[i + 1][0] != '-') {
        options.socketPath = argv[++i];
      }
    } else {
      throw UsageError("Unknown option: " + arg);
    }
  }

  if (stopRequested && daemonRequested) {
    throw UsageError("--stop and --daemon cannot be combined");
  }
  if (stopRequested) {
    if (options.stopPort < 1 || options.stopPort > 65535) {
      throw UsageError("Invalid port: " + std::to_string(options.stopPort));
    }
    options.mode = CliMode::Stop;
    return options;
  }

  options.config.validate();
  if (daemonRequested) {
    options.mode = CliMode::Daemon;
    return options;
  }
  if (options.config.imagePath.empty()) {
    throw UsageError("Providing a QEMU image is mandatory, use the --image flag");
  }
  return options;
}

std::string usage_text(const std::string& programName) {
  std::ostringstream usage;
  usage << "Usage: " << programName << " --image <qemu_image_path> [OPTIONS]\n"
        << "       " << programName << " --stop <port>\n"
        << "       " << programName << " --daemon [socket_path]\n"
        << "\n"
        << "   Runs a QEMU image in the background and waits until it accepts ssh\n"
        << "\n"
        << "   Example:\n"
        << "    " << programName << " --image <path_to_image> --bridge\n"
        << "\n"
        << "Options:\n"
        << "    -h, --help              Show this message and exit\n"
        << "    -i, --image <path>      Path to the qemu image [mandatory to start]\n"
        << "    -B, --bridge            Connect the device to the bridge network with its own MAC address\n"
        << "                            (creates the default bridge network if missing)\n"
        << "    -P, --port_forward <host_port>:<guest_port>\n"
        << "                            Extra TCP port to forward from the host to the guest (repeatable)\n"
        << "    -R, --ram <size>        Initial amount of guest memory (default: 512M)\n"
        << "    --max_ram <size>        Maximum amount of guest memory (default: none)\n"
        << "    -C, --cpu <count>       Number of CPUs (default: 4)\n"
        << "    -s, --stop <port>       Stop the device by its assigned ssh port\n"
        << "    --port_range <a>-<b>    Host ports to pick the ssh forward from (default: 22400-22500)\n"
        << "    --network_template <path>\n"
        << "                            libvirt network definition for the bridge\n"
        << "    --timeout <seconds>     How long to wait for ssh (default: 60)\n"
        << "    --skip_packages         Do not check for the required host packages\n"
        << "    --no_color              Plain output even on a terminal\n"
        << "    --daemon [socket_path]  Serve JSON requests on a Unix socket (default: /tmp/qemu_device.sock)\n";
  return usage.str();
}

int run_cli_mode(const CliOptions& options, LifecycleController& controller,
                 ProcessRunner& runner) {
  try {
    if (options.mode == CliMode::Stop) {
      controller.stop(options.stopPort);
      return 0;
    }

    if (!options.skipPackages) {
      ensure_packages(runner, required_packages());
    }

    InstanceConfig config = options.config;
    apply_host_profile(config, probe_host());

    InstanceHandle handle = controller.start(config);
    log_info("You can use this command to ssh the device:");
    log_info("ssh -p " + std::to_string(handle.port) + " " + kGuestUser + "@" + kGuestHost);
    return 0;
  } catch (const DeviceError& ex) {
    if (controller.failed_stage().empty()) {
      log_error(ex.what());
    } else {
      log_error("Failed at " + controller.failed_stage() + ": " + ex.what());
    }
    return exit_code_for(ex.kind());
  } catch (const std::exception& ex) {
    log_error(ex.what());
    return kInternalErrorExit;
  }
}
