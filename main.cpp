#include <boost/asio.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <nlohmann/json.hpp>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <string>
using boost::asio::local::stream_protocol;

#include "bridge_provisioner.hpp"
#include "cli.hpp"
#include "command_handler.hpp"
#include "device_error.hpp"
#include "guest_identity.hpp"
#include "host_capabilities.hpp"
#include "host_network.hpp"
#include "instance_launcher.hpp"
#include "lifecycle_controller.hpp"
#include "log.hpp"
#include "port_allocator.hpp"
#include "process_runner.hpp"
#include "readiness_watcher.hpp"
#include "remote_shell.hpp"

namespace {

// configs/default.xml beside the executable, like the build tree lays it out.
std::string default_network_template() {
  std::error_code ec;
  std::filesystem::path exe = std::filesystem::read_symlink("/proc/self/exe", ec);
  if (ec) {
    return "configs/default.xml";
  }
  return (exe.parent_path() / "configs" / "default.xml").string();
}

}  // namespace

int run_daemon_mode(const std::string& socketPath, LifecycleController& controller,
                    const InstanceConfig& defaults) {
  // Remove any existing socket file.
  std::remove(socketPath.c_str());

  boost::asio::io_context io_context;
  stream_protocol::endpoint endpoint(socketPath);
  stream_protocol::acceptor acceptor(io_context, endpoint);

  log_info("QEMU device daemon is running, listening on " + socketPath);

  // Requests are served one at a time; a start blocks until the device is up.
  while (true) {
    try {
      stream_protocol::socket socket(io_context);
      acceptor.accept(socket);

      // Read data from the socket until a newline (message delimiter).
      boost::asio::streambuf buf;
      boost::asio::read_until(socket, buf, "\n");
      std::istream is(&buf);
      std::string request_line;
      std::getline(is, request_line);

      json command_json = json::parse(request_line);
      json response_json = handle_command(command_json, controller, defaults);

      std::string response_str = response_json.dump() + "\n";
      boost::asio::write(socket, boost::asio::buffer(response_str));
    } catch (const std::exception& ex) {
      log_error(std::string("Error handling connection: ") + ex.what());
    }
  }

  return 0;
}

int main(int argc, char* argv[]) {
  std::string programName = std::filesystem::path(argv[0]).filename().string();

  CliOptions options;
  try {
    options = parse_cli(argc, argv);
  } catch (const UsageError& ex) {
    log_error(ex.what());
    std::cerr << usage_text(programName);
    return 1;
  }
  if (options.mode == CliMode::Help) {
    std::cout << usage_text(programName);
    return 0;
  }
  if (!options.color) {
    set_log_color(false);
  }

  BridgeSettings bridgeSettings;
  bridgeSettings.networkTemplate =
      options.networkTemplate.empty() ? default_network_template() : options.networkTemplate;

  BoostProcessRunner runner;
  TcpPortProbe portProbe;
  PortAllocator ports(portProbe);
  LibvirtHostNetwork network(runner);
  BridgeProvisioner bridges(network, bridgeSettings);
  InstanceLauncher launcher(runner);
  SshRemoteShell shell(runner, kGuestUser, kGuestHost);
  ThreadSleeper sleeper;
  ReadinessWatcher watcher(shell, sleeper);
  GuestIdentityResolver resolver(shell);
  LifecycleController controller(ports, bridges, launcher, watcher, resolver, shell);

  if (options.mode == CliMode::Daemon) {
    InstanceConfig defaults = options.config;
    apply_host_profile(defaults, probe_host());
    try {
      if (!options.skipPackages) {
        ensure_packages(runner, required_packages());
      }
      return run_daemon_mode(options.socketPath, controller, defaults);
    } catch (const DeviceError& ex) {
      log_error(ex.what());
      return exit_code_for(ex.kind());
    } catch (const std::exception& ex) {
      log_error(std::string("Daemon failed: ") + ex.what());
      return kInternalErrorExit;
    }
  }

  return run_cli_mode(options, controller, runner);
}
