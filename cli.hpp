#ifndef CLI_HPP
#define CLI_HPP

#include <string>

#include "instance_config.hpp"

class LifecycleController;
class ProcessRunner;

enum class CliMode { Start, Stop, Daemon, Help };

struct CliOptions {
  CliMode mode = CliMode::Start;
  InstanceConfig config;
  int stopPort = 0;
  std::string socketPath = "/tmp/qemu_device.sock";
  // Empty means the template shipped next to the executable.
  std::string networkTemplate;
  bool skipPackages = false;
  bool color = true;
};

// Throws UsageError on anything it does not understand. A start without
// --image is a usage error.
CliOptions parse_cli(int argc, char* argv[]);

std::string usage_text(const std::string& programName);

// Runs a start or stop and returns the process exit code. Errors are logged,
// not thrown.
int run_cli_mode(const CliOptions& options, LifecycleController& controller,
                 ProcessRunner& runner);

#endif // CLI_HPP
