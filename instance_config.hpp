#ifndef INSTANCE_CONFIG_HPP
#define INSTANCE_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct HostProfile;

// Fixed ends of the remote shell forward.
const int kGuestSshPort = 22222;
const char* const kGuestUser = "root";
const char* const kGuestHost = "localhost";

// Extra host -> guest TCP forward.
struct PortForward {
  int hostPort = 0;
  int guestPort = 0;
};

// Everything needed to boot one instance. Built once, then only read.
struct InstanceConfig {
  std::string imagePath;
  std::uint64_t memoryMb = 512;
  std::optional<std::uint64_t> maxMemoryMb;
  int cpuCount = 4;
  bool bridgeEnabled = false;
  int portRangeStart = 22400;
  int portRangeEnd = 22500;
  std::string machineType = "type=pc";
  std::string cpuModel = "qemu64";
  std::vector<PortForward> portForwards;
  std::chrono::seconds readyTimeout{60};
  std::chrono::seconds pollInterval{5};

  // Throws UsageError on inconsistent values. The image itself is checked
  // by the launcher.
  void validate() const;
};

// Takes machine type and CPU model from the probed host.
void apply_host_profile(InstanceConfig& config, const HostProfile& host);

// qemu size syntax: "512" (MiB), "512M", "2G", "1T". Throws UsageError.
std::uint64_t parse_memory_size(const std::string& text);

// "<host>:<guest>", e.g. "8080:80". Throws UsageError.
PortForward parse_port_forward(const std::string& text);

// Whole-string integer parse. Throws UsageError naming `what`.
int parse_int(const std::string& text, const std::string& what);

#endif // INSTANCE_CONFIG_HPP
