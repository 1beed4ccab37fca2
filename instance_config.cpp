#include "instance_config.hpp"

#include <cctype>
#include <limits>

#include "device_error.hpp"
#include "host_capabilities.hpp"

namespace {

bool valid_port(int port) {
  return port >= 1 && port <= 65535;
}

}  // namespace

void InstanceConfig::validate() const {
  if (cpuCount < 1) {
    throw UsageError("CPU count must be at least 1");
  }
  if (memoryMb == 0) {
    throw UsageError("Memory size must be greater than zero");
  }
  if (maxMemoryMb && *maxMemoryMb < memoryMb) {
    throw UsageError("Maximum memory must not be below the initial memory");
  }
  if (!valid_port(portRangeStart) || !valid_port(portRangeEnd) || portRangeStart > portRangeEnd) {
    throw UsageError("Invalid port range " + std::to_string(portRangeStart) + "-" +
                     std::to_string(portRangeEnd));
  }
  for (const PortForward& forward : portForwards) {
    if (!valid_port(forward.hostPort) || !valid_port(forward.guestPort)) {
      throw UsageError("Invalid port forward " + std::to_string(forward.hostPort) + ":" +
                       std::to_string(forward.guestPort));
    }
  }
  if (readyTimeout.count() <= 0 || pollInterval.count() <= 0) {
    throw UsageError("Timeout and poll interval must be positive");
  }
}

void apply_host_profile(InstanceConfig& config, const HostProfile& host) {
  config.machineType = host.machineType;
  config.cpuModel = host.cpuModel;
}

std::uint64_t parse_memory_size(const std::string& text) {
  std::string digits = text;
  std::uint64_t scale = 1;
  if (!digits.empty() && std::isalpha(static_cast<unsigned char>(digits.back()))) {
    switch (std::toupper(static_cast<unsigned char>(digits.back()))) {
      case 'M': scale = 1; break;
      case 'G': scale = 1024; break;
      case 'T': scale = 1024 * 1024; break;
      default:
        throw UsageError("Invalid memory size: " + text);
    }
    digits.pop_back();
  }
  if (digits.empty()) {
    throw UsageError("Invalid memory size: " + text);
  }

  std::uint64_t value = 0;
  for (char c : digits) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      throw UsageError("Invalid memory size: " + text);
    }
    if (value > (std::numeric_limits<std::uint64_t>::max() - 9) / 10) {
      throw UsageError("Memory size too large: " + text);
    }
    value = value * 10 + static_cast<std::uint64_t>(c - '0');
  }
  if (value > std::numeric_limits<std::uint64_t>::max() / scale) {
    throw UsageError("Memory size too large: " + text);
  }
  return value * scale;
}

PortForward parse_port_forward(const std::string& text) {
  std::string::size_type colon = text.find(':');
  if (colon == std::string::npos) {
    throw UsageError("Port forward must look like <host_port>:<guest_port>, got " + text);
  }
  PortForward forward;
  forward.hostPort = parse_int(text.substr(0, colon), "host port");
  forward.guestPort = parse_int(text.substr(colon + 1), "guest port");
  if (!valid_port(forward.hostPort) || !valid_port(forward.guestPort)) {
    throw UsageError("Invalid port forward: " + text);
  }
  return forward;
}

int parse_int(const std::string& text, const std::string& what) {
  std::size_t consumed = 0;
  int value = 0;
  try {
    value = std::stoi(text, &consumed);
  } catch (const std::exception&) {
    throw UsageError("Invalid " + what + ": '" + text + "'");
  }
  if (consumed != text.size()) {
    throw UsageError("Invalid " + what + ": '" + text + "'");
  }
  return value;
}
