#include "bridge_provisioner.hpp"

#include <cstdio>
#include <optional>
#include <sstream>
#include <utility>

#include "device_error.hpp"
#include "host_network.hpp"
#include "log.hpp"

namespace {

std::string trim(const std::string& text) {
  const char* blanks = " \t\r\n";
  std::string::size_type first = text.find_first_not_of(blanks);
  if (first == std::string::npos) {
    return "";
  }
  std::string::size_type last = text.find_last_not_of(blanks);
  return text.substr(first, last - first + 1);
}

bool has_rule(const std::string& content, const std::string& rule) {
  std::istringstream lines(content);
  std::string line;
  while (std::getline(lines, line)) {
    if (trim(line) == rule) {
      return true;
    }
  }
  return false;
}

}  // namespace

std::string mac_for_port(const std::string& prefix, int port) {
  char suffix[4];
  std::snprintf(suffix, sizeof(suffix), "%02d", port % 100);
  return prefix + ":" + suffix;
}

BridgeProvisioner::BridgeProvisioner(HostNetwork& network, BridgeSettings settings)
    : network_(network), settings_(std::move(settings)) {}

BridgeDescriptor BridgeProvisioner::ensure_bridge(int port) {
  BridgeDescriptor descriptor;
  descriptor.bridgeName = settings_.bridgeName;

  try {
    std::optional<std::string> hostIp = network_.bridge_ip(settings_.bridgeName);
    if (!hostIp) {
      log_warning("Setting up virtual bridge");
      hostIp = provision_network();
    }
    ensure_helper_access();
    descriptor.hostIp = *hostIp;
  } catch (const DeviceError&) {
    throw;
  } catch (const std::exception& e) {
    throw DeviceError(ErrorKind::BridgeSetupFailed,
                      "Bridge setup failed: " + std::string(e.what()));
  }

  descriptor.macAddress = mac_for_port(settings_.macPrefix, port);
  descriptor.netdevArgs = {
      "-netdev", "bridge,id=hn0,br=" + settings_.bridgeName,
      "-device", "virtio-net-pci,netdev=hn0,id=nic1,mac=" + descriptor.macAddress};

  log_info("Bridge IP is: " + descriptor.hostIp);
  return descriptor;
}

std::string BridgeProvisioner::provision_network() {
  network_.enable_ip_forwarding();
  network_.enable_service(settings_.serviceName);

  // An already defined network counts as done.
  if (!network_.network_defined(settings_.networkName)) {
    std::optional<std::string> xml = network_.read_file(settings_.networkTemplate);
    if (!xml) {
      throw DeviceError(ErrorKind::BridgeSetupFailed,
                        "Cannot read network template " + settings_.networkTemplate);
    }
    network_.define_network(*xml);
  }
  if (!network_.network_active(settings_.networkName)) {
    network_.start_network(settings_.networkName);
  }

  std::optional<std::string> hostIp = network_.bridge_ip(settings_.bridgeName);
  if (!hostIp) {
    throw DeviceError(ErrorKind::BridgeSetupFailed,
                      "Bridge " + settings_.bridgeName + " has no IPv4 address after starting network " +
                      settings_.networkName);
  }
  return *hostIp;
}

void BridgeProvisioner::ensure_helper_access() {
  const std::string rule = "allow " + settings_.bridgeName;

  std::optional<std::string> current = network_.read_file(settings_.helperAclPath);
  if (!current || !has_rule(*current, rule)) {
    log_warning("Setting up qemu bridge helper");
    using std::filesystem::perms;
    // World-readable, writable by root only.
    network_.write_file(settings_.helperAclPath, rule + "\n",
                        perms::owner_read | perms::owner_write |
                        perms::group_read | perms::others_read);
  }
  if (!network_.has_setuid(settings_.helperBinary)) {
    network_.set_setuid(settings_.helperBinary);
  }
}
