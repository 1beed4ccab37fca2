#ifndef BRIDGE_PROVISIONER_HPP
#define BRIDGE_PROVISIONER_HPP

#include <string>
#include <vector>

class HostNetwork;

// Where the bridge lives and how the qemu helper gets access to it.
struct BridgeSettings {
  std::string bridgeName = "virbr0";
  std::string networkName = "default";
  std::string networkTemplate = "configs/default.xml";
  std::string serviceName = "libvirtd.service";
  std::string helperAclPath = "/etc/qemu/bridge.conf";
  std::string helperBinary = "/usr/lib/qemu/qemu-bridge-helper";
  std::string macPrefix = "52:54:00:12:34";
};

struct BridgeDescriptor {
  std::string bridgeName;
  std::string hostIp;
  std::string macAddress;
  // Emulator arguments attaching a virtio NIC to the bridge.
  std::vector<std::string> netdevArgs;
};

// MAC address for the instance forwarded on `port`: the prefix followed by
// the port's last two decimal digits, so instances sharing the bridge differ.
std::string mac_for_port(const std::string& prefix, int port);

class BridgeProvisioner {
 public:
  BridgeProvisioner(HostNetwork& network, BridgeSettings settings);

  // Makes sure the bridge is up and usable by the emulator. Every step checks
  // the host first, so calling it again only inspects. Throws
  // DeviceError(BridgeSetupFailed) on any failure, leaving completed steps.
  BridgeDescriptor ensure_bridge(int port);

 private:
  std::string provision_network();
  void ensure_helper_access();

  HostNetwork& network_;
  BridgeSettings settings_;
};

#endif // BRIDGE_PROVISIONER_HPP
