#ifndef HOST_NETWORK_HPP
#define HOST_NETWORK_HPP

#include <filesystem>
#include <optional>
#include <string>

#include <libvirt/libvirt.h>

class ProcessRunner;

// Host side of the bridge: interface addresses, the libvirt virtual networks
// and the files that let the qemu bridge helper attach to the bridge.
// Failures are reported as std::runtime_error.
class HostNetwork {
 public:
  virtual ~HostNetwork() = default;

  // IPv4 address of the interface, or nothing if it has none.
  virtual std::optional<std::string> bridge_ip(const std::string& bridge) = 0;

  virtual void enable_ip_forwarding() = 0;
  virtual void enable_service(const std::string& service) = 0;

  virtual bool network_defined(const std::string& network) = 0;
  virtual void define_network(const std::string& xml) = 0;
  virtual bool network_active(const std::string& network) = 0;
  // Marks the network autostart and starts it.
  virtual void start_network(const std::string& network) = 0;

  // Whole file content, or nothing if it cannot be read.
  virtual std::optional<std::string> read_file(const std::string& path) = 0;
  // Writes the file owned by root:root with the given mode.
  virtual void write_file(const std::string& path, const std::string& content,
                          std::filesystem::perms mode) = 0;

  virtual bool has_setuid(const std::string& path) = 0;
  virtual void set_setuid(const std::string& path) = 0;
};

// Real host: libvirt for networks, getifaddrs for addresses, /proc/sys for
// forwarding and systemctl for the daemon. Needs root.
class LibvirtHostNetwork : public HostNetwork {
 public:
  explicit LibvirtHostNetwork(ProcessRunner& runner, std::string uri = "qemu:///system");
  ~LibvirtHostNetwork() override;

  LibvirtHostNetwork(const LibvirtHostNetwork&) = delete;
  LibvirtHostNetwork& operator=(const LibvirtHostNetwork&) = delete;

  std::optional<std::string> bridge_ip(const std::string& bridge) override;
  void enable_ip_forwarding() override;
  void enable_service(const std::string& service) override;
  bool network_defined(const std::string& network) override;
  void define_network(const std::string& xml) override;
  bool network_active(const std::string& network) override;
  void start_network(const std::string& network) override;
  std::optional<std::string> read_file(const std::string& path) override;
  void write_file(const std::string& path, const std::string& content,
                  std::filesystem::perms mode) override;
  bool has_setuid(const std::string& path) override;
  void set_setuid(const std::string& path) override;

 private:
  // Opened on first use: libvirtd may only be running after enable_service().
  virConnectPtr connection();

  ProcessRunner& runner_;
  std::string uri_;
  virConnectPtr conn_ = nullptr;
};

#endif // HOST_NETWORK_HPP
