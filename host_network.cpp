#include "host_network.hpp"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <netinet/in.h>
#include <unistd.h>      // For chown()

#include <cerrno>
#include <cstring>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "process_runner.hpp"

namespace {

const char* const kIpForwardPath = "/proc/sys/net/ipv4/ip_forward";

using NetworkPtr = std::unique_ptr<virNetwork, decltype(&virNetworkFree)>;

// libvirt prints every error to stderr by default; we report them ourselves.
void quiet_libvirt_errors(void* /*userData*/, virErrorPtr /*error*/) {}

std::string libvirt_error() {
  const char* message = virGetLastErrorMessage();
  return message ? message : "unknown libvirt error";
}

}  // namespace

LibvirtHostNetwork::LibvirtHostNetwork(ProcessRunner& runner, std::string uri)
    : runner_(runner), uri_(std::move(uri)) {
  virSetErrorFunc(nullptr, quiet_libvirt_errors);
}

LibvirtHostNetwork::~LibvirtHostNetwork() {
  if (conn_) {
    virConnectClose(conn_);
  }
}

virConnectPtr LibvirtHostNetwork::connection() {
  if (!conn_) {
    conn_ = virConnectOpen(uri_.c_str());
    if (!conn_) {
      throw std::runtime_error("Failed to connect to hypervisor " + uri_ + ": " + libvirt_error());
    }
  }
  return conn_;
}

std::optional<std::string> LibvirtHostNetwork::bridge_ip(const std::string& bridge) {
  ifaddrs* addresses = nullptr;
  if (getifaddrs(&addresses) != 0) {
    throw std::runtime_error(std::string("getifaddrs failed: ") + std::strerror(errno));
  }

  std::optional<std::string> found;
  for (ifaddrs* ifa = addresses; ifa != nullptr; ifa = ifa->ifa_next) {
    if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET || bridge != ifa->ifa_name) {
      continue;
    }
    char buffer[INET_ADDRSTRLEN] = {};
    // AF_INET entries carry a sockaddr_in behind the generic sockaddr.
    const auto* in = reinterpret_cast<const sockaddr_in*>(ifa->ifa_addr);
    if (inet_ntop(AF_INET, &in->sin_addr, buffer, sizeof(buffer))) {
      found = buffer;
      break;
    }
  }
  freeifaddrs(addresses);
  return found;
}

void LibvirtHostNetwork::enable_ip_forwarding() {
  std::ofstream out(kIpForwardPath);
  out << "1\n";
  out.flush();
  if (!out) {
    throw std::runtime_error(std::string("Failed to enable IP forwarding via ") + kIpForwardPath);
  }
}

void LibvirtHostNetwork::enable_service(const std::string& service) {
  if (runner_.run("systemctl", {"enable", "--now", service}) != 0) {
    throw std::runtime_error("Failed to enable and start " + service);
  }
}

bool LibvirtHostNetwork::network_defined(const std::string& network) {
  NetworkPtr net(virNetworkLookupByName(connection(), network.c_str()), virNetworkFree);
  return net != nullptr;
}

void LibvirtHostNetwork::define_network(const std::string& xml) {
  NetworkPtr net(virNetworkDefineXML(connection(), xml.c_str()), virNetworkFree);
  if (!net) {
    throw std::runtime_error("Failed to define network: " + libvirt_error());
  }
}

bool LibvirtHostNetwork::network_active(const std::string& network) {
  NetworkPtr net(virNetworkLookupByName(connection(), network.c_str()), virNetworkFree);
  if (!net) {
    return false;
  }
  int active = virNetworkIsActive(net.get());
  if (active < 0) {
    throw std::runtime_error("Failed to query network " + network + ": " + libvirt_error());
  }
  return active == 1;
}

void LibvirtHostNetwork::start_network(const std::string& network) {
  NetworkPtr net(virNetworkLookupByName(connection(), network.c_str()), virNetworkFree);
  if (!net) {
    throw std::runtime_error("Network " + network + " is not defined: " + libvirt_error());
  }
  if (virNetworkSetAutostart(net.get(), 1) < 0) {
    throw std::runtime_error("Failed to autostart network " + network + ": " + libvirt_error());
  }
  if (virNetworkCreate(net.get()) < 0) {
    throw std::runtime_error("Failed to start network " + network + ": " + libvirt_error());
  }
}

std::optional<std::string> LibvirtHostNetwork::read_file(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    return std::nullopt;
  }
  std::ostringstream content;
  content << in.rdbuf();
  return content.str();
}

void LibvirtHostNetwork::write_file(const std::string& path, const std::string& content,
                                    std::filesystem::perms mode) {
  std::filesystem::path target(path);
  if (target.has_parent_path()) {
    std::filesystem::create_directories(target.parent_path());
  }

  std::ofstream out(path, std::ios::trunc);
  out << content;
  out.close();
  if (!out) {
    throw std::runtime_error("Failed to write " + path);
  }
  if (chown(path.c_str(), 0, 0) != 0) {
    throw std::runtime_error("Failed to chown " + path + ": " + std::strerror(errno));
  }
  std::filesystem::permissions(target, mode, std::filesystem::perm_options::replace);
}

bool LibvirtHostNetwork::has_setuid(const std::string& path) {
  std::filesystem::file_status status = std::filesystem::status(path);
  if (!std::filesystem::exists(status)) {
    throw std::runtime_error(path + " does not exist");
  }
  std::filesystem::perms current = status.permissions();
  return (current & std::filesystem::perms::set_uid) != std::filesystem::perms::none;
}

void LibvirtHostNetwork::set_setuid(const std::string& path) {
  std::filesystem::permissions(path, std::filesystem::perms::set_uid,
                               std::filesystem::perm_options::add);
}
