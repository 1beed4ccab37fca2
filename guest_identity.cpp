#include "guest_identity.hpp"

#include <sstream>
#include <vector>

#include "device_error.hpp"
#include "remote_shell.hpp"

namespace {

std::vector<std::string> split_fields(const std::string& line) {
  std::istringstream in(line);
  std::vector<std::string> fields;
  std::string field;
  while (in >> field) {
    fields.push_back(field);
  }
  return fields;
}

// "default via 192.168.122.1 dev eth1 ..." -> "eth1"
std::string interface_for_gateway(const std::string& routes, const std::string& gateway) {
  std::istringstream lines(routes);
  std::string line;
  while (std::getline(lines, line)) {
    std::vector<std::string> fields = split_fields(line);
    if (fields.size() < 3 || fields[2] != gateway) {
      continue;
    }
    for (std::size_t i = 3; i + 1 < fields.size(); ++i) {
      if (fields[i] == "dev") {
        return fields[i + 1];
      }
    }
  }
  return "";
}

// "    inet 192.168.122.57/24 brd ..." -> "192.168.122.57"
std::string first_inet_address(const std::string& addresses) {
  std::istringstream lines(addresses);
  std::string line;
  while (std::getline(lines, line)) {
    std::vector<std::string> fields = split_fields(line);
    if (fields.size() >= 2 && fields[0] == "inet") {
      return fields[1].substr(0, fields[1].find('/'));
    }
  }
  return "";
}

}  // namespace

ProcessResult GuestIdentityResolver::run_in_guest(int port, const std::vector<std::string>& command) {
  try {
    return shell_.exec(port, command);
  } catch (const std::exception& e) {
    throw DeviceError(ErrorKind::Unresolved, e.what());
  }
}

std::string GuestIdentityResolver::resolve_ip(int port, const std::string& bridgeHostIp) {
  ProcessResult routes = run_in_guest(port, {"ip", "route"});
  if (routes.exitCode != 0) {
    throw DeviceError(ErrorKind::Unresolved, "Failed to read the routing table of the device");
  }
  std::string ifname = interface_for_gateway(routes.output, bridgeHostIp);
  if (ifname.empty()) {
    throw DeviceError(ErrorKind::Unresolved, "No route on the device goes through " + bridgeHostIp);
  }

  ProcessResult addresses = run_in_guest(port, {"ip", "-4", "address", "show", "dev", ifname});
  if (addresses.exitCode != 0) {
    throw DeviceError(ErrorKind::Unresolved, "Failed to read the address of " + ifname);
  }
  std::string ip = first_inet_address(addresses.output);
  if (ip.empty()) {
    throw DeviceError(ErrorKind::Unresolved, "Interface " + ifname + " has no IPv4 address");
  }
  return ip;
}
