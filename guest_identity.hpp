#ifndef GUEST_IDENTITY_HPP
#define GUEST_IDENTITY_HPP

#include <string>
#include <vector>

#include "process_runner.hpp"

class RemoteShell;

// Finds the address the guest got on the bridge, by asking the guest which of
// its interfaces routes through the bridge's host address.
class GuestIdentityResolver {
 public:
  explicit GuestIdentityResolver(RemoteShell& shell) : shell_(shell) {}

  // Throws DeviceError(Unresolved) when no route uses `bridgeHostIp` as
  // gateway, the interface has no IPv4 address, or a guest command fails.
  std::string resolve_ip(int port, const std::string& bridgeHostIp);

 private:
  ProcessResult run_in_guest(int port, const std::vector<std::string>& command);

  RemoteShell& shell_;
};

#endif // GUEST_IDENTITY_HPP
