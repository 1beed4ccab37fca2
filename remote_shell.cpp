#include "remote_shell.hpp"

#include <utility>

#include "log.hpp"

namespace {

const std::chrono::seconds kCommandConnectTimeout(5);

}  // namespace

SshRemoteShell::SshRemoteShell(ProcessRunner& runner, std::string user, std::string host)
    : runner_(runner), user_(std::move(user)), host_(std::move(host)) {}

std::vector<std::string> SshRemoteShell::ssh_arguments(
    int port, std::chrono::seconds connectTimeout,
    const std::vector<std::string>& command) const {
  std::vector<std::string> args = {
      "-q",
      "-o", "BatchMode=yes",
      "-o", "StrictHostKeyChecking=no",
      "-o", "ConnectTimeout=" + std::to_string(connectTimeout.count()),
      "-p", std::to_string(port),
      user_ + "@" + host_};
  args.insert(args.end(), command.begin(), command.end());
  return args;
}

void SshRemoteShell::forget_host(int port) {
  // ssh-keygen exits nonzero when there is no known_hosts file; then there is
  // nothing to forget either.
  try {
    runner_.capture("ssh-keygen", {"-R", "[" + host_ + "]:" + std::to_string(port)});
  } catch (const std::exception& e) {
    log_warning(std::string("ssh-keygen failed: ") + e.what());
  }
}

bool SshRemoteShell::probe(int port, std::chrono::seconds connectTimeout) {
  return runner_.capture("ssh", ssh_arguments(port, connectTimeout, {"exit"})).exitCode == 0;
}

ProcessResult SshRemoteShell::exec(int port, const std::vector<std::string>& command) {
  return runner_.capture("ssh", ssh_arguments(port, kCommandConnectTimeout, command));
}
