#ifndef REMOTE_SHELL_HPP
#define REMOTE_SHELL_HPP

#include <chrono>
#include <string>
#include <vector>

#include "process_runner.hpp"

// Shell access to the guest through its forwarded ssh port on the host.
class RemoteShell {
 public:
  virtual ~RemoteShell() = default;

  // Drops any cached host key for the forwarded port. A previous instance on
  // the same port most likely had another key. Failures are not fatal.
  virtual void forget_host(int port) = 0;

  // Connects and exits immediately. True if the guest accepted the session.
  virtual bool probe(int port, std::chrono::seconds connectTimeout) = 0;

  // Runs `command` in the guest and captures its stdout.
  virtual ProcessResult exec(int port, const std::vector<std::string>& command) = 0;
};

// OpenSSH client. Host key checking is off: the peer is an ephemeral guest
// reached through a loopback forward.
class SshRemoteShell : public RemoteShell {
 public:
  explicit SshRemoteShell(ProcessRunner& runner, std::string user = "root",
                          std::string host = "localhost");

  void forget_host(int port) override;
  bool probe(int port, std::chrono::seconds connectTimeout) override;
  ProcessResult exec(int port, const std::vector<std::string>& command) override;

  std::vector<std::string> ssh_arguments(int port, std::chrono::seconds connectTimeout,
                                         const std::vector<std::string>& command) const;

 private:
  ProcessRunner& runner_;
  std::string user_;
  std::string host_;
};

#endif // REMOTE_SHELL_HPP
