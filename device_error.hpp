#ifndef DEVICE_ERROR_HPP
#define DEVICE_ERROR_HPP

#include <stdexcept>
#include <string>

// Failure kinds reported by the lifecycle stages.
enum class ErrorKind {
  NoFreePort,
  BridgeSetupFailed,
  LaunchFailed,
  Timeout,
  Unresolved,
  ShutdownFailed,
  PrerequisitesMissing
};

const char* to_string(ErrorKind kind);

// Process exit code used by the CLI for each failure kind.
int exit_code_for(ErrorKind kind);

// Exit code for unexpected failures outside the lifecycle stages.
const int kInternalErrorExit = 3;

class DeviceError : public std::runtime_error {
 public:
  DeviceError(ErrorKind kind, const std::string& message);

  ErrorKind kind() const { return kind_; }

 private:
  ErrorKind kind_;
};

// Bad command line or request parameters.
class UsageError : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

#endif // DEVICE_ERROR_HPP
