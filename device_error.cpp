#include "device_error.hpp"

const char* to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::NoFreePort:           return "NoFreePort";
    case ErrorKind::BridgeSetupFailed:    return "BridgeSetupFailed";
    case ErrorKind::LaunchFailed:         return "LaunchFailed";
    case ErrorKind::Timeout:              return "Timeout";
    case ErrorKind::Unresolved:           return "Unresolved";
    case ErrorKind::ShutdownFailed:       return "ShutdownFailed";
    case ErrorKind::PrerequisitesMissing: return "PrerequisitesMissing";
  }
  return "Unknown";
}

int exit_code_for(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::PrerequisitesMissing: return 2;
    case ErrorKind::ShutdownFailed:       return 4;
    case ErrorKind::NoFreePort:           return 6;
    case ErrorKind::BridgeSetupFailed:    return 7;
    case ErrorKind::LaunchFailed:         return 10;
    case ErrorKind::Timeout:              return 11;
    // Never fatal on its own, but keep it distinct if it ever escapes.
    case ErrorKind::Unresolved:           return 12;
  }
  return 1;
}

DeviceError::DeviceError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}
