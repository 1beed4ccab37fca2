#ifndef HOST_CAPABILITIES_HPP
#define HOST_CAPABILITIES_HPP

#include <string>
#include <vector>

class ProcessRunner;

// Emulated hardware profile chosen from what the host offers.
struct HostProfile {
  bool accelerated = false;
  std::string machineType = "type=pc";
  std::string cpuModel = "qemu64";
};

// KVM profile when the device node exists and the CPU advertises vmx or svm,
// the generic software profile otherwise.
HostProfile probe_host(const std::string& cpuinfoPath = "/proc/cpuinfo",
                       const std::string& kvmDevice = "/dev/kvm");

// Packages the emulator and the bridge need on a Debian style host.
std::vector<std::string> required_packages();

// Checks the packages with dpkg and installs missing ones with apt-get.
// Throws DeviceError(PrerequisitesMissing) when installation fails.
void ensure_packages(ProcessRunner& runner, const std::vector<std::string>& packages);

#endif // HOST_CAPABILITIES_HPP
