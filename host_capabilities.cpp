#include "host_capabilities.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

#include "device_error.hpp"
#include "log.hpp"
#include "process_runner.hpp"

namespace {

bool cpu_has_virtualization(const std::string& cpuinfoPath) {
  std::ifstream cpuinfo(cpuinfoPath);
  std::string line;
  while (std::getline(cpuinfo, line)) {
    if (line.compare(0, 5, "flags") != 0) {
      continue;
    }
    std::istringstream flags(line);
    std::string flag;
    while (flags >> flag) {
      if (flag == "vmx" || flag == "svm") {
        return true;
      }
    }
  }
  return false;
}

}  // namespace

HostProfile probe_host(const std::string& cpuinfoPath, const std::string& kvmDevice) {
  HostProfile profile;
  std::error_code ec;
  if (std::filesystem::exists(kvmDevice, ec) && cpu_has_virtualization(cpuinfoPath)) {
    profile.accelerated = true;
    profile.machineType = "type=pc,accel=kvm";
    profile.cpuModel = "host";
  }
  return profile;
}

std::vector<std::string> required_packages() {
  return {"qemu-system-x86", "libvirt-daemon-system"};
}

void ensure_packages(ProcessRunner& runner, const std::vector<std::string>& packages) {
  std::vector<std::string> query = {"-s"};
  query.insert(query.end(), packages.begin(), packages.end());
  std::vector<std::string> install = {"install", "-y"};
  install.insert(install.end(), packages.begin(), packages.end());

  try {
    if (runner.capture("dpkg", query).exitCode == 0) {
      return;
    }
    log_warning("Necessary packages are missing, installing...");
    if (runner.run("apt-get", install) != 0) {
      throw DeviceError(ErrorKind::PrerequisitesMissing, "Failed to install necessary packages");
    }
  } catch (const DeviceError&) {
    throw;
  } catch (const std::exception& e) {
    throw DeviceError(ErrorKind::PrerequisitesMissing,
                      "Failed to check necessary packages: " + std::string(e.what()));
  }
}
