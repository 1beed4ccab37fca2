/**
 * @file fakes.hpp
 * @brief In-memory stand-ins for the host, the emulator and the guest.
 */

#ifndef TESTS_FAKES_HPP
#define TESTS_FAKES_HPP

#include <unistd.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "bridge_provisioner.hpp"
#include "guest_identity.hpp"
#include "host_network.hpp"
#include "instance_launcher.hpp"
#include "lifecycle_controller.hpp"
#include "port_allocator.hpp"
#include "process_runner.hpp"
#include "readiness_watcher.hpp"
#include "remote_shell.hpp"

inline std::string join_command(const std::vector<std::string>& command) {
  std::string joined;
  for (const std::string& part : command) {
    if (!joined.empty()) {
      joined += ' ';
    }
    joined += part;
  }
  return joined;
}

struct RecordedCall {
  std::string program;
  std::vector<std::string> args;
  bool captured = false;
};

class FakeProcessRunner : public ProcessRunner {
 public:
  int run(const std::string& program, const std::vector<std::string>& args) override {
    calls.push_back({program, args, false});
    if (throwOnRun) {
      throw std::runtime_error("Executable not found: " + program);
    }
    auto it = runStatus.find(program);
    return it == runStatus.end() ? 0 : it->second;
  }

  ProcessResult capture(const std::string& program,
                        const std::vector<std::string>& args) override {
    calls.push_back({program, args, true});
    if (missingPrograms.count(program) > 0) {
      throw std::runtime_error("Executable not found: " + program);
    }
    auto it = captureResults.find(program);
    if (it == captureResults.end()) {
      return ProcessResult{0, ""};
    }
    return it->second;
  }

  std::vector<RecordedCall> calls;
  std::map<std::string, int> runStatus;
  std::map<std::string, ProcessResult> captureResults;
  // capture() throws for these, like a binary missing from PATH.
  std::set<std::string> missingPrograms;
  bool throwOnRun = false;
};

class FakePortProbe : public PortProbe {
 public:
  bool in_use(int port) override {
    probed.push_back(port);
    return busy.count(port) > 0;
  }

  std::set<int> busy;
  std::vector<int> probed;
};

class FakeSleeper : public Sleeper {
 public:
  void sleep_for(std::chrono::seconds duration) override {
    ++calls;
    total += duration;
  }

  int calls = 0;
  std::chrono::seconds total{0};
};

// Guest reached over ssh. Commands without a scripted response fail like ssh
// does when nothing listens on the port.
class FakeRemoteShell : public RemoteShell {
 public:
  void forget_host(int port) override {
    events.push_back("forget:" + std::to_string(port));
    if (throwOnForget) {
      throw std::runtime_error("Executable not found: ssh-keygen");
    }
  }

  bool probe(int port, std::chrono::seconds connectTimeout) override {
    events.push_back("probe:" + std::to_string(port));
    lastConnectTimeout = connectTimeout;
    ++probeCalls;
    if (probeCalls <= throwingProbes) {
      throw std::runtime_error("Executable not found: ssh");
    }
    return readyAfter >= 0 && probeCalls > readyAfter;
  }

  ProcessResult exec(int port, const std::vector<std::string>& command) override {
    std::string key = join_command(command);
    events.push_back("exec:" + std::to_string(port) + ":" + key);
    if (throwOnExec) {
      throw std::runtime_error("Executable not found: ssh");
    }
    auto it = responses.find(key);
    if (it == responses.end()) {
      return ProcessResult{255, ""};
    }
    return it->second;
  }

  // Number of failing probes before the guest answers; -1 never answers.
  int readyAfter = 0;
  int probeCalls = 0;
  std::chrono::seconds lastConnectTimeout{0};
  std::map<std::string, ProcessResult> responses;
  std::vector<std::string> events;
  // The first `throwingProbes` probes throw instead of answering.
  int throwingProbes = 0;
  bool throwOnForget = false;
  bool throwOnExec = false;
};

// Host bridge state kept in memory. `mutations` lists every call that would
// change the host, `calls` counts every call at all.
class FakeHostNetwork : public HostNetwork {
 public:
  std::optional<std::string> bridge_ip(const std::string& bridge) override {
    ++calls;
    queriedBridges.push_back(bridge);
    return bridgeAddress;
  }

  void enable_ip_forwarding() override {
    ++calls;
    mutations.push_back("enable_ip_forwarding");
  }

  void enable_service(const std::string& service) override {
    ++calls;
    mutations.push_back("enable_service:" + service);
    if (failService) {
      throw std::runtime_error("Failed to enable and start " + service);
    }
  }

  bool network_defined(const std::string& network) override {
    ++calls;
    return defined.count(network) > 0;
  }

  void define_network(const std::string& xml) override {
    ++calls;
    mutations.push_back("define_network");
    definedXml.push_back(xml);
    defined.insert(definedName);
  }

  bool network_active(const std::string& network) override {
    ++calls;
    return active.count(network) > 0;
  }

  void start_network(const std::string& network) override {
    ++calls;
    mutations.push_back("start_network:" + network);
    active.insert(network);
    bridgeAddress = addressAfterStart;
  }

  std::optional<std::string> read_file(const std::string& path) override {
    ++calls;
    auto it = files.find(path);
    if (it == files.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  void write_file(const std::string& path, const std::string& content,
                  std::filesystem::perms mode) override {
    ++calls;
    mutations.push_back("write_file:" + path);
    files[path] = content;
    modes[path] = mode;
  }

  bool has_setuid(const std::string& path) override {
    ++calls;
    return setuid.count(path) > 0;
  }

  void set_setuid(const std::string& path) override {
    ++calls;
    mutations.push_back("set_setuid:" + path);
    setuid.insert(path);
  }

  std::optional<std::string> bridgeAddress;
  std::optional<std::string> addressAfterStart = std::string("192.168.122.1");
  std::string definedName = "default";
  std::set<std::string> defined;
  std::set<std::string> active;
  std::map<std::string, std::string> files;
  std::map<std::string, std::filesystem::perms> modes;
  std::set<std::string> setuid;
  std::vector<std::string> definedXml;
  std::vector<std::string> queriedBridges;
  std::vector<std::string> mutations;
  bool failService = false;
  int calls = 0;
};

// Regular file in the temp directory, removed again on destruction.
class TempFile {
 public:
  explicit TempFile(const std::string& content = "") {
    std::string pattern =
        (std::filesystem::temp_directory_path() / "qemu_device_test_XXXXXX").string();
    std::vector<char> name(pattern.begin(), pattern.end());
    name.push_back('\0');
    int fd = mkstemp(name.data());
    if (fd < 0) {
      throw std::runtime_error("mkstemp failed");
    }
    close(fd);
    path_ = name.data();
    std::ofstream(path_) << content;
  }

  ~TempFile() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
  }

  TempFile(const TempFile&) = delete;
  TempFile& operator=(const TempFile&) = delete;

  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

const char* const kTemplatePath = "templates/default.xml";
const char* const kTemplateXml = "<network><name>default</name></network>";

// Real components wired to the fakes above.
struct DeviceHarness {
  DeviceHarness()
      : ports(portProbe),
        bridges(network, make_settings()),
        launcher(runner),
        watcher(shell, sleeper),
        resolver(shell),
        controller(ports, bridges, launcher, watcher, resolver, shell) {
    network.files[kTemplatePath] = kTemplateXml;
    config.imagePath = image.path();
  }

  static BridgeSettings make_settings() {
    BridgeSettings settings;
    settings.networkTemplate = kTemplatePath;
    return settings;
  }

  // Calls made to the emulator binary.
  std::vector<RecordedCall> emulator_calls() const {
    std::vector<RecordedCall> found;
    for (const RecordedCall& call : runner.calls) {
      if (call.program == "qemu-system-x86_64") {
        found.push_back(call);
      }
    }
    return found;
  }

  TempFile image{"raw disk"};
  FakePortProbe portProbe;
  FakeHostNetwork network;
  FakeProcessRunner runner;
  FakeRemoteShell shell;
  FakeSleeper sleeper;
  PortAllocator ports;
  BridgeProvisioner bridges;
  InstanceLauncher launcher;
  ReadinessWatcher watcher;
  GuestIdentityResolver resolver;
  LifecycleController controller;
  InstanceConfig config;
};

#endif // TESTS_FAKES_HPP
