#include "process_runner.hpp"

#include <boost/process.hpp>
#include <sstream>
#include <stdexcept>

namespace bp = boost::process;

namespace {

// Programs given with a path are used as is, bare names are looked up in PATH.
boost::filesystem::path resolve_executable(const std::string& program) {
  boost::filesystem::path exe = program;
  if (program.find('/') == std::string::npos) {
    exe = bp::search_path(program);
  }
  if (exe.empty() || !boost::filesystem::exists(exe)) {
    throw std::runtime_error("Executable not found: " + program);
  }
  return exe;
}

}  // namespace

int BoostProcessRunner::run(const std::string& program, const std::vector<std::string>& args) {
  boost::filesystem::path exe = resolve_executable(program);
  try {
    return bp::system(exe, bp::args(args));
  } catch (const bp::process_error& e) {
    throw std::runtime_error("Failed to run " + program + ": " + e.what());
  }
}

ProcessResult BoostProcessRunner::capture(const std::string& program,
                                          const std::vector<std::string>& args) {
  boost::filesystem::path exe = resolve_executable(program);
  ProcessResult result;
  try {
    bp::ipstream out;
    bp::child child(exe, bp::args(args),
                    bp::std_out > out, bp::std_err > bp::null, bp::std_in < bp::null);

    std::ostringstream text;
    std::string line;
    while (std::getline(out, line)) {
      text << line << '\n';
    }
    child.wait();

    result.exitCode = child.exit_code();
    result.output = text.str();
  } catch (const bp::process_error& e) {
    throw std::runtime_error("Failed to run " + program + ": " + e.what());
  }
  return result;
}

std::string format_command(const std::string& program, const std::vector<std::string>& args) {
  std::ostringstream cmd;
  cmd << program;
  for (const std::string& arg : args) {
    cmd << ' ' << arg;
  }
  return cmd.str();
}
