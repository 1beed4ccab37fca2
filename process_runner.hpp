#ifndef PROCESS_RUNNER_HPP
#define PROCESS_RUNNER_HPP

#include <string>
#include <vector>

struct ProcessResult {
  int exitCode = -1;
  std::string output;   // captured stdout
};

// Runs external programs. Implementations throw std::runtime_error when the
// program cannot be started at all.
class ProcessRunner {
 public:
  virtual ~ProcessRunner() = default;

  // Runs to completion with the caller's stdio; returns the exit code.
  virtual int run(const std::string& program, const std::vector<std::string>& args) = 0;

  // Runs to completion capturing stdout; stdin and stderr are discarded.
  virtual ProcessResult capture(const std::string& program,
                                const std::vector<std::string>& args) = 0;
};

class BoostProcessRunner : public ProcessRunner {
 public:
  int run(const std::string& program, const std::vector<std::string>& args) override;
  ProcessResult capture(const std::string& program,
                        const std::vector<std::string>& args) override;
};

// Joins a command line for log output.
std::string format_command(const std::string& program, const std::vector<std::string>& args);

#endif // PROCESS_RUNNER_HPP
