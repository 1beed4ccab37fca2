#include "log.hpp"

#include <iostream>
#include <unistd.h>     // For isatty()

namespace {

const char* const kRed     = "\033[0;31m";
const char* const kGreen   = "\033[0;32m";
const char* const kYellow  = "\033[1;33m";
const char* const kBlue    = "\033[0;34m";
const char* const kNeutral = "\033[0m";

// -1 = decide per stream, 0 = never, 1 = always
int colorMode = -1;

bool use_color(int fd) {
  if (colorMode >= 0) {
    return colorMode == 1;
  }
  return isatty(fd) != 0;
}

void print(std::ostream& out, int fd, const char* color, const std::string& message) {
  if (use_color(fd)) {
    out << color << message << kNeutral << std::endl;
  } else {
    out << message << std::endl;
  }
}

}  // namespace

void log_info(const std::string& message) {
  print(std::cout, STDOUT_FILENO, kBlue, message);
}

void log_warning(const std::string& message) {
  print(std::cout, STDOUT_FILENO, kYellow, message);
}

void log_success(const std::string& message) {
  print(std::cout, STDOUT_FILENO, kGreen, message);
}

void log_error(const std::string& message) {
  print(std::cerr, STDERR_FILENO, kRed, message);
}

void set_log_color(bool enabled) {
  colorMode = enabled ? 1 : 0;
}
