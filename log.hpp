#ifndef LOG_HPP
#define LOG_HPP

#include <string>

// Coloured status output. info/warning/success go to stdout, error to stderr.
void log_info(const std::string& message);
void log_warning(const std::string& message);
void log_success(const std::string& message);
void log_error(const std::string& message);

// Colour is on by default only when the stream is a terminal.
void set_log_color(bool enabled);

#endif // LOG_HPP
