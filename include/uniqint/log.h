#ifndef UNIQINT_LOG_H_INCLUDED
#define UNIQINT_LOG_H_INCLUDED

#include <string>

namespace UniqInt {

enum class LogLevel {
    Debug = 0,
    Info,
    Warn,
    Error
};

void set_log_level(LogLevel level);

/**
 * Printf-style logging with a timestamp prefix. Debug and info go to stdout,
 * warn and error go to stderr. Messages below the current level are dropped.
 */
void log_debug(const char* format, ...) __attribute__((format(printf, 1, 2)));
void log_info(const char* format, ...) __attribute__((format(printf, 1, 2)));
void log_warn(const char* format, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* format, ...) __attribute__((format(printf, 1, 2)));

std::string time_string();

} // namespace UniqInt

#endif // UNIQINT_LOG_H_INCLUDED
