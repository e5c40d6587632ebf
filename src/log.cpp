#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <sys/time.h>
#include <vector>

#include <uniqint/log.h>

namespace UniqInt {

namespace {

LogLevel threshold = LogLevel::Info;

const char* level_tag(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:
        return "DBG";
    case LogLevel::Info:
        return "INF";
    case LogLevel::Warn:
        return "WRN";
    case LogLevel::Error:
        return "ERR";
    }
    return "???";
}

void vlog(LogLevel level, const char* format, va_list args) {
    if (level < threshold) {
        return;
    }

    va_list copy;
    va_copy(copy, args);
    std::vector<char> buf(256);
    int n = vsnprintf(buf.data(), buf.size(), format, args);
    if (n >= 0 && static_cast<size_t>(n) >= buf.size()) {
        buf.resize(n + 1);
        vsnprintf(buf.data(), buf.size(), format, copy);
    }
    va_end(copy);

    FILE* out = level >= LogLevel::Warn ? stderr : stdout;
    fprintf(out, "%s %s: %s\n", time_string().c_str(), level_tag(level), n < 0 ? format : buf.data());
    fflush(out);
}

} // namespace

void set_log_level(LogLevel level) {
    threshold = level;
}

std::string time_string() {
    struct timeval tv;
    gettimeofday(&tv, nullptr);
    struct tm nowtm;
    localtime_r(&tv.tv_sec, &nowtm);

    char tmbuf[32];
    char buf[64];
    strftime(tmbuf, sizeof tmbuf, "%H:%M:%S", &nowtm);
    snprintf(buf, sizeof buf, "%s.%03ld", tmbuf, static_cast<long>(tv.tv_usec / 1000));
    return std::string(buf);
}

void log_debug(const char* format, ...) {
    va_list args;
    va_start(args, format);
    vlog(LogLevel::Debug, format, args);
    va_end(args);
}

void log_info(const char* format, ...) {
    va_list args;
    va_start(args, format);
    vlog(LogLevel::Info, format, args);
    va_end(args);
}

void log_warn(const char* format, ...) {
    va_list args;
    va_start(args, format);
    vlog(LogLevel::Warn, format, args);
    va_end(args);
}

void log_error(const char* format, ...) {
    va_list args;
    va_start(args, format);
    vlog(LogLevel::Error, format, args);
    va_end(args);
}

} // namespace UniqInt
