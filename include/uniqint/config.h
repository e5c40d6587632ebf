#ifndef UNIQINT_CONFIG_H_INCLUDED
#define UNIQINT_CONFIG_H_INCLUDED

#include "log.h"

#include <string>

namespace UniqInt {

constexpr int DEFAULT_MIN_VALUE = -1023;
constexpr int DEFAULT_MAX_VALUE = 1023;

constexpr const char* DEFAULT_SUFFIX = "_results.txt";
constexpr const char* DEFAULT_EXTENSION = ".txt";

// relative to the directory holding the executable
constexpr const char* DEFAULT_INPUT_DIR = "../../sample_inputs";
constexpr const char* DEFAULT_OUTPUT_DIR = "../../sample_results";

/**
 * Closed interval of accepted values
 */
struct Range {
    int min;
    int max;

    bool contains(long long value) const {
        return value >= min && value <= max;
    }
};

struct Config {
    std::string input_dir;
    std::string output_dir;

    Range range = Range{DEFAULT_MIN_VALUE, DEFAULT_MAX_VALUE};
    std::string suffix = DEFAULT_SUFFIX;
    std::string extension = DEFAULT_EXTENSION;

    // exit non-zero when any file was skipped or failed
    bool strict = false;
    LogLevel log_level = LogLevel::Info;
};

/**
 * Fills config from the command line. Returns false when the caller should
 * exit without processing (help was requested and printed).
 *
 * @throws Error of type Config on unknown options, malformed values, or an
 * inconsistent configuration
 */
bool parse_config(int argc, const char* const argv[], Config& config);

/**
 * Checks a config built by hand or by parse_config
 *
 * @throws Error of type Config
 */
void validate_config(const Config& config);

/**
 * Directory containing the running executable, or "." if it cannot be
 * determined
 */
std::string executable_dir(const char* argv0);

} // namespace UniqInt

#endif // UNIQINT_CONFIG_H_INCLUDED
