#include <uniqint/config.h>
#include <uniqint/directory.h>
#include <uniqint/error.h>
#include <uniqint/log.h>

enum {
    EXIT_OK = 0,
    EXIT_FAILED = 1,
    EXIT_USAGE = 2
};

int main(int argc, char* argv[]) {
    UniqInt::Config config;
    try {
        if (!UniqInt::parse_config(argc, argv, config)) {
            return EXIT_OK;
        }
    } catch (const UniqInt::Error& e) {
        UniqInt::log_error("%s (see --help)", e.what());
        return EXIT_USAGE;
    }
    UniqInt::set_log_level(config.log_level);

    UniqInt::log_info("Input Directory: %s", config.input_dir.c_str());
    UniqInt::log_info("Output Directory: %s", config.output_dir.c_str());

    try {
        UniqInt::DirectoryReport report = UniqInt::process_directory(config);
        if (config.strict && !report.clean()) {
            return EXIT_FAILED;
        }
    } catch (const UniqInt::Error& e) {
        UniqInt::log_error("Error: %s", e.what());
        return EXIT_FAILED;
    }
    return EXIT_OK;
}
