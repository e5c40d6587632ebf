#include <climits>
#include <cstdlib>
#include <iostream>
#include <unistd.h>

#include <boost/program_options.hpp>

#include <uniqint/config.h>
#include <uniqint/error.h>
#include <uniqint/file.h>

namespace po = boost::program_options;

namespace UniqInt {

std::string executable_dir(const char* argv0) {
    char buf[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    std::string exe;
    if (len > 0) {
        exe.assign(buf, len);
    } else if (argv0 != nullptr && realpath(argv0, buf) != nullptr) {
        exe = buf;
    } else {
        return ".";
    }

    size_t slash = exe.find_last_of('/');
    if (slash == std::string::npos) {
        return ".";
    }
    return slash == 0 ? "/" : exe.substr(0, slash);
}

void validate_config(const Config& config) {
    if (config.range.min > config.range.max) {
        throw Error(ErrorType::Config,
                    "--min (" + std::to_string(config.range.min) + ") is greater than --max (" +
                        std::to_string(config.range.max) + ")");
    }
    if (config.suffix.empty()) {
        throw Error(ErrorType::Config, "--suffix must not be empty");
    }
    if (config.extension.empty()) {
        throw Error(ErrorType::Config, "--extension must not be empty");
    }
    if (config.input_dir.empty() || config.output_dir.empty()) {
        throw Error(ErrorType::Config, "input and output directories must not be empty");
    }
}

bool parse_config(int argc, const char* const argv[], Config& config) {
    std::string input_dir;
    std::string output_dir;

    po::options_description desc("uniqint usage");
    desc.add_options()
        ("help,h", "produce help message")
        ("input-dir,i", po::value<std::string>(&input_dir), "directory with the input .txt files")
        ("output-dir,o", po::value<std::string>(&output_dir), "directory for the result files")
        ("min", po::value<int>(&config.range.min)->default_value(DEFAULT_MIN_VALUE), "smallest accepted value, negative values as --min=-N")
        ("max", po::value<int>(&config.range.max)->default_value(DEFAULT_MAX_VALUE), "largest accepted value")
        ("suffix", po::value<std::string>(&config.suffix)->default_value(DEFAULT_SUFFIX), "appended to the input file name to name the result")
        ("extension", po::value<std::string>(&config.extension)->default_value(DEFAULT_EXTENSION), "only files ending with it are processed")
        ("strict", po::bool_switch(&config.strict), "exit with failure if any file was skipped or failed")
        ("verbose,v", "log per file statistics")
        ("quiet,q", "log warnings and errors only")
        ;

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        if (vm.count("help")) {
            std::cout << desc << "\n";
            return false;
        }
        po::notify(vm);
    } catch (const po::error& e) {
        throw Error(ErrorType::Config, e.what());
    }

    if (vm.count("verbose") && vm.count("quiet")) {
        throw Error(ErrorType::Config, "--verbose and --quiet are mutually exclusive");
    }
    if (vm.count("verbose")) {
        config.log_level = LogLevel::Debug;
    } else if (vm.count("quiet")) {
        config.log_level = LogLevel::Warn;
    }

    std::string base = executable_dir(argc > 0 ? argv[0] : nullptr);
    config.input_dir = vm.count("input-dir") ? input_dir : join_path(base, DEFAULT_INPUT_DIR);
    config.output_dir = vm.count("output-dir") ? output_dir : join_path(base, DEFAULT_OUTPUT_DIR);

    validate_config(config);
    return true;
}

} // namespace UniqInt
