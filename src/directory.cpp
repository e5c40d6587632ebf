#include <uniqint/directory.h>
#include <uniqint/error.h>
#include <uniqint/file.h>
#include <uniqint/log.h>
#include <uniqint/merge_sort.h>

namespace UniqInt {

std::vector<std::string> eligible_files(const std::string& dir,
                                        const std::string& extension,
                                        size_t* ignored) {
    std::vector<std::string> names;
    size_t skipped = 0;
    for (const auto& name : list_dir(dir)) {
        std::string path = join_path(dir, name);
        // entries gone since listing are kept, process_file reports them
        if (ends_with(name, extension) && (is_regular_file(path) || !file_exists(path))) {
            names.push_back(name);
        } else {
            ++skipped;
        }
    }

    if (ignored != nullptr) {
        *ignored = skipped;
    }
    merge_sort(names);
    return names;
}

DirectoryReport process_directory(const Config& config) {
    if (!is_directory(config.input_dir)) {
        throw Error(ErrorType::InputDirectoryMissing,
                    "The input directory '" + config.input_dir + "' does not exist.");
    }
    make_dirs(config.output_dir);

    DirectoryReport report;
    for (const auto& name : eligible_files(config.input_dir, config.extension, &report.ignored)) {
        FileReport file_report;
        try {
            if (process_file(join_path(config.input_dir, name),
                             join_path(config.output_dir, name),
                             config,
                             &file_report)) {
                ++report.processed;
            } else {
                ++report.skipped;
            }
        } catch (const Error& e) {
            log_error("Failed to process '%s': %s", file_report.input_path.c_str(), e.what());
            ++report.failed;
        }
        report.files.push_back(file_report);
    }

    log_info("%zu processed, %zu skipped, %zu failed, %zu ignored",
             report.processed, report.skipped, report.failed, report.ignored);
    return report;
}

} // namespace UniqInt
