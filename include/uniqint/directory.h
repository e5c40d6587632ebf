#ifndef UNIQINT_DIRECTORY_H_INCLUDED
#define UNIQINT_DIRECTORY_H_INCLUDED

#include "config.h"
#include "pipeline.h"

#include <string>
#include <vector>

namespace UniqInt {

struct DirectoryReport {
    size_t processed = 0;
    // eligible but missing at processing time
    size_t skipped = 0;
    size_t failed = 0;
    // entries not matching the extension or not regular files
    size_t ignored = 0;

    std::vector<FileReport> files;

    bool clean() const {
        return skipped == 0 && failed == 0;
    }
};

/**
 * Names of entries in dir ending with extension, ascending. Directories and
 * other existing non-regular entries are left out; names that no longer
 * resolve (removed since listing, dangling links) are kept so the caller can
 * report them as missing.
 */
std::vector<std::string> eligible_files(const std::string& dir,
                                        const std::string& extension,
                                        size_t* ignored = nullptr);

/**
 * Runs process_file on every eligible file of config.input_dir, one after
 * another. Results go to config.output_dir, which is created if needed. A
 * failing file is logged and counted, the remaining files are still processed.
 *
 * @throws Error of type InputDirectoryMissing before anything is written if
 * config.input_dir is not an existing directory
 * @throws Error of type Io if config.output_dir cannot be created
 */
DirectoryReport process_directory(const Config& config);

} // namespace UniqInt

#endif // UNIQINT_DIRECTORY_H_INCLUDED
