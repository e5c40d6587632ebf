#ifndef UNIQINT_PIPELINE_H_INCLUDED
#define UNIQINT_PIPELINE_H_INCLUDED

#include "config.h"
#include "dedup.h"
#include "file.h"

#include <string>
#include <vector>

namespace UniqInt {

struct FileReport {
    std::string input_path;
    std::string result_path;

    size_t lines = 0;
    size_t tokens = 0;
    size_t accepted = 0;
    size_t unique = 0;
};

/**
 * output_path with suffix appended
 */
std::string result_path(const std::string& output_path, const std::string& suffix);

/**
 * Reads in to the end and collects its accepted values
 */
UniqueSet collect_unique(File& in, const Range& range, FileReport* report = nullptr);

/**
 * Unique accepted values of in, ascending
 */
std::vector<int> sorted_unique(File& in, const Range& range, FileReport* report = nullptr);

/**
 * Runs the whole pipeline for one file: reads input_path, writes the sorted
 * unique values to result_path(output_path, config.suffix).
 *
 * A missing input file is reported and nothing is written.
 *
 * @return false if input_path does not exist
 * @throws Error of type Io if input_path cannot be read or the result cannot
 * be written
 */
bool process_file(const std::string& input_path,
                  const std::string& output_path,
                  const Config& config,
                  FileReport* report = nullptr);

} // namespace UniqInt

#endif // UNIQINT_PIPELINE_H_INCLUDED
