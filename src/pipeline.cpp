#include <uniqint/error.h>
#include <uniqint/log.h>
#include <uniqint/merge_sort.h>
#include <uniqint/pipeline.h>
#include <uniqint/tokenizer.h>

namespace UniqInt {

std::string result_path(const std::string& output_path, const std::string& suffix) {
    return output_path + suffix;
}

UniqueSet collect_unique(File& in, const Range& range, FileReport* report) {
    UniqueSet unique;
    std::string line;
    while (in.read_line(line)) {
        std::vector<int> accepted = handle_line(line, range);
        UniqInt::accumulate(unique, accepted);

        if (report != nullptr) {
            report->lines++;
            report->tokens += split_tokens(line).size();
            report->accepted += accepted.size();
        }
    }

    if (report != nullptr) {
        report->unique = unique.size();
    }
    return unique;
}

std::vector<int> sorted_unique(File& in, const Range& range, FileReport* report) {
    std::vector<int> values = to_vector(collect_unique(in, range, report));
    merge_sort(values);
    return values;
}

bool process_file(const std::string& input_path,
                  const std::string& output_path,
                  const Config& config,
                  FileReport* report) {
    FileReport local;
    if (report == nullptr) {
        report = &local;
    }
    report->input_path = input_path;
    report->result_path = result_path(output_path, config.suffix);

    if (!file_exists(input_path)) {
        log_warn("Input file '%s' does not exist.", input_path.c_str());
        return false;
    }

    std::vector<int> values;
    {
        File in(input_path, "r");
        values = sorted_unique(in, config.range, report);
    }

    File out(report->result_path, "w");
    out.write_lines(values);
    out.close();

    log_info("Processed: %s -> %s", input_path.c_str(), report->result_path.c_str());
    log_debug("%zu lines, %zu tokens, %zu accepted, %zu unique",
              report->lines, report->tokens, report->accepted, report->unique);
    return true;
}

} // namespace UniqInt
