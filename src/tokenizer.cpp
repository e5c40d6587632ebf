#include <cctype>
#include <climits>

#include <uniqint/tokenizer.h>

namespace UniqInt {

bool parse_int(const std::string& token, long long* value) {
    size_t pos = 0;
    bool negative = false;
    if (pos < token.size() && (token[pos] == '+' || token[pos] == '-')) {
        negative = token[pos] == '-';
        ++pos;
    }
    if (pos == token.size()) {
        return false;
    }

    // accumulate as a negative number, its range is the wider one
    long long acc = 0;
    bool saturated = false;
    for (; pos < token.size(); ++pos) {
        unsigned char c = token[pos];
        if (c < '0' || c > '9') {
            return false;
        }
        if (saturated) {
            continue;
        }

        int digit = c - '0';
        if (acc < (LLONG_MIN + digit) / 10) {
            saturated = true;
            continue;
        }
        acc = acc * 10 - digit;
    }

    if (saturated) {
        *value = negative ? LLONG_MIN : LLONG_MAX;
    } else if (negative) {
        *value = acc;
    } else {
        *value = acc == LLONG_MIN ? LLONG_MAX : -acc;
    }
    return true;
}

std::vector<std::string> split_tokens(const std::string& line) {
    std::vector<std::string> tokens;
    size_t i = 0;
    while (i < line.size()) {
        while (i < line.size() && isspace(static_cast<unsigned char>(line[i]))) {
            ++i;
        }
        size_t start = i;
        while (i < line.size() && !isspace(static_cast<unsigned char>(line[i]))) {
            ++i;
        }
        if (i > start) {
            tokens.push_back(line.substr(start, i - start));
        }
    }
    return tokens;
}

std::vector<int> handle_line(const std::string& line, const Range& range) {
    std::vector<int> accepted;
    long long value = 0;
    for (const auto& token : split_tokens(line)) {
        if (parse_int(token, &value) && range.contains(value)) {
            accepted.push_back(static_cast<int>(value));
        }
    }
    return accepted;
}

} // namespace UniqInt
