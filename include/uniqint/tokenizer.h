#ifndef UNIQINT_TOKENIZER_H_INCLUDED
#define UNIQINT_TOKENIZER_H_INCLUDED

#include "config.h"

#include <string>
#include <vector>

namespace UniqInt {

/**
 * Parses a base-10 integer literal: an optional single '+' or '-' followed by
 * one or more ASCII digits, nothing else. Literals beyond the range of
 * long long saturate to LLONG_MIN / LLONG_MAX instead of failing, so they
 * are still rejected by any Range.
 *
 * @return false if token is not an integer literal, value is untouched then
 */
bool parse_int(const std::string& token, long long* value);

/**
 * Splits line on whitespace
 */
std::vector<std::string> split_tokens(const std::string& line);

/**
 * Integer tokens of line that fall into range, in order of appearance
 */
std::vector<int> handle_line(const std::string& line, const Range& range);

} // namespace UniqInt

#endif // UNIQINT_TOKENIZER_H_INCLUDED
