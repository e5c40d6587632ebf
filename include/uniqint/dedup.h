#ifndef UNIQINT_DEDUP_H_INCLUDED
#define UNIQINT_DEDUP_H_INCLUDED

#include <cstddef>
#include <unordered_set>
#include <vector>

namespace UniqInt {

typedef std::unordered_set<int> UniqueSet;

/**
 * Adds values to set, returns how many of them were new
 */
size_t accumulate(UniqueSet& set, const std::vector<int>& values);

/**
 * Contents of set in unspecified order
 */
std::vector<int> to_vector(const UniqueSet& set);

} // namespace UniqInt

#endif // UNIQINT_DEDUP_H_INCLUDED
