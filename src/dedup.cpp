#include <uniqint/dedup.h>

namespace UniqInt {

size_t accumulate(UniqueSet& set, const std::vector<int>& values) {
    size_t added = 0;
    for (int value : values) {
        added += set.insert(value).second;
    }
    return added;
}

std::vector<int> to_vector(const UniqueSet& set) {
    return std::vector<int>(set.begin(), set.end());
}

} // namespace UniqInt
