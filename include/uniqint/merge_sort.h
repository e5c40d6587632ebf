#ifndef UNIQINT_MERGE_SORT_H_INCLUDED
#define UNIQINT_MERGE_SORT_H_INCLUDED

#include <algorithm>
#include <cstddef>
#include <functional>
#include <vector>

namespace UniqInt {

namespace detail {

/**
 * Merges sorted [first, middle) and [middle, last) through buf, which must
 * hold at least last - first elements. Stable: on ties the left run wins.
 */
template <typename T, class LESS>
void merge(T* first, T* middle, T* last, T* buf, LESS& cmp) {
    T* left = first;
    T* right = middle;
    T* out = buf;

    while (left != middle && right != last) {
        if (cmp(*right, *left)) {
            *out++ = *right++;
        } else {
            *out++ = *left++;
        }
    }
    out = std::copy(left, middle, out);
    out = std::copy(right, last, out);

    std::copy(buf, out, first);
}

template <typename T, class LESS>
void merge_sort(T* first, T* last, T* buf, LESS& cmp) {
    size_t len = last - first;
    if (len < 2) {
        return;
    }

    size_t half = len / 2;
    detail::merge_sort(first, first + half, buf, cmp);
    detail::merge_sort(first + half, last, buf + half, cmp);
    detail::merge(first, first + half, last, buf, cmp);
}

} // namespace detail

/**
 * Recursive top-down merge sort. A single scratch buffer of data.size()
 * elements is shared by all merge levels.
 */
template <typename T, class LESS = std::less<T>>
void merge_sort(std::vector<T>& data, LESS cmp = LESS()) {
    if (data.size() < 2) {
        return;
    }

    std::vector<T> buf(data.size());
    detail::merge_sort(data.data(), data.data() + data.size(), buf.data(), cmp);
}

template <typename T, class LESS = std::less<T>>
std::vector<T> merge_sorted(std::vector<T> data, LESS cmp = LESS()) {
    UniqInt::merge_sort(data, cmp);
    return data;
}

} // namespace UniqInt

#endif // UNIQINT_MERGE_SORT_H_INCLUDED
