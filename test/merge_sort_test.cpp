#include "gtest/gtest.h"
#include <algorithm>
#include <cstdlib>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include <uniqint/merge_sort.h>

using namespace std;

static vector<int> std_sorted(vector<int> v) {
    std::sort(v.begin(), v.end());
    return v;
}

TEST(MergeSortTest, Empty) {
    vector<int> v;
    UniqInt::merge_sort(v);
    ASSERT_TRUE(v.empty());
}

TEST(MergeSortTest, Single) {
    vector<int> v{7};
    UniqInt::merge_sort(v);
    ASSERT_EQ(vector<int>{7}, v);
}

TEST(MergeSortTest, AllEqual) {
    vector<int> v(17, 3);
    UniqInt::merge_sort(v);
    ASSERT_EQ(vector<int>(17, 3), v);
}

TEST(MergeSortTest, AlreadySorted) {
    vector<int> v{-1023, -5, 0, 1, 2, 1023};
    ASSERT_EQ(v, UniqInt::merge_sorted(v));
}

TEST(MergeSortTest, ReverseSorted) {
    vector<int> v{1023, 2, 1, 0, -5, -1023};
    vector<int> expected{-1023, -5, 0, 1, 2, 1023};
    ASSERT_EQ(expected, UniqInt::merge_sorted(v));
}

TEST(MergeSortTest, MatchesStdSort) {
    srand(12345);
    for (size_t n = 0; n < 200; n += 7) {
        vector<int> v;
        for (size_t i = 0; i < n; ++i) {
            v.push_back(rand() % 2047 - 1023);
        }
        ASSERT_EQ(std_sorted(v), UniqInt::merge_sorted(v)) << "n=" << n;
    }
}

TEST(MergeSortTest, FixedPoint) {
    vector<int> v{5, -10, 1023, -1023, 0};
    vector<int> once = UniqInt::merge_sorted(v);
    ASSERT_EQ(once, UniqInt::merge_sorted(once));
}

TEST(MergeSortTest, Descending) {
    vector<int> v{1, 3, 2};
    UniqInt::merge_sort(v, std::greater<int>());
    ASSERT_EQ((vector<int>{3, 2, 1}), v);
}

TEST(MergeSortTest, Stable) {
    typedef pair<int, int> Item;
    vector<Item> v{{2, 0}, {1, 1}, {2, 2}, {1, 3}, {2, 4}, {0, 5}, {1, 6}};
    UniqInt::merge_sort(v, [](const Item& a, const Item& b) { return a.first < b.first; });

    vector<Item> expected{{0, 5}, {1, 1}, {1, 3}, {1, 6}, {2, 0}, {2, 2}, {2, 4}};
    ASSERT_EQ(expected, v);
}

TEST(MergeSortTest, Strings) {
    vector<string> v{"b.txt", "a.txt", "c.txt", "a.txt"};
    vector<string> expected{"a.txt", "a.txt", "b.txt", "c.txt"};
    ASSERT_EQ(expected, UniqInt::merge_sorted(v));
}
