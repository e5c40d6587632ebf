#include "gtest/gtest.h"
#include <vector>

#include <uniqint/dedup.h>
#include <uniqint/merge_sort.h>

using namespace std;

TEST(DedupTest, Accumulate) {
    UniqInt::UniqueSet set;
    ASSERT_EQ(1u, UniqInt::accumulate(set, {3, 3, 3}));
    ASSERT_EQ(0u, UniqInt::accumulate(set, {3}));
    ASSERT_EQ(2u, UniqInt::accumulate(set, {-1, 3, 4}));
    ASSERT_EQ(3u, set.size());
}

TEST(DedupTest, Idempotent) {
    UniqInt::UniqueSet set;
    UniqInt::accumulate(set, {1, 2});
    UniqInt::UniqueSet copy = set;
    UniqInt::accumulate(set, {2, 1});
    ASSERT_EQ(copy, set);
}

TEST(DedupTest, ToVector) {
    UniqInt::UniqueSet set;
    UniqInt::accumulate(set, {5, -10, 5, 0});
    ASSERT_EQ((vector<int>{-10, 0, 5}), UniqInt::merge_sorted(UniqInt::to_vector(set)));
    ASSERT_TRUE(UniqInt::to_vector(UniqInt::UniqueSet()).empty());
}
