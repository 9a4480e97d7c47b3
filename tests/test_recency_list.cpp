/**
 * Unit tests for the recency list
 */

#include "cache/recency_list.h"
#include <gtest/gtest.h>
#include <vector>

using namespace memoflow::cache;

using Order = std::vector<RecencyList::Handle>;

class RecencyListTest : public ::testing::Test {
protected:
    RecencyList list_;
};

TEST_F(RecencyListTest, StartsEmpty) {
    EXPECT_TRUE(list_.empty());
    EXPECT_EQ(list_.size(), 0u);
    EXPECT_FALSE(list_.least_recent().has_value());
    EXPECT_FALSE(list_.most_recent().has_value());
    EXPECT_TRUE(list_.snapshot().empty());
}

TEST_F(RecencyListTest, PromoteNewHandlesBecomesHead) {
    list_.promote(0);
    list_.promote(1);
    list_.promote(2);

    EXPECT_EQ(list_.size(), 3u);
    EXPECT_EQ(list_.snapshot(), (Order{2, 1, 0}));
    EXPECT_EQ(*list_.most_recent(), 2u);
    EXPECT_EQ(*list_.least_recent(), 0u);
}

TEST_F(RecencyListTest, PromoteExistingMovesToHead) {
    list_.promote(0);
    list_.promote(1);
    list_.promote(2);

    list_.promote(0);
    EXPECT_EQ(list_.snapshot(), (Order{0, 2, 1}));
    EXPECT_EQ(*list_.least_recent(), 1u);
    EXPECT_EQ(list_.size(), 3u);

    list_.promote(2);
    EXPECT_EQ(list_.snapshot(), (Order{2, 0, 1}));
}

TEST_F(RecencyListTest, PromoteHeadIsNoOp) {
    list_.promote(4);
    list_.promote(7);
    list_.promote(7);

    EXPECT_EQ(list_.snapshot(), (Order{7, 4}));
    EXPECT_EQ(list_.size(), 2u);
}

TEST_F(RecencyListTest, RemoveFromEveryPosition) {
    for (RecencyList::Handle h = 0; h < 5; ++h) {
        list_.promote(h);
    }

    list_.remove(2); // middle
    EXPECT_EQ(list_.snapshot(), (Order{4, 3, 1, 0}));

    list_.remove(4); // head
    EXPECT_EQ(list_.snapshot(), (Order{3, 1, 0}));
    EXPECT_EQ(*list_.most_recent(), 3u);

    list_.remove(0); // tail
    EXPECT_EQ(list_.snapshot(), (Order{3, 1}));
    EXPECT_EQ(*list_.least_recent(), 1u);

    list_.remove(3);
    list_.remove(1);
    EXPECT_TRUE(list_.empty());
    EXPECT_FALSE(list_.least_recent().has_value());
}

TEST_F(RecencyListTest, RemoveAbsentIsNoOp) {
    list_.promote(0);

    list_.remove(5);
    list_.remove(0);
    list_.remove(0);

    EXPECT_TRUE(list_.empty());
    EXPECT_FALSE(list_.contains(0));
}

TEST_F(RecencyListTest, RemovedHandleCanBeRelinked) {
    list_.promote(0);
    list_.promote(1);
    list_.remove(0);
    list_.promote(0);

    EXPECT_EQ(list_.snapshot(), (Order{0, 1}));
    EXPECT_TRUE(list_.contains(0));
}

TEST_F(RecencyListTest, SparseHandles) {
    list_.promote(100);
    list_.promote(3);

    EXPECT_TRUE(list_.contains(100));
    EXPECT_FALSE(list_.contains(50));
    EXPECT_EQ(list_.snapshot(), (Order{3, 100}));
}

TEST_F(RecencyListTest, ClearResetsEverything) {
    list_.promote(0);
    list_.promote(1);
    list_.clear();

    EXPECT_TRUE(list_.empty());
    EXPECT_FALSE(list_.contains(0));

    list_.promote(1);
    EXPECT_EQ(list_.snapshot(), (Order{1}));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
