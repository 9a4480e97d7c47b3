/**
 * Unit tests for the fingerprint-keyed entry table
 */

#include "cache/entry_table.h"
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

using namespace memoflow::cache;

struct Payload {
    int value = 0;
};

class EntryTableTest : public ::testing::Test {
protected:
    EntryTable<Payload> table_;
};

TEST_F(EntryTableTest, InsertAndFind) {
    auto id = table_.insert("alpha", Payload{1});

    ASSERT_TRUE(table_.find("alpha").has_value());
    EXPECT_EQ(*table_.find("alpha"), id);
    EXPECT_TRUE(table_.contains("alpha"));
    EXPECT_EQ(table_.at(id).value, 1);
    EXPECT_EQ(table_.fingerprint_of(id), "alpha");
    EXPECT_EQ(table_.size(), 1u);

    EXPECT_FALSE(table_.find("beta").has_value());
}

TEST_F(EntryTableTest, DuplicateInsertThrows) {
    table_.insert("alpha", Payload{1});
    EXPECT_THROW(table_.insert("alpha", Payload{2}), std::logic_error);
    EXPECT_EQ(table_.size(), 1u);
}

TEST_F(EntryTableTest, EraseReturnsFreedSlot) {
    auto id = table_.insert("alpha", Payload{1});

    auto erased = table_.erase("alpha");
    ASSERT_TRUE(erased.has_value());
    EXPECT_EQ(*erased, id);
    EXPECT_FALSE(table_.is_live(id));
    EXPECT_TRUE(table_.empty());
    EXPECT_THROW(table_.at(id), std::out_of_range);

    EXPECT_FALSE(table_.erase("alpha").has_value());
}

TEST_F(EntryTableTest, FreedSlotsAreReused) {
    auto a = table_.insert("a", Payload{1});
    auto b = table_.insert("b", Payload{2});
    table_.erase("a");

    auto c = table_.insert("c", Payload{3});
    EXPECT_EQ(c, a);
    EXPECT_NE(c, b);
    EXPECT_EQ(table_.fingerprint_of(c), "c");
    EXPECT_EQ(table_.at(c).value, 3);
}

TEST_F(EntryTableTest, EntriesAreMutable) {
    auto id = table_.insert("a", Payload{1});
    table_.at(id).value = 10;
    EXPECT_EQ(table_.at(*table_.find("a")).value, 10);
}

TEST_F(EntryTableTest, ForEachVisitsLiveSlots) {
    table_.insert("a", Payload{1});
    table_.insert("b", Payload{2});
    table_.insert("c", Payload{3});
    table_.erase("b");

    std::vector<std::string> seen;
    int total = 0;
    table_.for_each([&](std::size_t, const std::string& fp, const Payload& p) {
        seen.push_back(fp);
        total += p.value;
    });

    EXPECT_EQ(seen, (std::vector<std::string>{"a", "c"}));
    EXPECT_EQ(total, 4);
}

TEST_F(EntryTableTest, ClearDropsEverything) {
    auto id = table_.insert("a", Payload{1});
    table_.clear();

    EXPECT_TRUE(table_.empty());
    EXPECT_FALSE(table_.is_live(id));
    EXPECT_FALSE(table_.contains("a"));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
