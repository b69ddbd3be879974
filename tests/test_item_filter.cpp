#include <gtest/gtest.h>
#include "menukit/core/item_filter.hpp"
#include "menukit/core/menu_item.hpp"
#include "menukit/core/roving_focus.hpp"

namespace openflow::menukit::core::test {

class ItemFilterTest : public ::testing::Test {
protected:
    void SetUp() override {
        items = {
            MenuItem::action("a", "Alpha", nullptr),
            MenuItem::divider("b"),
            MenuItem::action("c", "Charlie", nullptr),
            MenuItem::disabled("d", "Delta"),
        };
    }

    std::vector<MenuItem> items;
};

TEST_F(ItemFilterTest, DropsDividersAndDisabledItems) {
    auto eligible = filter_eligible(items);

    ASSERT_EQ(eligible.size(), 2u);
    EXPECT_EQ(eligible[0].id, "a");
    EXPECT_EQ(eligible[1].id, "c");
}

TEST_F(ItemFilterTest, EmptyAndAllIneligibleLists) {
    EXPECT_TRUE(filter_eligible({}).empty());

    std::vector<MenuItem> structural = {MenuItem::divider("x"), MenuItem::disabled("y", "Y")};
    EXPECT_TRUE(filter_eligible(structural).empty());
    EXPECT_TRUE(EligibleItems(structural).empty());
}

TEST_F(ItemFilterTest, IndexMappingBetweenRawAndEligible) {
    EligibleItems eligible(items);

    ASSERT_EQ(eligible.size(), 2u);
    EXPECT_EQ(eligible.raw_index(0), 0u);
    EXPECT_EQ(eligible.raw_index(1), 2u);
    EXPECT_FALSE(eligible.raw_index(2).has_value());
    EXPECT_FALSE(eligible.raw_index(NO_HIGHLIGHT).has_value());

    EXPECT_EQ(eligible.eligible_index_of_raw(0), 0);
    EXPECT_EQ(eligible.eligible_index_of_raw(1), NO_HIGHLIGHT);
    EXPECT_EQ(eligible.eligible_index_of_raw(2), 1);
    EXPECT_EQ(eligible.eligible_index_of_raw(3), NO_HIGHLIGHT);
    EXPECT_EQ(eligible.eligible_index_of_raw(99), NO_HIGHLIGHT);

    EXPECT_EQ(eligible.eligible_index_of("c"), 1);
    EXPECT_EQ(eligible.eligible_index_of("d"), NO_HIGHLIGHT);
    EXPECT_EQ(eligible.eligible_index_of("missing"), NO_HIGHLIGHT);
}

TEST_F(ItemFilterTest, NextWalksEligibleSubsetAndWraps) {
    EligibleItems eligible(items);
    RovingFocus focus(eligible.size());

    ASSERT_TRUE(focus.next());
    EXPECT_EQ(items[*eligible.raw_index(focus.highlighted())].id, "a");

    ASSERT_TRUE(focus.next());
    EXPECT_EQ(items[*eligible.raw_index(focus.highlighted())].id, "c");

    ASSERT_TRUE(focus.next());
    EXPECT_EQ(items[*eligible.raw_index(focus.highlighted())].id, "a");
}

TEST_F(ItemFilterTest, ItemFactoriesAndKinds) {
    auto item = MenuItem::action("delete", "Delete", nullptr).with_shortcut("Del").as_destructive();

    EXPECT_TRUE(item.is_eligible());
    EXPECT_TRUE(item.destructive);
    EXPECT_EQ(item.shortcut, "Del");

    EXPECT_TRUE(items[1].is_divider());
    EXPECT_TRUE(items[3].is_disabled());
    EXPECT_STREQ(item_kind_to_string(ItemKind::Divider), "divider");
    EXPECT_STREQ(item_kind_to_string(ItemKind::Disabled), "disabled");
}

}  // namespace openflow::menukit::core::test
