#include <gtest/gtest.h>
#include "menukit/host/element_tree.hpp"
#include <limits>

namespace openflow::menukit::host::test {

class ElementTreeTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = tree.create_element(INVALID_ELEMENT, "document").value();
        ASSERT_TRUE(tree.set_bounds(root, Rect{0, 0, 800, 600}).has_value());

        button = tree.create_element(root, "button").value();
        ASSERT_TRUE(tree.set_bounds(button, Rect{10, 10, 100, 30}).has_value());

        popup = tree.create_element(root, "popup").value();
        ASSERT_TRUE(tree.set_bounds(popup, Rect{50, 20, 200, 120}).has_value());

        row = tree.create_element(popup, "row").value();
        ASSERT_TRUE(tree.set_bounds(row, Rect{54, 24, 192, 28}).has_value());
    }

    ElementTree tree;
    ElementId root = INVALID_ELEMENT;
    ElementId button = INVALID_ELEMENT;
    ElementId popup = INVALID_ELEMENT;
    ElementId row = INVALID_ELEMENT;
};

TEST_F(ElementTreeTest, StructureQueries) {
    EXPECT_EQ(tree.size(), 4u);
    EXPECT_EQ(tree.parent(row), popup);
    EXPECT_EQ(tree.parent(root), INVALID_ELEMENT);
    EXPECT_EQ(tree.name(button), "button");

    auto kids = tree.children(root);
    ASSERT_EQ(kids.size(), 2u);
    EXPECT_EQ(kids[0], button);
    EXPECT_EQ(kids[1], popup);
}

TEST_F(ElementTreeTest, CreateUnderUnknownParentFails) {
    auto result = tree.create_element(9999, "orphan");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::ELEMENT_NOT_FOUND);
}

TEST_F(ElementTreeTest, ContainsIsInclusive) {
    EXPECT_TRUE(tree.contains(popup, popup));
    EXPECT_TRUE(tree.contains(popup, row));
    EXPECT_TRUE(tree.contains(root, row));
    EXPECT_FALSE(tree.contains(popup, button));
    EXPECT_FALSE(tree.contains(row, popup));
    EXPECT_FALSE(tree.contains(popup, INVALID_ELEMENT));
}

TEST_F(ElementTreeTest, HitTestPrefersDeepestAndTopmost) {
    EXPECT_EQ(tree.hit_test(60, 30), row);
    EXPECT_EQ(tree.hit_test(60, 100), popup);
    // Button and popup overlap; the later sibling wins
    EXPECT_EQ(tree.hit_test(55, 21), popup);
    EXPECT_EQ(tree.hit_test(20, 20), button);
    EXPECT_EQ(tree.hit_test(700, 500), root);
    EXPECT_EQ(tree.hit_test(900, 900), INVALID_ELEMENT);
}

TEST_F(ElementTreeTest, InvalidBoundsRejected) {
    const double nan = std::numeric_limits<double>::quiet_NaN();

    auto negative = tree.set_bounds(button, Rect{0, 0, -1, 10});
    ASSERT_FALSE(negative.has_value());
    EXPECT_EQ(negative.error().code(), ErrorCode::ELEMENT_INVALID_BOUNDS);

    auto not_finite = tree.set_bounds(button, Rect{nan, 0, 10, 10});
    ASSERT_FALSE(not_finite.has_value());

    auto missing = tree.set_bounds(4242, Rect{0, 0, 1, 1});
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code(), ErrorCode::ELEMENT_NOT_FOUND);

    ASSERT_TRUE(tree.bounds(button).has_value());
    EXPECT_DOUBLE_EQ(tree.bounds(button)->width, 100.0);
}

TEST_F(ElementTreeTest, FocusTracksConnectedElements) {
    EXPECT_EQ(tree.active_element(), INVALID_ELEMENT);

    EXPECT_TRUE(tree.focus(button));
    EXPECT_EQ(tree.active_element(), button);

    EXPECT_FALSE(tree.focus(12345));
    EXPECT_EQ(tree.active_element(), button);

    tree.blur();
    EXPECT_EQ(tree.active_element(), INVALID_ELEMENT);
}

TEST_F(ElementTreeTest, RemoveElementDropsSubtreeAndFocus) {
    ASSERT_TRUE(tree.focus(row));

    ASSERT_TRUE(tree.remove_element(popup).has_value());

    EXPECT_FALSE(tree.is_connected(popup));
    EXPECT_FALSE(tree.is_connected(row));
    EXPECT_EQ(tree.active_element(), INVALID_ELEMENT);
    EXPECT_EQ(tree.size(), 2u);
    EXPECT_EQ(tree.children(root).size(), 1u);

    auto again = tree.remove_element(popup);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code(), ErrorCode::ELEMENT_NOT_FOUND);
}

TEST_F(ElementTreeTest, RemovingUnrelatedElementKeepsFocus) {
    ASSERT_TRUE(tree.focus(button));
    ASSERT_TRUE(tree.remove_element(popup).has_value());

    EXPECT_EQ(tree.active_element(), button);
}

}  // namespace openflow::menukit::host::test
