#include <gtest/gtest.h>
#include "menukit/core/anchor_positioner.hpp"
#include <limits>

namespace openflow::menukit::core::test {

TEST(AnchorPositionerTest, NumericXWithStartY) {
    AnchorPosition anchor{100.0, Edge::Start};

    PopupBox box = resolve_anchor(anchor);

    ASSERT_TRUE(box.left.has_value());
    EXPECT_DOUBLE_EQ(*box.left, 100.0);
    ASSERT_TRUE(box.top.has_value());
    EXPECT_DOUBLE_EQ(*box.top, 0.0);
    EXPECT_FALSE(box.right.has_value());
    EXPECT_FALSE(box.bottom.has_value());
    EXPECT_EQ(box.to_string(), "{left:100, top:0}");
}

TEST(AnchorPositionerTest, NumericBothAxes) {
    PopupBox box = resolve_anchor(AnchorPosition::at(12.5, 340.0));

    PopupBox expected;
    expected.left = 12.5;
    expected.top = 340.0;
    EXPECT_EQ(box, expected);
}

TEST(AnchorPositionerTest, EndKeywordsPinFarEdges) {
    PopupBox box = resolve_anchor(AnchorPosition{Edge::End, Edge::End});

    EXPECT_FALSE(box.left.has_value());
    EXPECT_FALSE(box.top.has_value());
    ASSERT_TRUE(box.right.has_value());
    ASSERT_TRUE(box.bottom.has_value());
    EXPECT_DOUBLE_EQ(*box.right, 0.0);
    EXPECT_DOUBLE_EQ(*box.bottom, 0.0);
}

TEST(AnchorPositionerTest, DefaultAnchorIsOrigin) {
    PopupBox box = resolve_anchor(AnchorPosition{});

    EXPECT_EQ(box.to_string(), "{left:0, top:0}");
}

TEST(AnchorPositionerTest, NonFiniteCoordinatesFallBackToStart) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();

    PopupBox box = resolve_anchor(AnchorPosition::at(nan, -inf));

    ASSERT_TRUE(box.left.has_value());
    ASSERT_TRUE(box.top.has_value());
    EXPECT_DOUBLE_EQ(*box.left, 0.0);
    EXPECT_DOUBLE_EQ(*box.top, 0.0);
}

TEST(AnchorPositionerTest, NoViewportClamping) {
    PopupBox box = resolve_anchor(AnchorPosition::at(5000.0, -20.0));

    EXPECT_DOUBLE_EQ(*box.left, 5000.0);
    EXPECT_DOUBLE_EQ(*box.top, -20.0);
}

TEST(AnchorPositionerTest, PlacePopupMeasuresFarEdgesFromViewport) {
    Rect near_rect = place_popup(resolve_anchor(AnchorPosition::at(30.0, 40.0)), 200.0, 100.0, 800.0, 600.0);
    EXPECT_DOUBLE_EQ(near_rect.x, 30.0);
    EXPECT_DOUBLE_EQ(near_rect.y, 40.0);
    EXPECT_DOUBLE_EQ(near_rect.width, 200.0);
    EXPECT_DOUBLE_EQ(near_rect.height, 100.0);

    Rect far_rect = place_popup(resolve_anchor(AnchorPosition{Edge::End, Edge::End}), 200.0, 100.0, 800.0, 600.0);
    EXPECT_DOUBLE_EQ(far_rect.x, 600.0);
    EXPECT_DOUBLE_EQ(far_rect.y, 500.0);
}

}  // namespace openflow::menukit::core::test
