#pragma once

#include "menukit/utils/types.hpp"
#include <optional>
#include <string>
#include <variant>

namespace openflow::menukit {

// Axis keyword: Start is left/top, End is right/bottom.
enum class Edge : u8 {
    Start,
    End
};

// Absolute coordinate or edge keyword for one axis.
using AxisAnchor = std::variant<double, Edge>;

/**
 * @brief Requested popup placement, supplied fresh on every open
 */
struct AnchorPosition {
    AxisAnchor x = 0.0;
    AxisAnchor y = 0.0;

    static AnchorPosition at(double px, double py) { return AnchorPosition{px, py}; }
};

/**
 * @brief Screen-fixed box produced from an anchor
 *
 * At most one of left/right and one of top/bottom is set.
 */
struct PopupBox {
    std::optional<double> left;
    std::optional<double> right;
    std::optional<double> top;
    std::optional<double> bottom;

    bool operator==(const PopupBox& other) const = default;

    std::string to_string() const;
};

/**
 * @brief Translate an anchor into a fixed-position box
 *
 * Pure coordinate translation. Non-finite coordinates fall back to the
 * Start keyword. No viewport clamping is performed; keeping the popup on
 * screen is the caller's job.
 */
PopupBox resolve_anchor(const AnchorPosition& anchor);

/**
 * @brief Concrete rectangle for a popup of the given size inside a viewport
 *
 * Right/bottom edges are measured from the viewport's far edges. Used by
 * hosts that lay out in absolute coordinates.
 */
Rect place_popup(const PopupBox& box, double width, double height,
                 double viewport_width, double viewport_height);

}  // namespace openflow::menukit
