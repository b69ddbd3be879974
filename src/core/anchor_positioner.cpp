#include "menukit/core/anchor_positioner.hpp"
#include <cmath>
#include <sstream>

namespace openflow::menukit {

namespace {

// Writes one axis: numbers land on the near edge, keywords pin their edge at 0.
void resolve_axis(const AxisAnchor& anchor,
                  std::optional<double>& near_edge,
                  std::optional<double>& far_edge) {
    if (const double* coordinate = std::get_if<double>(&anchor)) {
        near_edge = std::isfinite(*coordinate) ? *coordinate : 0.0;
        return;
    }

    if (std::get<Edge>(anchor) == Edge::End) {
        far_edge = 0.0;
    } else {
        near_edge = 0.0;
    }
}

}  // namespace

PopupBox resolve_anchor(const AnchorPosition& anchor) {
    PopupBox box;
    resolve_axis(anchor.x, box.left, box.right);
    resolve_axis(anchor.y, box.top, box.bottom);
    return box;
}

Rect place_popup(const PopupBox& box, double width, double height,
                 double viewport_width, double viewport_height) {
    Rect rect;
    rect.width = width;
    rect.height = height;

    if (box.left) {
        rect.x = *box.left;
    } else if (box.right) {
        rect.x = viewport_width - *box.right - width;
    }

    if (box.top) {
        rect.y = *box.top;
    } else if (box.bottom) {
        rect.y = viewport_height - *box.bottom - height;
    }

    return rect;
}

std::string PopupBox::to_string() const {
    std::ostringstream oss;
    oss << "{";
    const char* sep = "";
    auto emit = [&](const char* name, const std::optional<double>& value) {
        if (value) {
            oss << sep << name << ":" << *value;
            sep = ", ";
        }
    };
    emit("left", left);
    emit("right", right);
    emit("top", top);
    emit("bottom", bottom);
    oss << "}";
    return oss.str();
}

}  // namespace openflow::menukit
