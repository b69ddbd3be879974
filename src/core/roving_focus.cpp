#include "menukit/core/roving_focus.hpp"

namespace openflow::menukit {

const char* navigation_to_string(Navigation nav) noexcept {
    switch (nav) {
        case Navigation::Next: return "next";
        case Navigation::Previous: return "previous";
        case Navigation::First: return "first";
        case Navigation::Last: return "last";
    }
    return "unknown";
}

void RovingFocus::reset(size_t count) {
    count_ = count;
    highlighted_ = NO_HIGHLIGHT;
}

void RovingFocus::sync(size_t count) {
    count_ = count;
    if (highlighted_ != NO_HIGHLIGHT && static_cast<size_t>(highlighted_) >= count_) {
        highlighted_ = NO_HIGHLIGHT;
    }
}

bool RovingFocus::move(Navigation nav) {
    if (count_ == 0) {
        return false;
    }

    const i32 n = static_cast<i32>(count_);
    switch (nav) {
        case Navigation::Next:
            return set_highlight(highlighted_ == NO_HIGHLIGHT ? 0 : (highlighted_ + 1) % n);
        case Navigation::Previous:
            return set_highlight(highlighted_ == NO_HIGHLIGHT ? n - 1 : (highlighted_ - 1 + n) % n);
        case Navigation::First:
            return set_highlight(0);
        case Navigation::Last:
            return set_highlight(n - 1);
    }
    return false;
}

bool RovingFocus::hover_enter(i32 eligible_index) {
    if (eligible_index < 0 || static_cast<size_t>(eligible_index) >= count_) {
        return false;
    }
    return set_highlight(eligible_index);
}

bool RovingFocus::hover_leave() {
    return set_highlight(NO_HIGHLIGHT);
}

std::optional<size_t> RovingFocus::activation_target() const {
    if (highlighted_ == NO_HIGHLIGHT || static_cast<size_t>(highlighted_) >= count_) {
        return std::nullopt;
    }
    return static_cast<size_t>(highlighted_);
}

bool RovingFocus::set_highlight(i32 index) {
    if (highlighted_ == index) {
        return false;
    }
    highlighted_ = index;
    return true;
}

}  // namespace openflow::menukit
