#pragma once

#include "menukit/utils/types.hpp"
#include <optional>

namespace openflow::menukit {

enum class Navigation : u8 {
    Next,
    Previous,
    First,
    Last
};

const char* navigation_to_string(Navigation nav) noexcept;

/**
 * @brief Single highlight pointer moving over the eligible item subset
 *
 * The highlight is either NO_HIGHLIGHT or a valid index into a subset of
 * count() items. Next/Previous wrap around; with an empty subset every
 * transition is a no-op.
 */
class RovingFocus {
public:
    RovingFocus() = default;
    explicit RovingFocus(size_t count) : count_(count) {}

    // Back to "nothing highlighted" for a fresh interaction.
    void reset(size_t count);

    // Adopt a new subset size mid-session. An index that no longer fits
    // is dropped to NO_HIGHLIGHT rather than clamped onto another item.
    void sync(size_t count);

    // Returns true when the highlight changed.
    bool move(Navigation nav);
    bool next() { return move(Navigation::Next); }
    bool previous() { return move(Navigation::Previous); }
    bool first() { return move(Navigation::First); }
    bool last() { return move(Navigation::Last); }

    bool hover_enter(i32 eligible_index);
    bool hover_leave();

    // Eligible index to activate, if anything is highlighted.
    std::optional<size_t> activation_target() const;

    i32 highlighted() const { return highlighted_; }
    bool has_highlight() const { return highlighted_ != NO_HIGHLIGHT; }
    size_t count() const { return count_; }

private:
    bool set_highlight(i32 index);

    size_t count_ = 0;
    i32 highlighted_ = NO_HIGHLIGHT;
};

}  // namespace openflow::menukit
