#pragma once

#include "menukit/core/menu_item.hpp"
#include "menukit/utils/types.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <optional>

namespace openflow::menukit {

/**
 * @brief Items eligible for navigation, in original list order
 *
 * Dividers and disabled items are dropped here once so that roving focus
 * arithmetic never has to skip over them.
 */
std::vector<MenuItem> filter_eligible(const std::vector<MenuItem>& items);

/**
 * @brief Index view over the eligible subset of a raw item list
 *
 * Maps eligible indices (what roving focus works with) back to positions
 * in the raw list (what renderers and click handlers work with).
 */
class EligibleItems {
public:
    EligibleItems() = default;
    explicit EligibleItems(const std::vector<MenuItem>& items);

    size_t size() const { return raw_indices_.size(); }
    bool empty() const { return raw_indices_.empty(); }

    // Position in the raw list of the eligible item at eligible_index.
    std::optional<size_t> raw_index(i32 eligible_index) const;

    // NO_HIGHLIGHT when the raw item is a divider, disabled or out of range.
    i32 eligible_index_of_raw(size_t raw_index) const;
    i32 eligible_index_of(std::string_view id) const;

    const std::vector<size_t>& raw_indices() const { return raw_indices_; }

private:
    std::vector<size_t> raw_indices_;
    std::vector<std::string> ids_;
};

}  // namespace openflow::menukit
