#include "menukit/core/item_filter.hpp"
#include <algorithm>
#include <iterator>

namespace openflow::menukit {

const char* item_kind_to_string(ItemKind kind) noexcept {
    switch (kind) {
        case ItemKind::Action: return "action";
        case ItemKind::Divider: return "divider";
        case ItemKind::Disabled: return "disabled";
    }
    return "unknown";
}

std::vector<MenuItem> filter_eligible(const std::vector<MenuItem>& items) {
    std::vector<MenuItem> eligible;
    eligible.reserve(items.size());
    std::copy_if(items.begin(), items.end(), std::back_inserter(eligible),
                 [](const MenuItem& item) { return item.is_eligible(); });
    return eligible;
}

EligibleItems::EligibleItems(const std::vector<MenuItem>& items) {
    raw_indices_.reserve(items.size());
    ids_.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i) {
        if (items[i].is_eligible()) {
            raw_indices_.push_back(i);
            ids_.push_back(items[i].id);
        }
    }
}

std::optional<size_t> EligibleItems::raw_index(i32 eligible_index) const {
    if (eligible_index < 0 || static_cast<size_t>(eligible_index) >= raw_indices_.size()) {
        return std::nullopt;
    }
    return raw_indices_[static_cast<size_t>(eligible_index)];
}

i32 EligibleItems::eligible_index_of_raw(size_t raw_index) const {
    auto it = std::lower_bound(raw_indices_.begin(), raw_indices_.end(), raw_index);
    if (it == raw_indices_.end() || *it != raw_index) {
        return NO_HIGHLIGHT;
    }
    return static_cast<i32>(it - raw_indices_.begin());
}

i32 EligibleItems::eligible_index_of(std::string_view id) const {
    auto it = std::find(ids_.begin(), ids_.end(), id);
    if (it == ids_.end()) {
        return NO_HIGHLIGHT;
    }
    return static_cast<i32>(it - ids_.begin());
}

}  // namespace openflow::menukit
