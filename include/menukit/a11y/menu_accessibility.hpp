#pragma once

#include "menukit/core/item_filter.hpp"
#include "menukit/core/menu_item.hpp"
#include "menukit/utils/types.hpp"
#include <string>
#include <vector>

namespace openflow::menukit::a11y {

enum class Role : u8 {
    Menu,
    MenuItem,
    Separator
};

const char* role_to_string(Role role) noexcept;

struct ItemAccessibility {
    std::string id;
    Role role = Role::MenuItem;
    std::string name;
    std::string shortcut;
    bool disabled = false;
    bool highlighted = false;
};

/**
 * @brief What assistive technology sees of one menu
 */
struct MenuAccessibility {
    Role role = Role::Menu;
    std::string name;
    bool open = false;
    // Id of the highlighted item, empty when nothing is highlighted.
    std::string active_descendant;
    std::vector<ItemAccessibility> items;

    std::string to_json(int indent = -1) const;
};

// "<subject> actions", or the fallback when there is no subject.
std::string default_accessible_name(const std::string& subject, const std::string& fallback);

MenuAccessibility describe_menu(const std::vector<MenuItem>& items,
                                const EligibleItems& eligible,
                                i32 highlighted,
                                const std::string& accessible_name,
                                bool open);

}  // namespace openflow::menukit::a11y
