#include "menukit/a11y/menu_accessibility.hpp"
#include "menukit/a11y/announcer.hpp"
#include <nlohmann/json.hpp>

namespace openflow::menukit::a11y {

using json = nlohmann::json;

const char* role_to_string(Role role) noexcept {
    switch (role) {
        case Role::Menu: return "menu";
        case Role::MenuItem: return "menuitem";
        case Role::Separator: return "separator";
    }
    return "none";
}

std::string default_accessible_name(const std::string& subject, const std::string& fallback) {
    if (subject.empty()) {
        return fallback;
    }
    return subject + " actions";
}

MenuAccessibility describe_menu(const std::vector<MenuItem>& items,
                                const EligibleItems& eligible,
                                i32 highlighted,
                                const std::string& accessible_name,
                                bool open) {
    MenuAccessibility info;
    info.name = accessible_name;
    info.open = open;
    if (!open) {
        return info;
    }

    auto highlighted_raw = eligible.raw_index(highlighted);
    info.items.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i) {
        const MenuItem& item = items[i];
        ItemAccessibility entry;
        entry.id = item.id;
        if (item.is_divider()) {
            entry.role = Role::Separator;
        } else {
            entry.role = Role::MenuItem;
            entry.name = item_announcement(item.label, item.destructive);
            entry.shortcut = item.shortcut;
            entry.disabled = item.is_disabled();
            entry.highlighted = highlighted_raw && *highlighted_raw == i;
            if (entry.highlighted) {
                info.active_descendant = item.id;
            }
        }
        info.items.push_back(std::move(entry));
    }
    return info;
}

std::string MenuAccessibility::to_json(int indent) const {
    json root;
    root["role"] = role_to_string(role);
    root["name"] = name;
    root["open"] = open;
    root["activeDescendant"] = active_descendant.empty() ? json(nullptr) : json(active_descendant);

    json children = json::array();
    for (const auto& item : items) {
        json child;
        child["id"] = item.id;
        child["role"] = role_to_string(item.role);
        if (item.role != Role::Separator) {
            child["name"] = item.name;
            child["disabled"] = item.disabled;
            child["highlighted"] = item.highlighted;
            if (!item.shortcut.empty()) {
                child["shortcut"] = item.shortcut;
            }
        }
        children.push_back(std::move(child));
    }
    root["items"] = std::move(children);
    return root.dump(indent);
}

}  // namespace openflow::menukit::a11y
