#pragma once

#include "menukit/utils/types.hpp"
#include <string>
#include <functional>
#include <utility>

namespace openflow::menukit {

/**
 * @brief Classification of a menu entry
 *
 * Exactly one kind applies to every item. Only Action items take part in
 * keyboard and pointer navigation.
 */
enum class ItemKind : u8 {
    Action = 0,
    Divider = 1,
    Disabled = 2
};

const char* item_kind_to_string(ItemKind kind) noexcept;

/**
 * @brief One selectable or structural entry handed to a menu controller
 *
 * Item ids are unique within one list. Labels and shortcut hints are
 * opaque to the controller; they only reach the accessibility layer and
 * the renderer.
 */
struct MenuItem {
    using Action = std::function<void()>;

    std::string id;
    std::string label;
    ItemKind kind = ItemKind::Action;
    Action on_activate;
    std::string shortcut;
    bool destructive = false;

    MenuItem() = default;
    MenuItem(std::string i, std::string l, Action a, ItemKind k = ItemKind::Action)
        : id(std::move(i)), label(std::move(l)), kind(k), on_activate(std::move(a)) {}

    static MenuItem action(std::string id, std::string label, Action on_activate) {
        return MenuItem(std::move(id), std::move(label), std::move(on_activate));
    }

    static MenuItem divider(std::string id) {
        return MenuItem(std::move(id), std::string(), Action(), ItemKind::Divider);
    }

    static MenuItem disabled(std::string id, std::string label) {
        return MenuItem(std::move(id), std::move(label), Action(), ItemKind::Disabled);
    }

    MenuItem& with_shortcut(std::string hint) {
        shortcut = std::move(hint);
        return *this;
    }

    MenuItem& as_destructive(bool value = true) {
        destructive = value;
        return *this;
    }

    bool is_divider() const { return kind == ItemKind::Divider; }
    bool is_disabled() const { return kind == ItemKind::Disabled; }
    bool is_eligible() const { return kind == ItemKind::Action; }
};

}  // namespace openflow::menukit
