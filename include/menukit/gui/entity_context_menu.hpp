#pragma once

#include "menukit/gui/menu_controller.hpp"
#include "menukit/utils/error.hpp"
#include "menukit/utils/types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace openflow::menukit::gui {

enum class EntityKind : u8 {
    Task,
    Chat,
    Project
};

// "task", "chat", "project"
const char* entity_name(EntityKind kind) noexcept;
// "Task", "Chat", "Project"
const char* entity_label(EntityKind kind) noexcept;

/**
 * @brief Context menu for one kind of entity
 *
 * Thin wrapper over MenuController: names the popup "<kind> actions",
 * announces "<Kind> context menu opened", and refuses to open with an
 * empty item list. Which actions exist is decided by the caller's item
 * builder.
 */
class EntityContextMenu {
public:
    static Result<std::unique_ptr<EntityContextMenu>> create(const MenuHost& host,
                                                             ElementId popup_root,
                                                             EntityKind kind,
                                                             const MenuConfig& config = MenuConfig{});

    // Returns false (and stays closed) when items is empty.
    bool open(const AnchorPosition& anchor,
              std::vector<MenuItem> items,
              std::optional<std::string> label = std::nullopt);
    void close() { controller_->close(); }

    EntityKind kind() const { return kind_; }
    MenuController& controller() { return *controller_; }
    const MenuController& controller() const { return *controller_; }

private:
    EntityContextMenu(std::unique_ptr<MenuController> controller, EntityKind kind);

    std::unique_ptr<MenuController> controller_;
    EntityKind kind_;
};

}  // namespace openflow::menukit::gui
