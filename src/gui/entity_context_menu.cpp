#include "menukit/gui/entity_context_menu.hpp"

namespace openflow::menukit::gui {

const char* entity_name(EntityKind kind) noexcept {
    switch (kind) {
        case EntityKind::Task: return "task";
        case EntityKind::Chat: return "chat";
        case EntityKind::Project: return "project";
    }
    return "entity";
}

const char* entity_label(EntityKind kind) noexcept {
    switch (kind) {
        case EntityKind::Task: return "Task";
        case EntityKind::Chat: return "Chat";
        case EntityKind::Project: return "Project";
    }
    return "Entity";
}

Result<std::unique_ptr<EntityContextMenu>> EntityContextMenu::create(const MenuHost& host,
                                                                     ElementId popup_root,
                                                                     EntityKind kind,
                                                                     const MenuConfig& config) {
    auto controller = MenuController::create(host, popup_root, config);
    if (!controller) {
        return unexpected(controller.error());
    }

    (*controller)->set_announcement_subject(std::string(entity_label(kind)) + " context");
    return std::unique_ptr<EntityContextMenu>(
        new EntityContextMenu(std::move(controller.value()), kind));
}

EntityContextMenu::EntityContextMenu(std::unique_ptr<MenuController> controller, EntityKind kind)
    : controller_(std::move(controller)), kind_(kind) {}

bool EntityContextMenu::open(const AnchorPosition& anchor,
                             std::vector<MenuItem> items,
                             std::optional<std::string> label) {
    if (items.empty()) {
        return false;
    }
    if (!label || label->empty()) {
        label = std::string(entity_name(kind_)) + " actions";
    }
    controller_->open(anchor, std::move(items), std::move(label));
    return true;
}

}  // namespace openflow::menukit::gui
