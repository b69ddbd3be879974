#include "menukit/gui/menu_controller.hpp"
#include <algorithm>
#include <exception>

namespace openflow::menukit::gui {

Result<std::unique_ptr<MenuController>> MenuController::create(const MenuHost& host,
                                                               ElementId popup_root,
                                                               const MenuConfig& config) {
    if (!host.document || !host.scheduler || !host.focus) {
        return unexpected(MAKE_ERROR(INVALID_PARAMETER,
            "MenuController needs a document, a scheduler and a focus host"));
    }
    if (!host.focus->is_connected(popup_root)) {
        return unexpected(MAKE_ERROR(ELEMENT_NOT_FOUND,
            "Popup root element " + std::to_string(popup_root) + " is not connected"));
    }

    return std::unique_ptr<MenuController>(new MenuController(host, popup_root, config));
}

MenuController::MenuController(const MenuHost& host, ElementId popup_root, const MenuConfig& config)
    : focus_(*host.focus),
      popup_root_(popup_root),
      config_(config),
      dismissal_(*host.document, *host.scheduler, *host.focus),
      announcer_(*host.scheduler, config.announce_clear_delay) {
    dismissal_.set_close_on_tab(config_.close_on_tab);
    log_.debug("Created for popup element {}", popup_root_);
}

MenuController::~MenuController() {
    // Unmount: listeners go, the owner is not notified.
    *alive_ = false;
    dismissal_.disarm();
}

void MenuController::open(const AnchorPosition& anchor,
                          std::vector<MenuItem> items,
                          std::optional<std::string> label) {
    if (!open_) {
        ElementId active = focus_.active_element();
        focus_anchor_ = focus_.contains(popup_root_, active) ? INVALID_ELEMENT : active;
    }

    ++session_;
    open_ = true;
    items_ = std::move(items);
    eligible_ = EligibleItems(items_);
    roving_.reset(eligible_.size());
    position_ = resolve_anchor(anchor);
    accessible_name_ = (label && !label->empty())
        ? *label
        : a11y::default_accessible_name(subject_, config_.default_label);

    dismissal_.arm(session_, popup_root_, DismissalCoordinator::Callbacks{
        [this](DismissReason reason) { close(reason); },
        [this](host::KeyEvent& event) { return handle_key(event); }});

    if (!focus_.focus(popup_root_)) {
        log_.debug("Popup element {} could not take focus", popup_root_);
    }

    announcer_.announce(a11y::open_announcement(subject_, eligible_.size(),
                                                config_.announce_item_count));

    log_.debug("Session {} opened '{}' with {} item(s), {} eligible, at {}",
               session_, accessible_name_, items_.size(), eligible_.size(), position_.to_string());
}

void MenuController::close(DismissReason reason) {
    if (!open_) {
        return;
    }

    open_ = false;
    ++session_;
    dismissal_.disarm();
    roving_.reset(0);
    items_.clear();
    eligible_ = EligibleItems();
    restore_focus();

    log_.debug("Closed ({}), session now {}", dismiss_reason_to_string(reason), session_);

    // The handler may destroy this controller; nothing below may touch members.
    if (close_handler_) {
        CloseHandler handler = close_handler_;
        handler(reason);
    }
}

void MenuController::set_items(std::vector<MenuItem> items) {
    if (!open_) {
        return;
    }
    items_ = std::move(items);
    eligible_ = EligibleItems(items_);
    roving_.sync(eligible_.size());
}

bool MenuController::handle_key(host::KeyEvent& event) {
    if (!open_) {
        return false;
    }

    switch (event.key) {
        case host::Key::ArrowDown:
            navigate(Navigation::Next);
            break;
        case host::Key::ArrowUp:
            navigate(Navigation::Previous);
            break;
        case host::Key::Home:
            navigate(Navigation::First);
            break;
        case host::Key::End:
            navigate(Navigation::Last);
            break;
        case host::Key::Enter:
        case host::Key::Space:
            event.prevent_default();
            activate_highlighted();
            return true;
        case host::Key::Escape:
            event.prevent_default();
            close(DismissReason::EscapeKey);
            return true;
        case host::Key::Tab:
            if (!config_.close_on_tab) {
                return false;
            }
            event.prevent_default();
            close(DismissReason::TabKey);
            return true;
        case host::Key::Other:
            return false;
    }

    event.prevent_default();
    return true;
}

void MenuController::handle_pointer_enter_item(i32 eligible_index) {
    if (!open_) {
        return;
    }
    if (roving_.hover_enter(eligible_index)) {
        announce_highlight();
    }
}

void MenuController::handle_pointer_leave_item() {
    if (!open_) {
        return;
    }
    roving_.hover_leave();
}

bool MenuController::handle_item_click(const std::string& item_id) {
    if (!open_) {
        return false;
    }

    auto it = std::find_if(items_.begin(), items_.end(),
                           [&item_id](const MenuItem& item) { return item.id == item_id; });
    if (it == items_.end() || !it->is_eligible()) {
        return false;
    }

    activate(static_cast<size_t>(it - items_.begin()));
    return true;
}

const MenuItem* MenuController::highlighted_item() const {
    auto raw = eligible_.raw_index(roving_.highlighted());
    if (!raw || *raw >= items_.size()) {
        return nullptr;
    }
    return &items_[*raw];
}

a11y::MenuAccessibility MenuController::accessibility() const {
    return a11y::describe_menu(items_, eligible_, roving_.highlighted(), accessible_name_, open_);
}

void MenuController::navigate(Navigation nav) {
    if (roving_.move(nav)) {
        log_.trace("Highlight {} -> {}", navigation_to_string(nav), roving_.highlighted());
        announce_highlight();
    }
}

bool MenuController::activate_highlighted() {
    auto target = roving_.activation_target();
    if (!target) {
        return false;
    }
    auto raw = eligible_.raw_index(static_cast<i32>(*target));
    if (!raw) {
        return false;
    }
    activate(*raw);
    return true;
}

void MenuController::activate(size_t raw_index) {
    // Copy first: the action may replace the item list or reopen the menu.
    MenuItem::Action action = items_[raw_index].on_activate;
    const std::string item_id = items_[raw_index].id;
    const SessionToken session = session_;
    const std::shared_ptr<bool> alive = alive_;

    log_.debug("Activating '{}'", item_id);
    if (action) {
        try {
            action();
        } catch (const std::exception& ex) {
            LOG_ERROR("[MenuController] Action for '{}' threw: {}", item_id, ex.what());
        } catch (...) {
            LOG_ERROR("[MenuController] Action for '{}' threw a non-standard exception", item_id);
        }
    }

    // The action may have destroyed the controller that owns it.
    if (!*alive) {
        return;
    }
    if (open_ && session_ == session) {
        close(DismissReason::Activation);
    }
}

void MenuController::announce_highlight() {
    if (!config_.announce_highlight) {
        return;
    }
    if (const MenuItem* item = highlighted_item()) {
        announcer_.announce(a11y::item_announcement(item->label, item->destructive));
    }
}

void MenuController::restore_focus() {
    ElementId anchor = focus_anchor_;
    focus_anchor_ = INVALID_ELEMENT;
    if (anchor == INVALID_ELEMENT) {
        return;
    }
    if (!focus_.is_connected(anchor)) {
        log_.debug("Focus anchor {} no longer exists; leaving focus alone", anchor);
        return;
    }
    focus_.focus(anchor);
}

}  // namespace openflow::menukit::gui
