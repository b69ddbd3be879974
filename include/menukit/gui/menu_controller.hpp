#pragma once

#include "menukit/a11y/announcer.hpp"
#include "menukit/a11y/menu_accessibility.hpp"
#include "menukit/config/configuration.hpp"
#include "menukit/core/anchor_positioner.hpp"
#include "menukit/core/item_filter.hpp"
#include "menukit/core/menu_item.hpp"
#include "menukit/core/roving_focus.hpp"
#include "menukit/gui/dismissal_coordinator.hpp"
#include "menukit/host/document.hpp"
#include "menukit/host/element_tree.hpp"
#include "menukit/host/task_scheduler.hpp"
#include "menukit/utils/error.hpp"
#include "menukit/utils/logging.hpp"
#include "menukit/utils/types.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace openflow::menukit::gui {

/**
 * @brief Host services a controller borrows for its whole lifetime
 *
 * All three must outlive the controller.
 */
struct MenuHost {
    host::Document* document = nullptr;
    host::TaskScheduler* scheduler = nullptr;
    host::FocusHost* focus = nullptr;
};

/**
 * @brief Interaction controller shared by every popup menu
 *
 * Owns one popup element and drives it through open/close sessions:
 * - open() resets the highlight, remembers who had focus, resolves the
 *   anchor, arms dismissal, focuses the popup and announces it.
 * - Keys, hover and clicks move a roving highlight over the eligible items
 *   and activate them.
 * - close() disarms dismissal, hands focus back and notifies the owner of
 *   the open flag through the close handler.
 *
 * Input arriving while closed is ignored. No interaction path throws or
 * reports errors; anything unexpected degrades to a no-op.
 */
class MenuController {
public:
    using CloseHandler = std::function<void(DismissReason)>;

    static Result<std::unique_ptr<MenuController>> create(const MenuHost& host,
                                                          ElementId popup_root,
                                                          const MenuConfig& config = MenuConfig{});

    ~MenuController();

    MenuController(const MenuController&) = delete;
    MenuController& operator=(const MenuController&) = delete;

    // Session lifecycle
    void open(const AnchorPosition& anchor,
              std::vector<MenuItem> items,
              std::optional<std::string> label = std::nullopt);
    void close() { close(DismissReason::Programmatic); }
    void close(DismissReason reason);

    // Replace the items of a live session; an out-of-range highlight drops to none.
    void set_items(std::vector<MenuItem> items);

    // Input. handle_key returns true (and prevents the default) when it consumed the key.
    bool handle_key(host::KeyEvent& event);
    void handle_pointer_enter_item(i32 eligible_index);
    void handle_pointer_leave_item();
    bool handle_item_click(const std::string& item_id);

    void set_close_handler(CloseHandler handler) { close_handler_ = std::move(handler); }

    // Subject used for the default name and open announcement, e.g. "Task context".
    void set_announcement_subject(std::string subject) { subject_ = std::move(subject); }

    // State access
    bool is_open() const { return open_; }
    SessionToken session() const { return session_; }
    i32 highlighted_index() const { return roving_.highlighted(); }
    const MenuItem* highlighted_item() const;
    const std::vector<MenuItem>& items() const { return items_; }
    const EligibleItems& eligible() const { return eligible_; }
    const PopupBox& position() const { return position_; }
    const std::string& accessible_name() const { return accessible_name_; }
    ElementId popup_root() const { return popup_root_; }
    ElementId focus_anchor() const { return focus_anchor_; }
    const MenuConfig& config() const { return config_; }

    a11y::MenuAccessibility accessibility() const;
    const a11y::Announcer& announcer() const { return announcer_; }
    a11y::LiveRegion& live_region() { return announcer_.region(); }
    const DismissalCoordinator& dismissal() const { return dismissal_; }

private:
    MenuController(const MenuHost& host, ElementId popup_root, const MenuConfig& config);

    void navigate(Navigation nav);
    bool activate_highlighted();
    void activate(size_t raw_index);
    void announce_highlight();
    void restore_focus();

    host::FocusHost& focus_;
    ElementId popup_root_;
    MenuConfig config_;

    DismissalCoordinator dismissal_;
    a11y::Announcer announcer_;
    CloseHandler close_handler_;

    bool open_ = false;
    SessionToken session_ = 0;
    std::vector<MenuItem> items_;
    EligibleItems eligible_;
    RovingFocus roving_;
    PopupBox position_;
    std::string accessible_name_;
    std::string subject_;
    ElementId focus_anchor_ = INVALID_ELEMENT;

    // Cleared by the destructor; read after user callbacks that may delete us.
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);

    ComponentLogger log_{"MenuController"};
};

}  // namespace openflow::menukit::gui
