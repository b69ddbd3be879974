#pragma once

#include "menukit/host/document.hpp"
#include "menukit/host/element_tree.hpp"
#include "menukit/host/task_scheduler.hpp"
#include "menukit/utils/logging.hpp"
#include "menukit/utils/types.hpp"
#include <functional>

namespace openflow::menukit::gui {

enum class DismissReason : u8 {
    PointerOutside,
    EscapeKey,
    TabKey,
    Activation,
    Programmatic
};

const char* dismiss_reason_to_string(DismissReason reason) noexcept;

/**
 * @brief Closes a popup on outside pointer-down, Escape and Tab
 *
 * One coordinator serves one controller; each arm() starts a session with
 * its own document listeners:
 * - a key listener, attached immediately. Keys targeted inside the popup
 *   are forwarded to the owner; Escape (and Tab, if enabled) anywhere else
 *   dismisses.
 * - an outside pointer-down listener, attached one scheduler tick later so
 *   the click that opened the popup cannot close it.
 *
 * disarm() removes both listeners and cancels a pending attach. The
 * deferred attach also re-checks its session token, so an attach that
 * outlives its session never registers anything.
 */
class DismissalCoordinator {
public:
    using DismissCallback = std::function<void(DismissReason)>;
    using KeyForward = std::function<bool(host::KeyEvent&)>;

    struct Callbacks {
        DismissCallback on_dismiss;
        KeyForward on_popup_key;
    };

    DismissalCoordinator(host::Document& document,
                         host::TaskScheduler& scheduler,
                         const host::FocusHost& focus_host);
    ~DismissalCoordinator();

    DismissalCoordinator(const DismissalCoordinator&) = delete;
    DismissalCoordinator& operator=(const DismissalCoordinator&) = delete;

    void arm(SessionToken session, ElementId popup_root, Callbacks callbacks);
    void disarm();

    void set_close_on_tab(bool enabled) { close_on_tab_ = enabled; }

    bool is_armed() const { return active_session_ != 0; }
    bool attach_pending() const { return pending_attach_ != INVALID_TASK; }
    bool pointer_listener_attached() const { return pointer_listener_ != INVALID_LISTENER; }
    bool key_listener_attached() const { return key_listener_ != INVALID_LISTENER; }
    SessionToken session() const { return active_session_; }

private:
    void attach_pointer_listener(SessionToken session);
    void on_pointer_down(SessionToken session, const host::PointerEvent& event);
    void on_key_down(SessionToken session, host::KeyEvent& event);
    void dismiss(DismissReason reason);

    host::Document& document_;
    host::TaskScheduler& scheduler_;
    const host::FocusHost& focus_host_;

    // 0 while disarmed; controllers start counting sessions at 1.
    SessionToken active_session_ = 0;
    ElementId popup_root_ = INVALID_ELEMENT;
    Callbacks callbacks_;
    bool close_on_tab_ = true;

    TaskId pending_attach_ = INVALID_TASK;
    ListenerId pointer_listener_ = INVALID_LISTENER;
    ListenerId key_listener_ = INVALID_LISTENER;

    ComponentLogger log_{"Dismissal"};
};

}  // namespace openflow::menukit::gui
