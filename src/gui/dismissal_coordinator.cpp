#include "menukit/gui/dismissal_coordinator.hpp"

namespace openflow::menukit::gui {

const char* dismiss_reason_to_string(DismissReason reason) noexcept {
    switch (reason) {
        case DismissReason::PointerOutside: return "pointer-outside";
        case DismissReason::EscapeKey: return "escape";
        case DismissReason::TabKey: return "tab";
        case DismissReason::Activation: return "activation";
        case DismissReason::Programmatic: return "programmatic";
    }
    return "unknown";
}

DismissalCoordinator::DismissalCoordinator(host::Document& document,
                                           host::TaskScheduler& scheduler,
                                           const host::FocusHost& focus_host)
    : document_(document), scheduler_(scheduler), focus_host_(focus_host) {}

DismissalCoordinator::~DismissalCoordinator() {
    disarm();
}

void DismissalCoordinator::arm(SessionToken session, ElementId popup_root, Callbacks callbacks) {
    disarm();

    active_session_ = session;
    popup_root_ = popup_root;
    callbacks_ = std::move(callbacks);

    key_listener_ = document_.add_key_down_listener(
        [this, session](host::KeyEvent& event) { on_key_down(session, event); });

    pending_attach_ = scheduler_.post(
        [this, session]() { attach_pointer_listener(session); });

    log_.trace("Armed session {} (attach task {})", session, pending_attach_);
}

void DismissalCoordinator::disarm() {
    if (pending_attach_ != INVALID_TASK) {
        scheduler_.cancel(pending_attach_);
        pending_attach_ = INVALID_TASK;
    }
    if (pointer_listener_ != INVALID_LISTENER) {
        if (!document_.remove_listener(pointer_listener_)) {
            log_.debug("Pointer listener {} was already gone", pointer_listener_);
        }
        pointer_listener_ = INVALID_LISTENER;
    }
    if (key_listener_ != INVALID_LISTENER) {
        if (!document_.remove_listener(key_listener_)) {
            log_.debug("Key listener {} was already gone", key_listener_);
        }
        key_listener_ = INVALID_LISTENER;
    }
    if (active_session_ != 0) {
        log_.trace("Disarmed session {}", active_session_);
    }
    active_session_ = 0;
    popup_root_ = INVALID_ELEMENT;
    callbacks_ = Callbacks{};
}

void DismissalCoordinator::attach_pointer_listener(SessionToken session) {
    if (session != active_session_) {
        log_.trace("Ignoring stale listener attach for session {}", session);
        return;
    }
    pending_attach_ = INVALID_TASK;
    pointer_listener_ = document_.add_pointer_down_listener(
        [this, session](host::PointerEvent& event) { on_pointer_down(session, event); });
}

void DismissalCoordinator::on_pointer_down(SessionToken session, const host::PointerEvent& event) {
    if (session != active_session_) {
        return;
    }
    if (popup_root_ != INVALID_ELEMENT && focus_host_.contains(popup_root_, event.target)) {
        return;
    }
    log_.debug("Pointer-down outside popup (target {})", event.target);
    dismiss(DismissReason::PointerOutside);
}

void DismissalCoordinator::on_key_down(SessionToken session, host::KeyEvent& event) {
    if (session != active_session_) {
        return;
    }

    if (popup_root_ != INVALID_ELEMENT && focus_host_.contains(popup_root_, event.target)) {
        if (callbacks_.on_popup_key) {
            // Copy: the owner may close and disarm from inside the handler.
            KeyForward forward = callbacks_.on_popup_key;
            forward(event);
        }
        return;
    }

    if (event.key == host::Key::Escape) {
        event.prevent_default();
        dismiss(DismissReason::EscapeKey);
    } else if (event.key == host::Key::Tab && close_on_tab_) {
        // Focus is leaving anyway; let Tab move it, just close behind it.
        dismiss(DismissReason::TabKey);
    }
}

void DismissalCoordinator::dismiss(DismissReason reason) {
    DismissCallback on_dismiss = callbacks_.on_dismiss;
    if (on_dismiss) {
        on_dismiss(reason);
    }
}

}  // namespace openflow::menukit::gui
