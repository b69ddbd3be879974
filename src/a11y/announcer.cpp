#include "menukit/a11y/announcer.hpp"
#include "menukit/utils/logging.hpp"

namespace openflow::menukit::a11y {

std::string item_announcement(const std::string& label, bool destructive) {
    if (!destructive) {
        return label;
    }
    return label + " (destructive action)";
}

std::string open_announcement(const std::string& subject, size_t action_count,
                              bool include_count) {
    std::string message = subject.empty() ? "Menu opened." : subject + " menu opened.";
    if (include_count) {
        message += action_count == 1 ? " 1 action available."
                                     : " " + std::to_string(action_count) + " actions available.";
    }
    return message;
}

void LiveRegion::set_text(std::string text) {
    text_ = std::move(text);
    ++revision_;
    if (observer_) {
        observer_(text_);
    }
}

void LiveRegion::clear() {
    if (text_.empty()) {
        return;
    }
    text_.clear();
    ++revision_;
    if (observer_) {
        observer_(text_);
    }
}

Announcer::Announcer(host::TaskScheduler& scheduler, Duration clear_delay)
    : scheduler_(scheduler), clear_delay_(clear_delay) {}

Announcer::~Announcer() {
    cancel_pending_clear();
}

void Announcer::announce(std::string message) {
    cancel_pending_clear();
    LOG_DEBUG("Announcing: {}", message);
    region_.set_text(std::move(message));

    pending_clear_ = scheduler_.post([this]() {
        pending_clear_ = INVALID_TASK;
        region_.clear();
    }, clear_delay_);
}

void Announcer::clear() {
    cancel_pending_clear();
    region_.clear();
}

void Announcer::cancel_pending_clear() {
    if (pending_clear_ != INVALID_TASK) {
        scheduler_.cancel(pending_clear_);
        pending_clear_ = INVALID_TASK;
    }
}

}  // namespace openflow::menukit::a11y
