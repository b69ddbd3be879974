#pragma once

#include "menukit/host/task_scheduler.hpp"
#include "menukit/utils/types.hpp"
#include <functional>
#include <string>

namespace openflow::menukit::a11y {

// Label as spoken for a highlighted item.
std::string item_announcement(const std::string& label, bool destructive = false);

/**
 * @brief "Task context menu opened. 3 actions available."
 *
 * An empty subject yields "Menu opened." The count sentence is omitted
 * when include_count is false.
 */
std::string open_announcement(const std::string& subject, size_t action_count,
                              bool include_count = true);

/**
 * @brief Non-visual polite status region
 *
 * Every write bumps revision(), so observers see repeated identical
 * messages as distinct announcements.
 */
class LiveRegion {
public:
    using Observer = std::function<void(const std::string& text)>;

    const std::string& text() const { return text_; }
    bool empty() const { return text_.empty(); }
    u64 revision() const { return revision_; }

    void set_text(std::string text);
    void clear();

    void set_observer(Observer observer) { observer_ = std::move(observer); }

private:
    std::string text_;
    u64 revision_ = 0;
    Observer observer_;
};

/**
 * @brief Publishes transient messages and clears them after a delay
 */
class Announcer {
public:
    Announcer(host::TaskScheduler& scheduler, Duration clear_delay);
    ~Announcer();

    Announcer(const Announcer&) = delete;
    Announcer& operator=(const Announcer&) = delete;

    void announce(std::string message);
    void clear();

    void set_clear_delay(Duration delay) { clear_delay_ = delay; }
    Duration clear_delay() const { return clear_delay_; }

    LiveRegion& region() { return region_; }
    const LiveRegion& region() const { return region_; }
    const std::string& current() const { return region_.text(); }
    bool clear_pending() const { return pending_clear_ != INVALID_TASK; }

private:
    void cancel_pending_clear();

    host::TaskScheduler& scheduler_;
    LiveRegion region_;
    Duration clear_delay_;
    TaskId pending_clear_ = INVALID_TASK;
};

}  // namespace openflow::menukit::a11y
