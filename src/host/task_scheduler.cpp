#include "menukit/host/task_scheduler.hpp"
#include "menukit/utils/logging.hpp"
#include <algorithm>

namespace openflow::menukit::host {

TaskId ManualTaskScheduler::post(Task task, Duration delay) {
    if (delay < Duration::zero()) {
        delay = Duration::zero();
    }

    TaskId id = next_id_++;
    Entry entry{id, now_ + delay, std::move(task)};

    // Keep the queue ordered by due time, FIFO among equal due times.
    auto pos = std::upper_bound(queue_.begin(), queue_.end(), entry.due,
                                [](Duration due, const Entry& e) { return due < e.due; });
    queue_.insert(pos, std::move(entry));
    return id;
}

bool ManualTaskScheduler::cancel(TaskId id) {
    auto it = std::find_if(queue_.begin(), queue_.end(),
                           [id](const Entry& e) { return e.id == id; });
    if (it == queue_.end()) {
        return false;
    }
    queue_.erase(it);
    return true;
}

bool ManualTaskScheduler::is_pending(TaskId id) const {
    return std::any_of(queue_.begin(), queue_.end(),
                       [id](const Entry& e) { return e.id == id; });
}

size_t ManualTaskScheduler::run_pending() {
    std::vector<TaskId> due;
    for (const auto& entry : queue_) {
        if (entry.due > now_) {
            break;
        }
        due.push_back(entry.id);
    }

    size_t ran = 0;
    for (TaskId id : due) {
        auto it = std::find_if(queue_.begin(), queue_.end(),
                               [id](const Entry& e) { return e.id == id; });
        if (it == queue_.end()) {
            continue;  // cancelled by an earlier task
        }
        Task task = std::move(it->task);
        queue_.erase(it);
        task();
        ++ran;
    }

    if (ran > 0) {
        LOG_TRACE("Ran {} scheduled task(s) at t={}ms", ran, now_.count());
    }
    return ran;
}

size_t ManualTaskScheduler::advance(Duration elapsed) {
    if (elapsed > Duration::zero()) {
        now_ += elapsed;
    }
    return run_pending();
}

}  // namespace openflow::menukit::host
