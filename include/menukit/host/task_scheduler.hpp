#pragma once

#include "menukit/utils/types.hpp"
#include <functional>
#include <vector>

namespace openflow::menukit::host {

/**
 * @brief Single-shot callbacks on the UI thread
 *
 * post() never runs the task synchronously: even a zero delay waits for
 * the next turn of the host's event loop.
 */
class TaskScheduler {
public:
    using Task = std::function<void()>;

    virtual ~TaskScheduler() = default;

    virtual TaskId post(Task task, Duration delay = Duration::zero()) = 0;

    // Returns false when the task already ran or was never scheduled.
    virtual bool cancel(TaskId id) = 0;
};

/**
 * @brief Deterministic scheduler driven by an explicit virtual clock
 *
 * Hosts that pump their own loop call run_pending() once per frame; tests
 * use advance() to step time. Tasks posted while a pass is running are
 * left for the next pass.
 */
class ManualTaskScheduler : public TaskScheduler {
public:
    ManualTaskScheduler() = default;
    ~ManualTaskScheduler() override = default;

    TaskId post(Task task, Duration delay = Duration::zero()) override;
    bool cancel(TaskId id) override;

    // Runs every task due at the current virtual time; returns how many ran.
    size_t run_pending();

    // Moves the clock forward, then runs what became due.
    size_t advance(Duration elapsed);

    size_t pending_count() const { return queue_.size(); }
    bool is_pending(TaskId id) const;
    Duration now() const { return now_; }

private:
    struct Entry {
        TaskId id;
        Duration due;
        Task task;
    };

    std::vector<Entry> queue_;
    Duration now_{0};
    TaskId next_id_ = 1;
};

}  // namespace openflow::menukit::host
