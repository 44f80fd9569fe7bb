/**
 * Ferry - Bounded concurrency task scheduler.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "ferry/error_codes.hpp"
#include "ferry/listeners.hpp"

namespace ferry
{

    enum class TaskStatus : std::uint8_t
    {
        Succeeded,
        Failed,
        Cancelled
    };

    std::string_view to_string(TaskStatus status) noexcept;

    // Terminal result of a task. A cancellation is not a failure.
    struct TaskOutcome
    {
        TaskStatus status{TaskStatus::Succeeded};
        ErrorCode error{ErrorCode::Ok};
        std::string message;

        static TaskOutcome success();
        static TaskOutcome failure(ErrorCode error, std::string message);
        static TaskOutcome cancellation();

        bool ok() const noexcept { return status == TaskStatus::Succeeded; }
        bool failed() const noexcept { return status == TaskStatus::Failed; }
        bool cancelled() const noexcept { return status == TaskStatus::Cancelled; }
    };

    class Task : public std::enable_shared_from_this<Task>
    {
    public:
        using Completion = std::function<void(TaskOutcome)>;

        virtual ~Task() = default;

        // on_complete must be called exactly once, possibly before run() returns.
        virtual void run(Completion on_complete) = 0;

        // Cooperative: a running task stops at its next suspension point.
        virtual void cancel() = 0;
        virtual bool cancelled() const = 0;

        virtual std::string describe() const = 0;
    };

    using TaskPtr = std::shared_ptr<Task>;

    struct SchedulerOptions
    {
        std::size_t concurrency{1};
        bool auto_start{true};
    };

    /**
     * FIFO run queue that never runs more than `concurrency` tasks at once.
     *
     * Notifications are delivered synchronously: task-started before the task runs,
     * task-done once per task before the freed slot is reused, idle once per run after
     * the last task-done. A task cancelled while queued is reported done (cancelled)
     * without ever starting. A throwing task-started listener fails that task; exceptions
     * from the other listeners are logged and never stop the queue.
     *
     * Must be owned by a std::shared_ptr; running tasks keep their scheduler alive.
     */
    class Scheduler : public std::enable_shared_from_this<Scheduler>
    {
    public:
        using StartListener = std::function<void(const TaskPtr &)>;
        using DoneListener = std::function<void(const TaskOutcome &, const TaskPtr &)>;
        using IdleListener = std::function<void()>;

        explicit Scheduler(SchedulerOptions options = {});

        Scheduler(const Scheduler &) = delete;
        Scheduler &operator=(const Scheduler &) = delete;

        void add(TaskPtr task);
        void start();

        // Drops every task that has not started yet.
        void empty();

        // queued + running
        std::size_t size() const noexcept { return queue_.size() + running_; }
        std::size_t queued() const noexcept { return queue_.size(); }
        std::size_t running() const noexcept { return running_; }
        std::size_t concurrency() const noexcept { return concurrency_; }
        bool started() const noexcept { return started_; }

        ListenerId on_task_start(StartListener listener);
        ListenerId on_task_done(DoneListener listener);
        ListenerId on_idle(IdleListener listener);
        bool remove_idle_listener(ListenerId id);

    private:
        void pump();
        void launch(const TaskPtr &task);
        void finish(const TaskPtr &task, TaskOutcome outcome);
        void notify_done(const TaskOutcome &outcome, const TaskPtr &task);

        std::size_t concurrency_;
        bool auto_start_;
        bool started_{false};
        bool pumping_{false};
        bool busy_{false};
        std::deque<TaskPtr> queue_;
        std::size_t running_{0};

        ListenerList<const TaskPtr &> task_started_;
        ListenerList<const TaskOutcome &, const TaskPtr &> task_done_;
        ListenerList<> idle_;
    };

} // namespace ferry
