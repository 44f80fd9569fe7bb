#include "ferry/scheduler.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "ferry/errors.hpp"

namespace ferry
{

    namespace
    {
        struct PumpGuard
        {
            bool &pumping;

            explicit PumpGuard(bool &flag) : pumping(flag) { pumping = true; }
            ~PumpGuard() { pumping = false; }

            PumpGuard(const PumpGuard &) = delete;
            PumpGuard &operator=(const PumpGuard &) = delete;
        };
    } // namespace

    std::string_view to_string(TaskStatus status) noexcept
    {
        switch (status)
        {
        case TaskStatus::Succeeded:
            return "succeeded";
        case TaskStatus::Failed:
            return "failed";
        case TaskStatus::Cancelled:
            return "cancelled";
        }
        return "unknown";
    }

    TaskOutcome TaskOutcome::success()
    {
        return TaskOutcome{};
    }

    TaskOutcome TaskOutcome::failure(ErrorCode error, std::string message)
    {
        return TaskOutcome{.status = TaskStatus::Failed, .error = error, .message = std::move(message)};
    }

    TaskOutcome TaskOutcome::cancellation()
    {
        return TaskOutcome{.status = TaskStatus::Cancelled, .error = ErrorCode::Cancelled, .message = "cancelled"};
    }

    Scheduler::Scheduler(SchedulerOptions options)
        : concurrency_(std::max<std::size_t>(options.concurrency, 1)),
          auto_start_(options.auto_start)
    {
    }

    void Scheduler::add(TaskPtr task)
    {
        if (!task)
        {
            return;
        }
        queue_.push_back(std::move(task));
        if (auto_start_)
        {
            started_ = true;
        }
        if (started_)
        {
            pump();
        }
    }

    void Scheduler::start()
    {
        started_ = true;
        pump();
    }

    void Scheduler::empty()
    {
        if (!queue_.empty())
        {
            spdlog::debug("Dropping {} queued task(s)", queue_.size());
        }
        queue_.clear();
        if (started_)
        {
            pump();
        }
    }

    ListenerId Scheduler::on_task_start(StartListener listener)
    {
        return task_started_.add(std::move(listener));
    }

    ListenerId Scheduler::on_task_done(DoneListener listener)
    {
        return task_done_.add(std::move(listener));
    }

    ListenerId Scheduler::on_idle(IdleListener listener)
    {
        return idle_.add(std::move(listener));
    }

    bool Scheduler::remove_idle_listener(ListenerId id)
    {
        return idle_.remove(id);
    }

    void Scheduler::pump()
    {
        if (pumping_)
        {
            // the outer pump picks up slots freed by synchronous completions
            return;
        }
        {
            PumpGuard guard{pumping_};
            while (started_ && running_ < concurrency_ && !queue_.empty())
            {
                auto task = std::move(queue_.front());
                queue_.pop_front();
                launch(task);
            }
        }

        if (busy_ && running_ == 0 && queue_.empty())
        {
            busy_ = false;
            try
            {
                idle_.emit();
            }
            catch (const std::exception &ex)
            {
                spdlog::error("Idle listener failed: {}", ex.what());
            }
        }
    }

    void Scheduler::launch(const TaskPtr &task)
    {
        busy_ = true;
        if (task->cancelled())
        {
            notify_done(TaskOutcome::cancellation(), task);
            return;
        }

        ++running_;
        try
        {
            task_started_.emit(task);
        }
        catch (const std::exception &ex)
        {
            // the task never runs; its slot is released like any other failure
            spdlog::error("Task-started listener failed for {}: {}", task->describe(), ex.what());
            finish(task, TaskOutcome::failure(ErrorCode::InternalError, ex.what()));
            return;
        }

        auto self = shared_from_this();
        auto completed = std::make_shared<bool>(false);
        try
        {
            task->run([self, task, completed](TaskOutcome outcome)
                      {
                if (*completed) {
                    return;
                }
                *completed = true;
                self->finish(task, std::move(outcome)); });
        }
        catch (const TransferError &ex)
        {
            if (!*completed)
            {
                *completed = true;
                finish(task, TaskOutcome::failure(ex.code(), ex.what()));
            }
        }
        catch (const std::exception &ex)
        {
            if (!*completed)
            {
                *completed = true;
                finish(task, TaskOutcome::failure(ErrorCode::InternalError, ex.what()));
            }
        }
    }

    void Scheduler::finish(const TaskPtr &task, TaskOutcome outcome)
    {
        --running_;
        notify_done(outcome, task);
        pump();
    }

    void Scheduler::notify_done(const TaskOutcome &outcome, const TaskPtr &task)
    {
        try
        {
            task_done_.emit(outcome, task);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Task-done listener failed for {}: {}", task->describe(), ex.what());
        }
    }

} // namespace ferry
