#include <algorithm>
#include <cassert>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "ferry/errors.hpp"
#include "ferry/scheduler.hpp"

using namespace ferry;

namespace
{

    // Completes only when the test says so.
    class ManualTask final : public Task
    {
    public:
        explicit ManualTask(std::string name) : name_(std::move(name)) {}

        void run(Completion on_complete) override
        {
            ++runs_;
            completion_ = std::move(on_complete);
        }

        void finish(TaskOutcome outcome = TaskOutcome::success())
        {
            auto completion = std::move(completion_);
            completion_ = nullptr;
            completion(std::move(outcome));
        }

        void cancel() override { cancelled_ = true; }
        bool cancelled() const override { return cancelled_; }
        std::string describe() const override { return name_; }

        bool running() const { return static_cast<bool>(completion_); }
        int runs() const { return runs_; }

    private:
        std::string name_;
        Completion completion_;
        bool cancelled_{false};
        int runs_{0};
    };

    class ImmediateTask final : public Task
    {
    public:
        ImmediateTask(std::string name, TaskOutcome outcome) : name_(std::move(name)), outcome_(std::move(outcome)) {}

        void run(Completion on_complete) override { on_complete(outcome_); }
        void cancel() override {}
        bool cancelled() const override { return false; }
        std::string describe() const override { return name_; }

    private:
        std::string name_;
        TaskOutcome outcome_;
    };

    class ThrowingTask final : public Task
    {
    public:
        void run(Completion) override { throw TransferError(ErrorCode::PermissionDenied, "denied"); }
        void cancel() override {}
        bool cancelled() const override { return false; }
        std::string describe() const override { return "throwing"; }
    };

    struct Recorder
    {
        std::vector<std::string> events;
        std::vector<TaskOutcome> outcomes;
        int idle{0};
        std::size_t max_running{0};

        void attach(const std::shared_ptr<Scheduler> &scheduler)
        {
            scheduler->on_task_start([this, scheduler = std::weak_ptr<Scheduler>(scheduler)](const TaskPtr &task)
                                     {
                events.push_back("start " + task->describe());
                // the task is counted before it runs
                max_running = std::max(max_running, scheduler.lock()->running()); });
            scheduler->on_task_done([this](const TaskOutcome &outcome, const TaskPtr &task)
                                    {
                events.push_back("done " + task->describe());
                outcomes.push_back(outcome); });
            scheduler->on_idle([this]()
                               {
                events.emplace_back("idle");
                ++idle; });
        }
    };

    std::vector<std::shared_ptr<ManualTask>> manual_tasks(std::size_t count)
    {
        std::vector<std::shared_ptr<ManualTask>> tasks;
        for (std::size_t i = 0; i < count; ++i)
        {
            tasks.push_back(std::make_shared<ManualTask>("t" + std::to_string(i)));
        }
        return tasks;
    }

    void test_concurrency_bound_and_fifo()
    {
        auto scheduler = std::make_shared<Scheduler>(SchedulerOptions{.concurrency = 2});
        Recorder recorder;
        recorder.attach(scheduler);

        auto tasks = manual_tasks(5);
        for (const auto &task : tasks)
        {
            scheduler->add(task);
        }
        assert(scheduler->running() == 2);
        assert(scheduler->queued() == 3);
        assert(scheduler->size() == 5);
        assert(tasks[0]->running() && tasks[1]->running() && !tasks[2]->running());

        tasks[1]->finish();
        assert(tasks[2]->running());
        tasks[0]->finish();
        tasks[2]->finish();
        tasks[3]->finish();
        tasks[4]->finish();

        assert(recorder.max_running == 2);
        assert(recorder.idle == 1);
        assert(scheduler->size() == 0);

        const std::vector<std::string> expected{
            "start t0", "start t1", "done t1", "start t2", "done t0", "start t3",
            "done t2", "start t4", "done t3", "done t4", "idle"};
        assert(recorder.events == expected);
        for (const auto &task : tasks)
        {
            assert(task->runs() == 1);
        }
    }

    void test_idle_once_per_run()
    {
        auto scheduler = std::make_shared<Scheduler>(SchedulerOptions{.concurrency = 3});
        Recorder recorder;
        recorder.attach(scheduler);

        auto tasks = manual_tasks(3);
        for (const auto &task : tasks)
        {
            scheduler->add(task);
        }
        for (const auto &task : tasks)
        {
            task->finish();
        }
        assert(recorder.idle == 1);

        auto again = std::make_shared<ManualTask>("again");
        scheduler->add(again);
        assert(recorder.idle == 1);
        again->finish();
        assert(recorder.idle == 2);

        // no tasks, no idle
        scheduler->empty();
        assert(recorder.idle == 2);
    }

    void test_failure_isolation()
    {
        auto scheduler = std::make_shared<Scheduler>(SchedulerOptions{.concurrency = 1, .auto_start = false});
        Recorder recorder;
        recorder.attach(scheduler);

        scheduler->add(std::make_shared<ImmediateTask>("fails", TaskOutcome::failure(ErrorCode::IoError, "disk")));
        scheduler->add(std::make_shared<ThrowingTask>());
        scheduler->add(std::make_shared<ImmediateTask>("works", TaskOutcome::success()));
        assert(!scheduler->started());
        assert(scheduler->queued() == 3);
        assert(recorder.events.empty());

        scheduler->start();
        assert(recorder.outcomes.size() == 3);
        assert(recorder.outcomes[0].failed());
        assert(recorder.outcomes[0].error == ErrorCode::IoError);
        assert(recorder.outcomes[1].failed());
        assert(recorder.outcomes[1].error == ErrorCode::PermissionDenied);
        assert(recorder.outcomes[2].ok());
        assert(recorder.idle == 1);
        assert(recorder.events.back() == "idle");
    }

    void test_cancel_before_start()
    {
        auto scheduler = std::make_shared<Scheduler>(SchedulerOptions{.concurrency = 1});
        Recorder recorder;
        recorder.attach(scheduler);

        auto tasks = manual_tasks(3);
        for (const auto &task : tasks)
        {
            scheduler->add(task);
        }
        tasks[1]->cancel();
        tasks[0]->finish();
        assert(tasks[1]->runs() == 0);
        assert(tasks[2]->running());
        tasks[2]->finish();

        const std::vector<std::string> expected{"start t0", "done t0", "done t1", "start t2", "done t2", "idle"};
        assert(recorder.events == expected);
        assert(recorder.outcomes[1].cancelled());
        assert(recorder.outcomes[1].error == ErrorCode::Cancelled);
    }

    void test_empty_keeps_running_tasks()
    {
        auto scheduler = std::make_shared<Scheduler>(SchedulerOptions{.concurrency = 1});
        Recorder recorder;
        recorder.attach(scheduler);

        auto tasks = manual_tasks(3);
        for (const auto &task : tasks)
        {
            scheduler->add(task);
        }
        scheduler->empty();
        assert(scheduler->queued() == 0);
        assert(scheduler->running() == 1);
        assert(recorder.idle == 0);

        tasks[0]->finish(TaskOutcome::cancellation());
        assert(recorder.idle == 1);
        assert(tasks[1]->runs() == 0);
        assert(tasks[2]->runs() == 0);
        assert(recorder.outcomes.size() == 1);
    }

    void test_completion_is_called_once()
    {
        class DoubleCompletion final : public Task
        {
        public:
            void run(Completion on_complete) override
            {
                on_complete(TaskOutcome::success());
                on_complete(TaskOutcome::failure(ErrorCode::InternalError, "again"));
            }
            void cancel() override {}
            bool cancelled() const override { return false; }
            std::string describe() const override { return "double"; }
        };

        auto scheduler = std::make_shared<Scheduler>();
        Recorder recorder;
        recorder.attach(scheduler);
        scheduler->add(std::make_shared<DoubleCompletion>());
        assert(recorder.outcomes.size() == 1);
        assert(recorder.outcomes[0].ok());
        assert(scheduler->running() == 0);
        assert(recorder.idle == 1);
    }

    void test_throwing_start_listener_fails_only_that_task()
    {
        auto scheduler = std::make_shared<Scheduler>(SchedulerOptions{.concurrency = 1});
        Recorder recorder;
        recorder.attach(scheduler);
        int throws = 1;
        scheduler->on_task_start([&throws](const TaskPtr &)
                                 {
            if (throws > 0) {
                --throws;
                throw std::runtime_error("listener");
            } });

        auto tasks = manual_tasks(2);
        scheduler->add(tasks[0]);
        assert(tasks[0]->runs() == 0);
        assert(scheduler->running() == 0);
        assert(recorder.outcomes.size() == 1);
        assert(recorder.outcomes[0].failed());
        assert(recorder.outcomes[0].message == "listener");
        assert(recorder.idle == 1);

        scheduler->add(tasks[1]);
        scheduler->start();
        assert(tasks[1]->running());
        tasks[1]->finish();

        const std::vector<std::string> expected{"start t0", "done t0", "idle", "start t1", "done t1", "idle"};
        assert(recorder.events == expected);
        assert(scheduler->size() == 0);
    }

    void test_throwing_done_listener_keeps_the_queue_moving()
    {
        auto scheduler = std::make_shared<Scheduler>(SchedulerOptions{.concurrency = 1});
        scheduler->on_task_done([](const TaskOutcome &, const TaskPtr &)
                                { throw std::runtime_error("listener"); });
        Recorder recorder;
        recorder.attach(scheduler);

        auto tasks = manual_tasks(2);
        scheduler->add(tasks[0]);
        scheduler->add(tasks[1]);
        tasks[0]->finish();
        assert(tasks[1]->running());
        tasks[1]->finish();
        assert(recorder.idle == 1);
        assert(scheduler->size() == 0);
    }

    void test_zero_concurrency_is_clamped()
    {
        auto scheduler = std::make_shared<Scheduler>(SchedulerOptions{.concurrency = 0});
        assert(scheduler->concurrency() == 1);
        auto tasks = manual_tasks(2);
        scheduler->add(tasks[0]);
        scheduler->add(tasks[1]);
        assert(scheduler->running() == 1);
        tasks[0]->finish();
        tasks[1]->finish();
        assert(scheduler->size() == 0);
    }

} // namespace

void run_scheduler_tests()
{
    test_concurrency_bound_and_fifo();
    test_idle_once_per_run();
    test_failure_isolation();
    test_cancel_before_start();
    test_empty_keeps_running_tasks();
    test_completion_is_called_once();
    test_throwing_start_listener_fails_only_that_task();
    test_throwing_done_listener_keeps_the_queue_moving();
    test_zero_concurrency_is_clamped();
}
