#include "ferry/file_service.hpp"

#include <algorithm>
#include <atomic>

#include <spdlog/spdlog.h>

#include "ferry/errors.hpp"

namespace ferry
{

    namespace
    {
        std::atomic<std::uint64_t> next_service_id{0};

        const TransferTask &as_transfer(const TaskPtr &task)
        {
            // only TransferScheduler::add feeds these schedulers
            return static_cast<const TransferTask &>(*task);
        }
    } // namespace

    TransferScheduler::TransferScheduler(FileService &service, std::shared_ptr<Scheduler> scheduler)
        : service_(&service), service_alive_(service.alive_), scheduler_(std::move(scheduler))
    {
    }

    std::size_t TransferScheduler::size() const noexcept
    {
        return scheduler_->size();
    }

    void TransferScheduler::add(TransferTaskPtr task)
    {
        scheduler_->add(std::move(task));
    }

    void TransferScheduler::run(std::function<void()> on_complete)
    {
        if (scheduler_->size() == 0)
        {
            if (!service_alive_.expired())
            {
                service_->remove_scheduler(scheduler_);
            }
            if (on_complete)
            {
                on_complete();
            }
            return;
        }

        auto listener_id = std::make_shared<ListenerId>(0);
        *listener_id = scheduler_->on_idle(
            [service = service_, alive = service_alive_, weak = std::weak_ptr<Scheduler>(scheduler_), listener_id,
             on_complete = std::move(on_complete)]()
            {
                auto scheduler = weak.lock();
                if (!scheduler)
                {
                    return;
                }
                scheduler->remove_idle_listener(*listener_id);
                if (!alive.expired())
                {
                    service->remove_scheduler(scheduler);
                }
                if (on_complete)
                {
                    on_complete();
                }
            });
        scheduler_->start();
    }

    FileService::FileService(asio::io_context &io_context, AppContext &context, std::filesystem::path base_dir,
                             std::string workspace, FileServiceConfig config)
        : id_(++next_service_id),
          io_context_(io_context),
          context_(context),
          base_dir_(std::move(base_dir)),
          workspace_(std::move(workspace)),
          config_(std::move(config)),
          watcher_config_(config_.watcher),
          watcher_(std::make_shared<NullWatcherService>()),
          local_fs_(std::make_shared<LocalFileSystem>()),
          alive_(std::make_shared<const bool>(true))
    {
        for (const auto &[profile, overrides] : config_.profiles)
        {
            profiles_.push_back(profile);
        }
    }

    FileService::~FileService()
    {
        if (is_transferring() || !pending_tasks_.empty())
        {
            cancel_transfer_tasks();
        }
        alive_.reset();
    }

    void FileService::set_config_validator(ConfigValidator validator)
    {
        validator_ = std::move(validator);
    }

    void FileService::set_watcher_service(std::shared_ptr<WatcherService> watcher)
    {
        if (watcher_)
        {
            dispose_watcher();
        }
        watcher_ = watcher ? std::move(watcher) : std::make_shared<NullWatcherService>();
        create_watcher();
    }

    std::vector<std::string> FileService::available_profiles() const
    {
        return profiles_;
    }

    std::vector<TransferTaskPtr> FileService::pending_transfer_tasks() const
    {
        std::vector<TransferTaskPtr> tasks;
        tasks.reserve(pending_tasks_.size());
        for (const auto &task : pending_tasks_)
        {
            tasks.push_back(std::static_pointer_cast<TransferTask>(task));
        }
        return tasks;
    }

    void FileService::cancel_transfer_tasks()
    {
        spdlog::info("Cancelling transfers: {} scheduler(s), {} running task(s)", schedulers_.size(),
                     pending_tasks_.size());

        // keep the order so every drained scheduler still reaches idle:
        // 1. remove tasks that have not started. A drained scheduler with nothing
        //    running goes idle inside empty() and unregisters itself.
        auto schedulers = std::move(schedulers_);
        schedulers_.clear();
        for (const auto &scheduler : schedulers)
        {
            scheduler->empty();
        }

        // 2. signal running tasks
        auto running = std::move(pending_tasks_);
        pending_tasks_.clear();
        for (const auto &task : running)
        {
            task->cancel();
        }
    }

    ListenerId FileService::before_transfer(BeforeTransferListener listener)
    {
        return before_transfer_.add(std::move(listener));
    }

    ListenerId FileService::after_transfer(AfterTransferListener listener)
    {
        return after_transfer_.add(std::move(listener));
    }

    TransferScheduler FileService::create_transfer_scheduler(std::size_t concurrency)
    {
        auto scheduler = std::make_shared<Scheduler>(SchedulerOptions{.concurrency = concurrency, .auto_start = false});
        schedulers_.push_back(scheduler);

        scheduler->on_task_start([this, alive = std::weak_ptr<const bool>(alive_)](const TaskPtr &task)
                                 {
            if (alive.expired()) {
                return;
            }
            pending_tasks_.push_back(task);
            before_transfer_.emit(as_transfer(task)); });
        scheduler->on_task_done([this, alive = std::weak_ptr<const bool>(alive_)](const TaskOutcome &outcome, const TaskPtr &task)
                                {
            if (alive.expired()) {
                return;
            }
            pending_tasks_.erase(std::remove(pending_tasks_.begin(), pending_tasks_.end(), task), pending_tasks_.end());
            after_transfer_.emit(outcome, as_transfer(task)); });

        return TransferScheduler(*this, std::move(scheduler));
    }

    std::shared_ptr<FileSystem> FileService::local_file_system() const
    {
        return local_fs_;
    }

    std::shared_ptr<FileSystem> FileService::remote_file_system(const ServiceConfig &config)
    {
        return context_.remotes.create_remote_if_none_exist(host_info(config));
    }

    ServiceConfig FileService::get_config() const
    {
        return resolve_config(config_, context_.active_profile, base_dir_, context_.ignore_file_cache, validator_);
    }

    void FileService::dispose()
    {
        dispose_watcher();
        watcher_ = std::make_shared<NullWatcherService>();
        dispose_file_system();
    }

    void FileService::remove_scheduler(const std::shared_ptr<Scheduler> &scheduler)
    {
        schedulers_.erase(std::remove(schedulers_.begin(), schedulers_.end(), scheduler), schedulers_.end());
    }

    void FileService::create_watcher()
    {
        watcher_->create(base_dir_, watcher_config_);
    }

    void FileService::dispose_watcher()
    {
        watcher_->dispose(base_dir_);
    }

    void FileService::dispose_file_system()
    {
        try
        {
            context_.remotes.remove_remote(host_info(get_config()));
        }
        catch (const ConfigError &ex)
        {
            spdlog::warn("Could not release remote file system for {}: {}", base_dir_.string(), ex.what());
        }
    }

} // namespace ferry
