/**
 * Ferry - Per-connection transfer orchestration.
 */
#pragma once

#include <asio/io_context.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "ferry/app_context.hpp"
#include "ferry/config.hpp"
#include "ferry/file_system.hpp"
#include "ferry/listeners.hpp"
#include "ferry/scheduler.hpp"
#include "ferry/transfer_task.hpp"
#include "ferry/watcher.hpp"

namespace ferry
{

    class FileService;

    // Handle to one batch of transfers created by FileService::create_transfer_scheduler.
    class TransferScheduler
    {
    public:
        std::size_t size() const noexcept;

        void add(TransferTaskPtr task);

        // Starts the batch; on_complete runs once it is idle. Task failures never fail the batch.
        void run(std::function<void()> on_complete);

    private:
        friend class FileService;

        TransferScheduler(FileService &service, std::shared_ptr<Scheduler> scheduler);

        FileService *service_;
        std::weak_ptr<const bool> service_alive_;
        std::shared_ptr<Scheduler> scheduler_;
    };

    class FileService
    {
    public:
        using BeforeTransferListener = std::function<void(const TransferTask &)>;
        using AfterTransferListener = std::function<void(const TaskOutcome &, const TransferTask &)>;

        FileService(asio::io_context &io_context, AppContext &context, std::filesystem::path base_dir,
                    std::string workspace, FileServiceConfig config);

        // Cancels outstanding transfers. Tasks still running finish on the io_context
        // without reaching this service; pending run() callbacks still complete.
        ~FileService();

        FileService(const FileService &) = delete;
        FileService &operator=(const FileService &) = delete;

        std::uint64_t id() const noexcept { return id_; }
        const std::string &name() const noexcept { return name_; }
        void set_name(std::string name) { name_ = std::move(name); }
        const std::filesystem::path &base_dir() const noexcept { return base_dir_; }
        const std::string &workspace() const noexcept { return workspace_; }
        asio::io_context &io_context() noexcept { return io_context_; }

        void set_config_validator(ConfigValidator validator);

        // Disposes the current watch registration and registers the base directory with `watcher`.
        void set_watcher_service(std::shared_ptr<WatcherService> watcher);

        std::vector<std::string> available_profiles() const;

        std::vector<TransferTaskPtr> pending_transfer_tasks() const;

        bool is_transferring() const noexcept { return !schedulers_.empty(); }

        /**
         * Drops every queued task, forgets the active schedulers, then signals every
         * started task to stop. Returns without waiting for running tasks; their
         * schedulers still go idle and complete pending run() calls.
         */
        void cancel_transfer_tasks();

        ListenerId before_transfer(BeforeTransferListener listener);
        ListenerId after_transfer(AfterTransferListener listener);

        TransferScheduler create_transfer_scheduler(std::size_t concurrency);

        std::shared_ptr<FileSystem> local_file_system() const;
        std::shared_ptr<FileSystem> remote_file_system(const ServiceConfig &config);

        // Re-resolved on every call so profile and environment changes apply immediately.
        ServiceConfig get_config() const;

        void dispose();

    private:
        friend class TransferScheduler;

        void remove_scheduler(const std::shared_ptr<Scheduler> &scheduler);
        void create_watcher();
        void dispose_watcher();
        void dispose_file_system();

        std::uint64_t id_;
        asio::io_context &io_context_;
        AppContext &context_;
        std::filesystem::path base_dir_;
        std::string workspace_;
        std::string name_;
        FileServiceConfig config_;
        WatcherConfig watcher_config_;
        std::vector<std::string> profiles_;
        ConfigValidator validator_;
        std::shared_ptr<WatcherService> watcher_;
        std::shared_ptr<FileSystem> local_fs_;

        std::vector<TaskPtr> pending_tasks_;
        std::vector<std::shared_ptr<Scheduler>> schedulers_;

        ListenerList<const TransferTask &> before_transfer_;
        ListenerList<const TaskOutcome &, const TransferTask &> after_transfer_;

        // expires with the service; scheduler listeners check it before touching members
        std::shared_ptr<const bool> alive_;
    };

} // namespace ferry
