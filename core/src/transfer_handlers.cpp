#include "ferry/transfer_handlers.hpp"

#include <set>

#include <spdlog/spdlog.h>

#include "ferry/errors.hpp"
#include "ferry/path_utils.hpp"

namespace ferry
{

    namespace
    {

        struct WalkEntry
        {
            std::string relative;
            bool is_directory{};
        };

        class PathFilter
        {
        public:
            PathFilter(const ServiceConfig &config, const HandlerOptions &options)
                : config_ignore_(config.ignore), extra_ignore_(options.ignore) {}

            bool excluded(const std::string &path) const
            {
                return (config_ignore_ && config_ignore_(path)) || (extra_ignore_ && extra_ignore_(path));
            }

        private:
            IgnorePredicate config_ignore_;
            IgnorePredicate extra_ignore_;
        };

        bool excluded_entry(const PathFilter &filter, const FileEntry &entry)
        {
            return filter.excluded(entry.is_directory() ? entry.path + "/" : entry.path);
        }

        // root first, then everything below it that the filter lets through
        std::vector<WalkEntry> walk(const FileSystem &fs, const std::string &root, const PathFilter &filter)
        {
            std::vector<WalkEntry> entries;
            const auto root_entry = fs.stat(root);
            entries.push_back(WalkEntry{.relative = {}, .is_directory = root_entry.is_directory()});
            if (!root_entry.is_directory())
            {
                return entries;
            }

            std::vector<std::string> pending{root};
            while (!pending.empty())
            {
                auto directory = std::move(pending.back());
                pending.pop_back();
                for (const auto &entry : fs.list(directory))
                {
                    if (excluded_entry(filter, entry))
                    {
                        continue;
                    }
                    entries.push_back(WalkEntry{.relative = paths::relative(root, entry.path),
                                                .is_directory = entry.is_directory()});
                    if (entry.is_directory())
                    {
                        pending.push_back(entry.path);
                    }
                }
            }
            return entries;
        }

        // Topmost entries below root that have no counterpart in `keep`.
        void collect_extraneous(const FileSystem &fs, const std::string &root, const std::string &directory,
                                const std::set<std::string> &keep, const PathFilter &filter,
                                std::vector<std::string> &out)
        {
            for (const auto &entry : fs.list(directory))
            {
                if (excluded_entry(filter, entry))
                {
                    continue;
                }
                const auto relative = paths::relative(root, entry.path);
                if (keep.find(relative) == keep.end())
                {
                    out.push_back(relative);
                }
                else if (entry.is_directory())
                {
                    collect_extraneous(fs, root, entry.path, keep, filter, out);
                }
            }
        }

        TransferEndpoints endpoints_for(const TransferTarget &target, const std::string &relative,
                                        const std::shared_ptr<FileSystem> &local_fs,
                                        const std::shared_ptr<FileSystem> &remote_fs)
        {
            return TransferEndpoints{
                .local_path = paths::join(target.local_path, relative),
                .remote_path = paths::join(target.remote_path, relative),
                .local_fs = local_fs,
                .remote_fs = remote_fs,
            };
        }

        TransferReport summarize(const std::vector<TransferTaskPtr> &tasks, TransferReport report)
        {
            for (const auto &task : tasks)
            {
                const auto &outcome = task->outcome();
                if (!outcome || outcome->cancelled())
                {
                    ++report.cancelled;
                }
                else if (outcome->failed())
                {
                    ++report.failed;
                    report.errors.push_back(task->describe() + ": " + outcome->message);
                }
                else
                {
                    ++report.succeeded;
                    const auto *sync = dynamic_cast<const SyncFileTask *>(task.get());
                    if (sync != nullptr && sync->skipped())
                    {
                        ++report.skipped;
                    }
                }
            }
            return report;
        }

        void run_batch(FileService &service, std::size_t concurrency, std::vector<TransferTaskPtr> tasks,
                       TransferCallback on_complete)
        {
            auto scheduler = service.create_transfer_scheduler(concurrency);
            for (const auto &task : tasks)
            {
                scheduler.add(task);
            }
            spdlog::debug("Running batch of {} task(s) with concurrency {}", tasks.size(), concurrency);
            scheduler.run([tasks = std::move(tasks), on_complete = std::move(on_complete)]()
                          {
                const auto report = summarize(tasks, {});
                if (on_complete) {
                    on_complete(report);
                } });
        }

        void report_failure(const TransferCallback &on_complete, const std::string &what, const TransferError &error)
        {
            spdlog::error("{} failed: {}", what, error.what());
            TransferReport report;
            report.failed = 1;
            report.errors.push_back(what + ": " + error.what());
            if (on_complete)
            {
                on_complete(report);
            }
        }

        using TaskFactory = std::function<TransferTaskPtr(const TransferEndpoints &)>;

        void copy_tree(FileService &service, const ServiceConfig &config, const TransferTarget &target,
                       TransferDirection direction, const TaskFactory &make_task, TransferCallback on_complete,
                       const HandlerOptions &options, bool delete_extraneous)
        {
            const PathFilter filter(config, options);
            const bool to_remote = direction == TransferDirection::LocalToRemote;
            const auto &source_root = to_remote ? target.local_path : target.remote_path;
            const auto &target_root = to_remote ? target.remote_path : target.local_path;
            const auto concurrency = options.concurrency.value_or(config.concurrency);

            std::vector<TransferTaskPtr> tasks;
            try
            {
                auto local_fs = service.local_file_system();
                auto remote_fs = service.remote_file_system(config);
                const auto &source_fs = to_remote ? *local_fs : *remote_fs;
                const auto &target_fs = to_remote ? *remote_fs : *local_fs;

                if (filter.excluded(source_root))
                {
                    spdlog::info("{} is ignored", source_root);
                }
                else
                {
                    const auto entries = walk(source_fs, source_root, filter);
                    std::set<std::string> keep;
                    for (const auto &entry : entries)
                    {
                        keep.insert(entry.relative);
                        tasks.push_back(make_task(endpoints_for(target, entry.relative, local_fs, remote_fs)));
                    }

                    if (delete_extraneous && entries.front().is_directory && target_fs.exists(target_root) &&
                        target_fs.stat(target_root).is_directory())
                    {
                        std::vector<std::string> extraneous;
                        collect_extraneous(target_fs, target_root, target_root, keep, filter, extraneous);
                        for (const auto &relative : extraneous)
                        {
                            tasks.push_back(std::make_shared<RemoveFileTask>(
                                service.io_context(), to_remote ? FileSide::Remote : FileSide::Local,
                                endpoints_for(target, relative, local_fs, remote_fs)));
                        }
                    }
                }
            }
            catch (const TransferError &ex)
            {
                report_failure(on_complete, "Listing " + source_root, ex);
                return;
            }

            run_batch(service, concurrency, std::move(tasks), std::move(on_complete));
        }

    } // namespace

    TransferTarget target_from_local(const FileService &service, const ServiceConfig &config,
                                     const std::string &local_path)
    {
        const auto base = paths::normalize(service.base_dir().generic_string());
        const auto path = paths::normalize(local_path);
        if (!paths::is_within(base, path))
        {
            throw TransferError(ErrorCode::PermissionDenied, path + " is outside of " + base);
        }
        return TransferTarget{.local_path = path,
                              .remote_path = paths::join(config.remote_path, paths::relative(base, path))};
    }

    TransferTarget target_from_remote(const FileService &service, const ServiceConfig &config,
                                      const std::string &remote_path)
    {
        const auto root = paths::normalize(config.remote_path);
        const auto path = paths::normalize(remote_path);
        if (!paths::is_within(root, path))
        {
            throw TransferError(ErrorCode::PermissionDenied, path + " is outside of " + root);
        }
        return TransferTarget{.local_path = paths::join(service.base_dir().generic_string(), paths::relative(root, path)),
                              .remote_path = path};
    }

    void upload(FileService &service, const ServiceConfig &config, const TransferTarget &target,
                TransferCallback on_complete, HandlerOptions options)
    {
        auto &io_context = service.io_context();
        copy_tree(
            service, config, target, TransferDirection::LocalToRemote,
            [&io_context](const TransferEndpoints &endpoints) -> TransferTaskPtr
            {
                return std::make_shared<CopyFileTask>(io_context, TransferKind::Upload, TransferDirection::LocalToRemote,
                                                      endpoints);
            },
            std::move(on_complete), options, false);
    }

    void download(FileService &service, const ServiceConfig &config, const TransferTarget &target,
                  TransferCallback on_complete, HandlerOptions options)
    {
        auto &io_context = service.io_context();
        copy_tree(
            service, config, target, TransferDirection::RemoteToLocal,
            [&io_context](const TransferEndpoints &endpoints) -> TransferTaskPtr
            {
                return std::make_shared<CopyFileTask>(io_context, TransferKind::Download,
                                                      TransferDirection::RemoteToLocal, endpoints);
            },
            std::move(on_complete), options, false);
    }

    void remove_remote(FileService &service, const ServiceConfig &config, const TransferTarget &target,
                       TransferCallback on_complete, HandlerOptions options)
    {
        const PathFilter filter(config, options);
        std::vector<TransferTaskPtr> tasks;
        if (filter.excluded(target.remote_path))
        {
            spdlog::info("{} is ignored", target.remote_path);
        }
        else
        {
            try
            {
                tasks.push_back(std::make_shared<RemoveFileTask>(
                    service.io_context(), FileSide::Remote,
                    endpoints_for(target, {}, service.local_file_system(), service.remote_file_system(config))));
            }
            catch (const TransferError &ex)
            {
                report_failure(on_complete, "Connecting for " + target.remote_path, ex);
                return;
            }
        }
        run_batch(service, options.concurrency.value_or(config.concurrency), std::move(tasks), std::move(on_complete));
    }

    void sync_to_remote(FileService &service, const ServiceConfig &config, const TransferTarget &target,
                        TransferCallback on_complete, HandlerOptions options)
    {
        auto &io_context = service.io_context();
        const auto option = config.sync_option;
        const auto offset = config.remote_time_offset_in_hours;
        copy_tree(
            service, config, target, TransferDirection::LocalToRemote,
            [&io_context, option, offset](const TransferEndpoints &endpoints) -> TransferTaskPtr
            {
                return std::make_shared<SyncFileTask>(io_context, TransferDirection::LocalToRemote, endpoints, option,
                                                      offset);
            },
            std::move(on_complete), options, option.delete_extraneous);
    }

    void sync_to_local(FileService &service, const ServiceConfig &config, const TransferTarget &target,
                       TransferCallback on_complete, HandlerOptions options)
    {
        auto &io_context = service.io_context();
        const auto option = config.sync_option;
        const auto offset = config.remote_time_offset_in_hours;
        copy_tree(
            service, config, target, TransferDirection::RemoteToLocal,
            [&io_context, option, offset](const TransferEndpoints &endpoints) -> TransferTaskPtr
            {
                return std::make_shared<SyncFileTask>(io_context, TransferDirection::RemoteToLocal, endpoints, option,
                                                      offset);
            },
            std::move(on_complete), options, option.delete_extraneous);
    }

} // namespace ferry
