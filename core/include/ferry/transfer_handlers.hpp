/**
 * Ferry - Entry points used by the command layer.
 *
 * Each handler expands a target into file tasks, runs them as one batch on the
 * File Service and reports once the batch is idle. The completion callback is the
 * place to refresh explorers and status displays.
 */
#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "ferry/config.hpp"
#include "ferry/file_service.hpp"

namespace ferry
{

    struct TransferTarget
    {
        std::string local_path;
        std::string remote_path;
    };

    // Maps a path below the service's base directory to its remote counterpart.
    // Throws TransferError (PermissionDenied) for a path outside of the base directory.
    TransferTarget target_from_local(const FileService &service, const ServiceConfig &config,
                                     const std::string &local_path);

    // Maps a path below remotePath to its local counterpart. Same error for paths outside of remotePath.
    TransferTarget target_from_remote(const FileService &service, const ServiceConfig &config,
                                      const std::string &remote_path);

    struct TransferReport
    {
        std::size_t succeeded{0};
        std::size_t failed{0};
        std::size_t cancelled{0};
        std::size_t skipped{0};
        std::vector<std::string> errors;

        std::size_t total() const noexcept { return succeeded + failed + cancelled; }
        bool ok() const noexcept { return failed == 0 && cancelled == 0; }
    };

    using TransferCallback = std::function<void(const TransferReport &)>;

    struct HandlerOptions
    {
        // applied on top of the config's ignore predicate
        IgnorePredicate ignore;
        // nullopt uses config.concurrency
        std::optional<std::size_t> concurrency;
    };

    // Failures before anything is queued (listing, opening the remote) arrive as one failed entry.
    void upload(FileService &service, const ServiceConfig &config, const TransferTarget &target,
                TransferCallback on_complete, HandlerOptions options = {});

    void download(FileService &service, const ServiceConfig &config, const TransferTarget &target,
                  TransferCallback on_complete, HandlerOptions options = {});

    void remove_remote(FileService &service, const ServiceConfig &config, const TransferTarget &target,
                       TransferCallback on_complete, HandlerOptions options = {});

    void sync_to_remote(FileService &service, const ServiceConfig &config, const TransferTarget &target,
                        TransferCallback on_complete, HandlerOptions options = {});

    void sync_to_local(FileService &service, const ServiceConfig &config, const TransferTarget &target,
                       TransferCallback on_complete, HandlerOptions options = {});

} // namespace ferry
