/**
 * Ferry - Cancellable file operations run by the scheduler.
 */
#pragma once

#include <asio/io_context.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include "ferry/config.hpp"
#include "ferry/file_system.hpp"
#include "ferry/scheduler.hpp"

namespace ferry
{

    enum class TransferKind : std::uint8_t
    {
        Upload,
        Download,
        Delete,
        Sync
    };

    std::string_view to_string(TransferKind kind) noexcept;

    enum class TransferDirection : std::uint8_t
    {
        LocalToRemote,
        RemoteToLocal
    };

    enum class FileSide : std::uint8_t
    {
        Local,
        Remote
    };

    struct TransferEndpoints
    {
        std::string local_path;
        std::string remote_path;
        std::shared_ptr<FileSystem> local_fs;
        std::shared_ptr<FileSystem> remote_fs;
    };

    class TransferTask : public Task
    {
    public:
        TransferTask(TransferKind kind, std::string local_path, std::string remote_path);

        TransferKind kind() const noexcept { return kind_; }
        const std::string &local_path() const noexcept { return local_path_; }
        const std::string &remote_path() const noexcept { return remote_path_; }

        void run(Completion on_complete) final;
        void cancel() override;
        bool cancelled() const override;
        std::string describe() const override;

        std::stop_token stop_token() const noexcept { return stop_source_.get_token(); }
        const std::optional<TaskOutcome> &outcome() const noexcept { return outcome_; }

    protected:
        virtual void execute(Completion on_complete) = 0;

    private:
        TransferKind kind_;
        std::string local_path_;
        std::string remote_path_;
        std::stop_source stop_source_;
        std::optional<TaskOutcome> outcome_;
    };

    using TransferTaskPtr = std::shared_ptr<TransferTask>;

    /**
     * Streams one file between the local and the remote file system in fixed size
     * chunks. Each chunk is posted to the io_context and the stop token is checked
     * before every chunk. A partially written target is left as is on cancellation.
     */
    class CopyFileTask : public TransferTask
    {
    public:
        static constexpr std::size_t kChunkSize = 64 * 1024;

        CopyFileTask(asio::io_context &io_context, TransferKind kind, TransferDirection direction,
                     TransferEndpoints endpoints);

        TransferDirection direction() const noexcept { return direction_; }
        std::uint64_t bytes_transferred() const noexcept { return bytes_transferred_; }

    protected:
        void execute(Completion on_complete) override;

        const std::string &source_path() const;
        const std::string &target_path() const;
        const FileSystem &source_fs() const;
        const FileSystem &target_fs() const;

        asio::io_context &io_context_;

    private:
        struct CopyState
        {
            std::unique_ptr<std::istream> reader;
            std::unique_ptr<std::ostream> writer;
            std::vector<char> buffer;
        };

        void copy_next_chunk(std::shared_ptr<CopyState> state, Completion on_complete);

        TransferDirection direction_;
        TransferEndpoints endpoints_;
        std::uint64_t bytes_transferred_{0};
    };

    // A copy that may be skipped according to the sync policy.
    class SyncFileTask final : public CopyFileTask
    {
    public:
        SyncFileTask(asio::io_context &io_context, TransferDirection direction, TransferEndpoints endpoints,
                     SyncOption option, double remote_time_offset_in_hours = 0);

        bool skipped() const noexcept { return skipped_; }

    protected:
        void execute(Completion on_complete) override;

    private:
        std::int64_t local_time(std::int64_t modified_time, bool remote) const;

        SyncOption option_;
        double remote_time_offset_in_hours_;
        bool skipped_{false};
    };

    class RemoveFileTask final : public TransferTask
    {
    public:
        RemoveFileTask(asio::io_context &io_context, FileSide side, TransferEndpoints endpoints);

        FileSide side() const noexcept { return side_; }

    protected:
        void execute(Completion on_complete) override;

    private:
        asio::io_context &io_context_;
        FileSide side_;
        TransferEndpoints endpoints_;
    };

} // namespace ferry
