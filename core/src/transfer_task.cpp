#include "ferry/transfer_task.hpp"

#include <asio/post.hpp>

#include <spdlog/spdlog.h>

#include "ferry/errors.hpp"
#include "ferry/path_utils.hpp"

namespace ferry
{

    std::string_view to_string(TransferKind kind) noexcept
    {
        switch (kind)
        {
        case TransferKind::Upload:
            return "upload";
        case TransferKind::Download:
            return "download";
        case TransferKind::Delete:
            return "delete";
        case TransferKind::Sync:
            return "sync";
        }
        return "unknown";
    }

    TransferTask::TransferTask(TransferKind kind, std::string local_path, std::string remote_path)
        : kind_(kind), local_path_(std::move(local_path)), remote_path_(std::move(remote_path))
    {
    }

    void TransferTask::run(Completion on_complete)
    {
        auto self = std::static_pointer_cast<TransferTask>(shared_from_this());
        execute([self, on_complete = std::move(on_complete)](TaskOutcome outcome)
                {
            self->outcome_ = outcome;
            if (on_complete) {
                on_complete(std::move(outcome));
            } });
    }

    void TransferTask::cancel()
    {
        if (stop_source_.request_stop())
        {
            spdlog::debug("Cancel requested for {}", describe());
        }
    }

    bool TransferTask::cancelled() const
    {
        return stop_source_.stop_requested();
    }

    std::string TransferTask::describe() const
    {
        return std::string(to_string(kind_)) + " " + local_path_ + " <-> " + remote_path_;
    }

    CopyFileTask::CopyFileTask(asio::io_context &io_context, TransferKind kind, TransferDirection direction,
                               TransferEndpoints endpoints)
        : TransferTask(kind, endpoints.local_path, endpoints.remote_path),
          io_context_(io_context),
          direction_(direction),
          endpoints_(std::move(endpoints))
    {
    }

    const std::string &CopyFileTask::source_path() const
    {
        return direction_ == TransferDirection::LocalToRemote ? endpoints_.local_path : endpoints_.remote_path;
    }

    const std::string &CopyFileTask::target_path() const
    {
        return direction_ == TransferDirection::LocalToRemote ? endpoints_.remote_path : endpoints_.local_path;
    }

    const FileSystem &CopyFileTask::source_fs() const
    {
        return direction_ == TransferDirection::LocalToRemote ? *endpoints_.local_fs : *endpoints_.remote_fs;
    }

    const FileSystem &CopyFileTask::target_fs() const
    {
        return direction_ == TransferDirection::LocalToRemote ? *endpoints_.remote_fs : *endpoints_.local_fs;
    }

    void CopyFileTask::execute(Completion on_complete)
    {
        if (stop_token().stop_requested())
        {
            on_complete(TaskOutcome::cancellation());
            return;
        }

        auto state = std::make_shared<CopyState>();
        try
        {
            const auto source = source_fs().stat(source_path());
            if (source.is_directory())
            {
                target_fs().ensure_dir(target_path());
                on_complete(TaskOutcome::success());
                return;
            }
            target_fs().ensure_dir(paths::dirname(target_path()));
            state->reader = source_fs().open_read(source_path());
            state->writer = target_fs().open_write(target_path());
        }
        catch (const TransferError &ex)
        {
            on_complete(TaskOutcome::failure(ex.code(), ex.what()));
            return;
        }
        state->buffer.resize(kChunkSize);

        auto self = std::static_pointer_cast<CopyFileTask>(shared_from_this());
        asio::post(io_context_, [self, state = std::move(state), on_complete = std::move(on_complete)]() mutable
                   { self->copy_next_chunk(std::move(state), std::move(on_complete)); });
    }

    void CopyFileTask::copy_next_chunk(std::shared_ptr<CopyState> state, Completion on_complete)
    {
        if (stop_token().stop_requested())
        {
            spdlog::debug("{} stopped after {} bytes", describe(), bytes_transferred_);
            state->writer->flush();
            on_complete(TaskOutcome::cancellation());
            return;
        }

        auto &reader = *state->reader;
        auto &writer = *state->writer;
        reader.read(state->buffer.data(), static_cast<std::streamsize>(state->buffer.size()));
        const auto count = reader.gcount();
        if (reader.bad())
        {
            on_complete(TaskOutcome::failure(ErrorCode::IoError, "Read failed for " + source_path()));
            return;
        }
        if (count > 0)
        {
            writer.write(state->buffer.data(), count);
            if (!writer)
            {
                on_complete(TaskOutcome::failure(ErrorCode::IoError, "Write failed for " + target_path()));
                return;
            }
            bytes_transferred_ += static_cast<std::uint64_t>(count);
        }

        if (reader.eof() || count == 0)
        {
            writer.flush();
            if (!writer)
            {
                on_complete(TaskOutcome::failure(ErrorCode::IoError, "Write failed for " + target_path()));
                return;
            }
            on_complete(TaskOutcome::success());
            return;
        }

        auto self = std::static_pointer_cast<CopyFileTask>(shared_from_this());
        asio::post(io_context_, [self, state = std::move(state), on_complete = std::move(on_complete)]() mutable
                   { self->copy_next_chunk(std::move(state), std::move(on_complete)); });
    }

    SyncFileTask::SyncFileTask(asio::io_context &io_context, TransferDirection direction, TransferEndpoints endpoints,
                               SyncOption option, double remote_time_offset_in_hours)
        : CopyFileTask(io_context, TransferKind::Sync, direction, std::move(endpoints)),
          option_(option),
          remote_time_offset_in_hours_(remote_time_offset_in_hours)
    {
    }

    void SyncFileTask::execute(Completion on_complete)
    {
        if (stop_token().stop_requested())
        {
            on_complete(TaskOutcome::cancellation());
            return;
        }

        bool skip = false;
        try
        {
            const bool target_exists = target_fs().exists(target_path());
            if (option_.skip_create && !target_exists)
            {
                skip = true;
            }
            else if (option_.ignore_existing && target_exists)
            {
                skip = true;
            }
            else if (option_.update && target_exists)
            {
                const bool source_is_remote = direction() == TransferDirection::RemoteToLocal;
                const auto source = source_fs().stat(source_path());
                const auto target = target_fs().stat(target_path());
                const auto source_time = local_time(source.modified_time, source_is_remote);
                const auto target_time = local_time(target.modified_time, !source_is_remote);
                skip = target_time > source_time || (target_time == source_time && target.size == source.size);
            }
        }
        catch (const TransferError &ex)
        {
            on_complete(TaskOutcome::failure(ex.code(), ex.what()));
            return;
        }

        if (skip)
        {
            skipped_ = true;
            spdlog::debug("Skipping {}", describe());
            on_complete(TaskOutcome::success());
            return;
        }
        CopyFileTask::execute(std::move(on_complete));
    }

    std::int64_t SyncFileTask::local_time(std::int64_t modified_time, bool remote) const
    {
        // remote clock = local clock + offset
        if (!remote)
        {
            return modified_time;
        }
        return modified_time - static_cast<std::int64_t>(remote_time_offset_in_hours_ * 3600);
    }

    RemoveFileTask::RemoveFileTask(asio::io_context &io_context, FileSide side, TransferEndpoints endpoints)
        : TransferTask(TransferKind::Delete, endpoints.local_path, endpoints.remote_path),
          io_context_(io_context),
          side_(side),
          endpoints_(std::move(endpoints))
    {
    }

    void RemoveFileTask::execute(Completion on_complete)
    {
        auto self = std::static_pointer_cast<RemoveFileTask>(shared_from_this());
        asio::post(io_context_, [self, on_complete = std::move(on_complete)]()
                   {
            if (self->cancelled()) {
                on_complete(TaskOutcome::cancellation());
                return;
            }
            const bool local = self->side_ == FileSide::Local;
            const auto &fs = local ? *self->endpoints_.local_fs : *self->endpoints_.remote_fs;
            const auto &path = local ? self->endpoints_.local_path : self->endpoints_.remote_path;
            try {
                if (fs.stat(path).is_directory()) {
                    fs.rmdir(path, true);
                } else {
                    fs.unlink(path);
                }
            } catch (const TransferError &ex) {
                on_complete(TaskOutcome::failure(ex.code(), ex.what()));
                return;
            }
            on_complete(TaskOutcome::success()); });
    }

} // namespace ferry
