#include "ferry/file_system.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>

#include "ferry/errors.hpp"

namespace ferry
{

    namespace
    {

        std::int64_t to_unix_time(const std::filesystem::file_time_type &time)
        {
            using namespace std::chrono;
            // exact conversion, sync decisions compare these values
            const auto sctp = floor<seconds>(std::filesystem::file_time_type::clock::to_sys(time));
            return static_cast<std::int64_t>(sctp.time_since_epoch().count());
        }

        FileType file_type_from(const std::filesystem::file_status &status)
        {
            switch (status.type())
            {
            case std::filesystem::file_type::regular:
                return FileType::File;
            case std::filesystem::file_type::directory:
                return FileType::Directory;
            case std::filesystem::file_type::symlink:
                return FileType::SymbolicLink;
            default:
                return FileType::Unknown;
            }
        }

        FileEntry entry_from_path(const std::filesystem::path &path)
        {
            std::error_code ec;
            const auto status = std::filesystem::symlink_status(path, ec);
            if (ec || !std::filesystem::exists(status))
            {
                throw TransferError(ErrorCode::NotFound, "No such file or directory: " + path.generic_string());
            }
            FileEntry entry{};
            entry.path = path.generic_string();
            entry.name = path.filename().generic_string();
            entry.type = file_type_from(status);
            if (entry.type == FileType::File)
            {
                entry.size = std::filesystem::file_size(path, ec);
            }
            const auto modified = std::filesystem::last_write_time(path, ec);
            if (!ec)
            {
                entry.modified_time = to_unix_time(modified);
            }
            return entry;
        }

    } // namespace

    FileEntry LocalFileSystem::stat(const std::string &path) const
    {
        return entry_from_path(std::filesystem::path(path));
    }

    bool LocalFileSystem::exists(const std::string &path) const
    {
        std::error_code ec;
        return std::filesystem::exists(std::filesystem::symlink_status(path, ec));
    }

    std::vector<FileEntry> LocalFileSystem::list(const std::string &directory) const
    {
        std::vector<FileEntry> entries;
        try
        {
            for (const auto &item : std::filesystem::directory_iterator(directory))
            {
                entries.push_back(entry_from_path(item.path()));
            }
        }
        catch (const std::filesystem::filesystem_error &ex)
        {
            throw transfer_error_from(ex);
        }
        return entries;
    }

    std::unique_ptr<std::istream> LocalFileSystem::open_read(const std::string &path) const
    {
        auto in = std::make_unique<std::ifstream>(path, std::ios::binary);
        if (!in->is_open())
        {
            throw TransferError(exists(path) ? ErrorCode::PermissionDenied : ErrorCode::NotFound,
                                "Could not open " + path + " for reading");
        }
        return in;
    }

    std::unique_ptr<std::ostream> LocalFileSystem::open_write(const std::string &path) const
    {
        auto out = std::make_unique<std::ofstream>(path, std::ios::binary | std::ios::trunc);
        if (!out->is_open())
        {
            throw TransferError(ErrorCode::PermissionDenied, "Could not open " + path + " for writing");
        }
        return out;
    }

    void LocalFileSystem::ensure_dir(const std::string &path) const
    {
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
        if (ec)
        {
            throw TransferError(error_code_from(ec), "Could not create directory " + path + ": " + ec.message());
        }
    }

    void LocalFileSystem::unlink(const std::string &path) const
    {
        std::error_code ec;
        if (std::filesystem::is_directory(std::filesystem::symlink_status(path, ec)))
        {
            throw TransferError(ErrorCode::Conflict, "Target is a directory: " + path);
        }
        if (!std::filesystem::remove(path, ec))
        {
            throw TransferError(ec ? error_code_from(ec) : ErrorCode::NotFound,
                                "Could not remove " + path + (ec ? ": " + ec.message() : std::string{}));
        }
    }

    void LocalFileSystem::rmdir(const std::string &path, bool recursive) const
    {
        std::error_code ec;
        if (!std::filesystem::is_directory(path, ec))
        {
            throw TransferError(ErrorCode::NotFound, "Not a directory: " + path);
        }
        if (recursive)
        {
            std::filesystem::remove_all(path, ec);
        }
        else
        {
            std::filesystem::remove(path, ec);
        }
        if (ec)
        {
            throw TransferError(error_code_from(ec), "Could not remove directory " + path + ": " + ec.message());
        }
    }

} // namespace ferry
