#pragma once

#include <cstdint>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace ferry
{

    enum class FileType : std::uint8_t
    {
        File,
        Directory,
        SymbolicLink,
        Unknown
    };

    struct FileEntry
    {
        std::string path;
        std::string name;
        FileType type{FileType::Unknown};
        std::uint64_t size{};
        std::int64_t modified_time{}; // seconds since epoch

        bool is_directory() const noexcept { return type == FileType::Directory; }
    };

    /**
     * File access used by transfer tasks. Paths are absolute and '/' separated.
     * Every operation throws TransferError on failure.
     */
    class FileSystem
    {
    public:
        virtual ~FileSystem() = default;

        virtual FileEntry stat(const std::string &path) const = 0;
        virtual bool exists(const std::string &path) const = 0;
        virtual std::vector<FileEntry> list(const std::string &directory) const = 0;

        virtual std::unique_ptr<std::istream> open_read(const std::string &path) const = 0;
        virtual std::unique_ptr<std::ostream> open_write(const std::string &path) const = 0;

        // Creates the directory and any missing parents.
        virtual void ensure_dir(const std::string &path) const = 0;
        virtual void unlink(const std::string &path) const = 0;
        virtual void rmdir(const std::string &path, bool recursive) const = 0;
    };

    class LocalFileSystem final : public FileSystem
    {
    public:
        FileEntry stat(const std::string &path) const override;
        bool exists(const std::string &path) const override;
        std::vector<FileEntry> list(const std::string &directory) const override;

        std::unique_ptr<std::istream> open_read(const std::string &path) const override;
        std::unique_ptr<std::ostream> open_write(const std::string &path) const override;

        void ensure_dir(const std::string &path) const override;
        void unlink(const std::string &path) const override;
        void rmdir(const std::string &path, bool recursive) const override;
    };

} // namespace ferry
