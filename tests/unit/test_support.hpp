#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

namespace ferry::test
{

    // Fresh directory below the system temp dir, removed again on destruction.
    class TempDir
    {
    public:
        explicit TempDir(const std::string &name)
        {
            static std::atomic<int> counter{0};
            path_ = std::filesystem::temp_directory_path() /
                    ("ferry_" + name + "_" + std::to_string(++counter));
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
            std::filesystem::create_directories(path_);
        }

        ~TempDir()
        {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }

        TempDir(const TempDir &) = delete;
        TempDir &operator=(const TempDir &) = delete;

        const std::filesystem::path &path() const noexcept { return path_; }
        std::string str() const { return path_.generic_string(); }

    private:
        std::filesystem::path path_;
    };

    inline void write_file(const std::filesystem::path &path, const std::string &content)
    {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }

    inline std::string read_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

} // namespace ferry::test
