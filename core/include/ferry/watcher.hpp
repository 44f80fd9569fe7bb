#pragma once

#include <filesystem>

#include "ferry/config.hpp"

namespace ferry
{

    // Filesystem watch subsystem, one registration per base directory.
    class WatcherService
    {
    public:
        virtual ~WatcherService() = default;

        virtual void create(const std::filesystem::path &watch_base, const WatcherConfig &config) = 0;
        virtual void dispose(const std::filesystem::path &watch_base) = 0;
    };

    class NullWatcherService final : public WatcherService
    {
    public:
        void create(const std::filesystem::path &, const WatcherConfig &) override {}
        void dispose(const std::filesystem::path &) override {}
    };

} // namespace ferry
