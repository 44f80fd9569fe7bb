#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace ferry::cli
{

    enum class Command : std::uint8_t
    {
        Upload,
        Download,
        SyncRemote,
        SyncLocal,
        Delete,
        Profiles
    };

    std::string_view to_string(Command command) noexcept;
    std::optional<Command> command_from_string(std::string_view name) noexcept;

    struct Options
    {
        std::filesystem::path config_path;
        Command command{Command::Profiles};
        // local path for upload/sync-remote, remote path for download/sync-local/delete
        std::optional<std::string> path;
        std::optional<std::string> profile;
        std::optional<std::filesystem::path> log_path;
        bool verbose{false};
    };

    std::string usage(std::string_view program_name);

    Options parse_arguments(int argc, char *argv[]);

} // namespace ferry::cli
