#include "ferry/cli/options.hpp"

#include <array>
#include <stdexcept>
#include <utility>

namespace ferry::cli
{

    namespace
    {

        constexpr std::array<std::pair<Command, std::string_view>, 6> kCommandNames{{
            {Command::Upload, "upload"},
            {Command::Download, "download"},
            {Command::SyncRemote, "sync-remote"},
            {Command::SyncLocal, "sync-local"},
            {Command::Delete, "delete"},
            {Command::Profiles, "profiles"},
        }};

    } // namespace

    std::string_view to_string(Command command) noexcept
    {
        for (const auto &[value, name] : kCommandNames)
        {
            if (value == command)
            {
                return name;
            }
        }
        return "unknown";
    }

    std::optional<Command> command_from_string(std::string_view name) noexcept
    {
        for (const auto &[value, text] : kCommandNames)
        {
            if (text == name)
            {
                return value;
            }
        }
        return std::nullopt;
    }

    std::string usage(std::string_view program_name)
    {
        return "Usage: " + std::string(program_name) +
               " <config.json> <upload|download|sync-remote|sync-local|delete|profiles> [path]"
               " [--profile <name>] [--log <file>] [--verbose]";
    }

    Options parse_arguments(int argc, char *argv[])
    {
        if (argc < 3)
        {
            throw std::runtime_error(usage(argc > 0 ? argv[0] : "ferry"));
        }

        Options options;
        int index = 1;
        options.config_path = std::filesystem::path(argv[index++]);

        const std::string command_name = argv[index++];
        const auto command = command_from_string(command_name);
        if (!command)
        {
            throw std::runtime_error("Unknown command: " + command_name);
        }
        options.command = *command;

        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--profile")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--profile requires a profile name");
                }
                options.profile = std::string(argv[index++]);
            }
            else if (arg == "--log")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--log requires a file path");
                }
                options.log_path = std::filesystem::path(argv[index++]);
            }
            else if (arg == "--verbose" || arg == "-v")
            {
                options.verbose = true;
            }
            else if (!arg.empty() && arg.front() != '-' && !options.path)
            {
                options.path = arg;
            }
            else
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
        }

        if (options.command != Command::Profiles && !options.path)
        {
            throw std::runtime_error("Command " + command_name + " requires a path");
        }

        return options;
    }

} // namespace ferry::cli
