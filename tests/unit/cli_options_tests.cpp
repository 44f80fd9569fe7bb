#include <cassert>
#include <stdexcept>
#include <string>
#include <vector>

#include "ferry/cli/options.hpp"

using namespace ferry::cli;

namespace
{

    Options parse(std::vector<std::string> args)
    {
        std::vector<char *> argv;
        for (auto &arg : args)
        {
            argv.push_back(arg.data());
        }
        return parse_arguments(static_cast<int>(argv.size()), argv.data());
    }

    bool rejects(std::vector<std::string> args)
    {
        try
        {
            parse(std::move(args));
        }
        catch (const std::runtime_error &)
        {
            return true;
        }
        return false;
    }

    void test_parse_upload()
    {
        const auto options = parse({"ferry", "site.json", "upload", "src", "--profile", "prod", "--log", "ferry.log"});
        assert(options.config_path == "site.json");
        assert(options.command == Command::Upload);
        assert(options.path == std::optional<std::string>("src"));
        assert(options.profile == std::optional<std::string>("prod"));
        assert(options.log_path && options.log_path->string() == "ferry.log");
        assert(!options.verbose);
    }

    void test_parse_profiles()
    {
        const auto options = parse({"ferry", "site.json", "profiles", "-v"});
        assert(options.command == Command::Profiles);
        assert(!options.path);
        assert(options.verbose);
    }

    void test_rejects_bad_arguments()
    {
        assert(rejects({"ferry"}));
        assert(rejects({"ferry", "site.json"}));
        assert(rejects({"ferry", "site.json", "teleport", "x"}));
        assert(rejects({"ferry", "site.json", "download"}));
        assert(rejects({"ferry", "site.json", "upload", "a", "b"}));
        assert(rejects({"ferry", "site.json", "upload", "a", "--profile"}));
        assert(rejects({"ferry", "site.json", "upload", "a", "--unknown"}));
    }

    void test_command_names()
    {
        for (const auto command : {Command::Upload, Command::Download, Command::SyncRemote, Command::SyncLocal,
                                   Command::Delete, Command::Profiles})
        {
            assert(command_from_string(to_string(command)) == command);
        }
        assert(!command_from_string("sync"));
    }

} // namespace

void run_cli_options_tests()
{
    test_parse_upload();
    test_parse_profiles();
    test_rejects_bad_arguments();
    test_command_names();
}
