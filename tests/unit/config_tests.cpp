#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "ferry/config.hpp"
#include "ferry/errors.hpp"
#include "ferry/ignore.hpp"
#include "test_support.hpp"

using namespace ferry;

namespace
{

    bool contains(const std::string &text, const std::string &needle)
    {
        return text.find(needle) != std::string::npos;
    }

    FileServiceConfig sample_config()
    {
        const auto json = nlohmann::json::parse(R"({
            "name": "site",
            "host": "example.com",
            "username": "deploy",
            "remotePath": "/var/www",
            "ignore": ["*.log"],
            "concurrency": 2,
            "syncOption": {"delete": true, "update": true},
            "profiles": {
                "prod": {"host": "prod.example.com", "remotePath": "/srv/prod", "ignore": ["*.map"]},
                "dev": {"port": 2222}
            }
        })");
        return parse_config(json, "/work/site");
    }

    void test_parse_defaults()
    {
        const auto config = sample_config();
        assert(config.protocol == "sftp");
        assert(config.port == 22);
        assert(config.connect_timeout == 10000);
        assert(config.concurrency == 2);
        assert(config.context == std::filesystem::path("/work/site"));
        assert(config.sync_option.delete_extraneous);
        assert(config.sync_option.update);
        assert(!config.sync_option.skip_create);
        assert(config.profiles.size() == 2);

        const auto ftp = parse_config(nlohmann::json{{"protocol", "ftp"}, {"host", "h"}, {"context", "sub"}}, "/work");
        assert(ftp.port == 21);
        assert(ftp.context == std::filesystem::path("/work/sub"));
    }

    void test_parse_rejects_bad_values()
    {
        bool thrown = false;
        try
        {
            parse_config(nlohmann::json{{"host", "h"}, {"port", "not a number"}});
        }
        catch (const ConfigError &)
        {
            thrown = true;
        }
        assert(thrown);

        thrown = false;
        try
        {
            parse_config(nlohmann::json::array());
        }
        catch (const ConfigError &)
        {
            thrown = true;
        }
        assert(thrown);
    }

    void test_profile_merge()
    {
        IgnoreFileCache cache;
        const auto raw = sample_config();

        const auto base = resolve_config(raw, std::nullopt, "/work/site", cache);
        assert(base.host == "example.com");
        assert(base.remote_path == "/var/www");
        assert(base.ignore("/work/site/debug.log"));

        const auto prod = resolve_config(raw, std::string("prod"), "/work/site", cache);
        assert(prod.host == "prod.example.com");
        assert(prod.remote_path == "/srv/prod");
        assert(prod.username == "deploy");
        assert(prod.port == 22);
        // a profile's ignore list replaces the base list as a whole
        assert(prod.ignore("/work/site/app.js.map"));
        assert(!prod.ignore("/work/site/debug.log"));
        assert(prod.ignore("/srv/prod/app.js.map"));

        const auto dev = resolve_config(raw, std::string("dev"), "/work/site", cache);
        assert(dev.host == "example.com");
        assert(dev.port == 2222);

        // without profiles the active profile is irrelevant
        auto plain = raw;
        plain.profiles.clear();
        const auto unaffected = resolve_config(plain, std::string("prod"), "/work/site", cache);
        assert(unaffected.host == "example.com");
    }

    void test_unknown_profile()
    {
        IgnoreFileCache cache;
        bool thrown = false;
        try
        {
            resolve_config(sample_config(), std::string("staging"), "/work/site", cache);
        }
        catch (const ConfigError &ex)
        {
            thrown = true;
            assert(ex.key() == "profiles");
            assert(contains(ex.what(), "Unknown profile \"staging\""));
        }
        assert(thrown);
    }

    void test_agent_from_environment()
    {
        IgnoreFileCache cache;
        auto raw = sample_config();
        raw.agent = "$FERRY_TEST_AGENT_SOCK";

        ::setenv("FERRY_TEST_AGENT_SOCK", "/tmp/agent.sock", 1);
        const auto resolved = resolve_config(raw, std::nullopt, "/work/site", cache);
        assert(resolved.agent == std::optional<std::string>("/tmp/agent.sock"));

        ::unsetenv("FERRY_TEST_AGENT_SOCK");
        bool thrown = false;
        try
        {
            resolve_config(raw, std::nullopt, "/work/site", cache);
        }
        catch (const ConfigError &ex)
        {
            thrown = true;
            assert(ex.key() == "agent");
            assert(contains(ex.what(), "FERRY_TEST_AGENT_SOCK"));
        }
        assert(thrown);

        raw.agent = "/run/agent.sock";
        assert(resolve_config(raw, std::nullopt, "/work/site", cache).agent == raw.agent);
    }

    void test_validator_hint()
    {
        IgnoreFileCache cache;
        auto raw = sample_config();
        raw.host.clear();

        bool thrown = false;
        try
        {
            resolve_config(raw, std::nullopt, "/work/site", cache, validate_config);
        }
        catch (const ConfigError &ex)
        {
            thrown = true;
            assert(contains(ex.what(), "Config validation fail: \"host\" is required."));
            assert(contains(ex.what(), "Maybe you should set a profile first."));
        }
        assert(thrown);

        // the profile fills in the host
        const auto prod = resolve_config(raw, std::string("prod"), "/work/site", cache, validate_config);
        assert(prod.host == "prod.example.com");

        thrown = false;
        try
        {
            resolve_config(raw, std::string("dev"), "/work/site", cache, validate_config);
        }
        catch (const ConfigError &ex)
        {
            thrown = true;
            assert(!contains(ex.what(), "Maybe you should set a profile first."));
        }
        assert(thrown);
    }

    void test_validate_config()
    {
        FileServiceConfig config;
        config.host = "h";
        assert(!validate_config(config));

        config.remote_path = "relative/dir";
        assert(validate_config(config));

        config.remote_path = "/";
        config.protocol = "webdav";
        assert(validate_config(config));

        config.protocol = "local";
        config.host.clear();
        assert(!validate_config(config));

        config.concurrency = 0;
        assert(validate_config(config));
    }

    void test_relative_ignore_file()
    {
        test::TempDir dir("config_ignore");
        test::write_file(dir.path() / ".ftpignore", "*.secret\n");

        FileServiceConfig raw;
        raw.host = "h";
        raw.ignore_file = std::filesystem::path(".ftpignore");
        IgnoreFileCache cache;
        const auto resolved = resolve_config(raw, std::nullopt, dir.path(), cache);
        assert(resolved.ignore);
        assert(resolved.ignore((dir.path() / "keys.secret").generic_string()));
        assert(cache.contains(dir.path() / ".ftpignore"));
    }

    void test_host_info()
    {
        IgnoreFileCache cache;
        auto raw = sample_config();
        const auto resolved = resolve_config(raw, std::nullopt, "/work/site", cache);
        const auto info = host_info(resolved);
        assert(info.at("host") == "example.com");
        assert(info.at("username") == "deploy");
        assert(info.at("port") == 22);
        for (const auto *key : {"name", "remotePath", "uploadOnSave", "downloadOnOpen", "ignore", "ignoreFile",
                                "watcher", "concurrency", "syncOption", "sshConfigPath"})
        {
            assert(!info.contains(key));
        }

        // settings that do not identify the connection do not change the key
        raw.remote_path = "/other";
        raw.concurrency = 8;
        const auto other = resolve_config(raw, std::nullopt, "/work/site", cache);
        assert(host_info(other) == info);

        raw.username = "someone-else";
        assert(host_info(resolve_config(raw, std::nullopt, "/work/site", cache)) != info);
    }

    void test_load_config_file()
    {
        test::TempDir dir("config_file");
        test::write_file(dir.path() / "ferry.json", R"({"protocol": "local", "remotePath": "/tmp"})");
        const auto config = load_config_file(dir.path() / "ferry.json");
        assert(config.protocol == "local");
        assert(config.context == std::filesystem::absolute(dir.path()));

        test::write_file(dir.path() / "broken.json", "{ not json");
        bool thrown = false;
        try
        {
            load_config_file(dir.path() / "broken.json");
        }
        catch (const ConfigError &)
        {
            thrown = true;
        }
        assert(thrown);
    }

} // namespace

void run_config_tests()
{
    test_parse_defaults();
    test_parse_rejects_bad_values();
    test_profile_merge();
    test_unknown_profile();
    test_agent_from_environment();
    test_validator_hint();
    test_validate_config();
    test_relative_ignore_file();
    test_host_info();
    test_load_config_file();
}
