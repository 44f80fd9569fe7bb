#include "ferry/config.hpp"

#include <array>
#include <cstdlib>
#include <fstream>

#include <spdlog/spdlog.h>

#include "ferry/errors.hpp"

namespace ferry
{

    namespace
    {
        // Keys that only matter on this machine and never identify a remote connection.
        constexpr std::array<const char *, 10> kLocalOnlyKeys{
            "name",
            "remotePath",
            "uploadOnSave",
            "downloadOnOpen",
            "ignore",
            "ignoreFile",
            "watcher",
            "concurrency",
            "syncOption",
            "sshConfigPath",
        };

        template <typename T>
        void overlay(T &target, const std::optional<T> &value)
        {
            if (value)
            {
                target = *value;
            }
        }

        template <typename T>
        void overlay(std::optional<T> &target, const std::optional<T> &value)
        {
            if (value)
            {
                target = value;
            }
        }

        template <typename T>
        void read_optional(const nlohmann::json &json, const char *key, std::optional<T> &out)
        {
            if (auto it = json.find(key); it != json.end() && !it->is_null())
            {
                out = it->template get<T>();
            }
        }

        void read_optional_path(const nlohmann::json &json, const char *key, std::optional<std::filesystem::path> &out)
        {
            if (auto it = json.find(key); it != json.end() && it->is_string())
            {
                out = std::filesystem::path(it->get<std::string>());
            }
        }

        SecureMode secure_mode_from_json(const nlohmann::json &json)
        {
            if (json.is_boolean())
            {
                return json.get<bool>() ? SecureMode::Explicit : SecureMode::Off;
            }
            const auto value = json.get<std::string>();
            if (value == "control")
            {
                return SecureMode::Control;
            }
            if (value == "implicit")
            {
                return SecureMode::Implicit;
            }
            throw ConfigError("Invalid value for \"secure\": " + value, "secure");
        }

        DownloadOnOpen download_on_open_from_json(const nlohmann::json &json)
        {
            if (json.is_boolean())
            {
                return json.get<bool>() ? DownloadOnOpen::On : DownloadOnOpen::Off;
            }
            const auto value = json.get<std::string>();
            if (value == "confirm")
            {
                return DownloadOnOpen::Confirm;
            }
            throw ConfigError("Invalid value for \"downloadOnOpen\": " + value, "downloadOnOpen");
        }

        std::uint16_t default_port(const std::string &protocol)
        {
            return protocol == "ftp" ? 21 : 22;
        }

        void read_connection_settings(const nlohmann::json &json, ConnectionSettings &settings)
        {
            settings.protocol = json.value("protocol", std::string{"sftp"});
            settings.host = json.value("host", std::string{});
            settings.port = json.value("port", default_port(settings.protocol));
            settings.connect_timeout = json.value("connectTimeout", std::uint32_t{10000});
            settings.username = json.value("username", std::string{});
            read_optional(json, "password", settings.password);
            if (auto it = json.find("passphrase"); it != json.end() && it->is_string())
            {
                settings.passphrase = it->get<std::string>();
            }
            settings.interactive_auth = json.value("interactiveAuth", false);
            settings.algorithms = json.value("algorithms", nlohmann::json{});
            if (auto it = json.find("secure"); it != json.end() && !it->is_null())
            {
                settings.secure = secure_mode_from_json(*it);
            }
            settings.secure_options = json.value("secureOptions", nlohmann::json{});
            read_optional(json, "agent", settings.agent);
            read_optional(json, "privateKeyPath", settings.private_key_path);
            read_optional(json, "sshConfigPath", settings.ssh_config_path);

            settings.name = json.value("name", std::string{});
            settings.context = json.value("context", std::string{});
            settings.remote_path = json.value("remotePath", std::string{"/"});
            settings.upload_on_save = json.value("uploadOnSave", false);
            if (auto it = json.find("downloadOnOpen"); it != json.end() && !it->is_null())
            {
                settings.download_on_open = download_on_open_from_json(*it);
            }
            settings.concurrency = json.value("concurrency", std::size_t{4});
            settings.watcher = json.value("watcher", WatcherConfig{});
            settings.sync_option = json.value("syncOption", SyncOption{});
            settings.remote_time_offset_in_hours = json.value("remoteTimeOffsetInHours", 0.0);
            if (auto it = json.find("remoteExplorer"); it != json.end() && it->is_object())
            {
                settings.remote_explorer_files_exclude = it->value("filesExclude", std::vector<std::string>{});
            }
        }

    } // namespace

    std::string_view to_string(SecureMode mode) noexcept
    {
        switch (mode)
        {
        case SecureMode::Off:
            return "off";
        case SecureMode::Explicit:
            return "explicit";
        case SecureMode::Control:
            return "control";
        case SecureMode::Implicit:
            return "implicit";
        }
        return "unknown";
    }

    std::string_view to_string(DownloadOnOpen mode) noexcept
    {
        switch (mode)
        {
        case DownloadOnOpen::Off:
            return "off";
        case DownloadOnOpen::On:
            return "on";
        case DownloadOnOpen::Confirm:
            return "confirm";
        }
        return "unknown";
    }

    void apply_override(FileServiceConfig &config, const ConfigOverride &profile)
    {
        overlay(config.host, profile.host);
        overlay(config.port, profile.port);
        overlay(config.connect_timeout, profile.connect_timeout);
        overlay(config.username, profile.username);
        overlay(config.password, profile.password);
        overlay(config.passphrase, profile.passphrase);
        overlay(config.interactive_auth, profile.interactive_auth);
        overlay(config.algorithms, profile.algorithms);
        overlay(config.secure, profile.secure);
        overlay(config.secure_options, profile.secure_options);
        overlay(config.agent, profile.agent);
        overlay(config.private_key_path, profile.private_key_path);
        overlay(config.ssh_config_path, profile.ssh_config_path);
        overlay(config.name, profile.name);
        overlay(config.protocol, profile.protocol);
        overlay(config.context, profile.context);
        overlay(config.remote_path, profile.remote_path);
        overlay(config.upload_on_save, profile.upload_on_save);
        overlay(config.download_on_open, profile.download_on_open);
        overlay(config.concurrency, profile.concurrency);
        overlay(config.watcher, profile.watcher);
        overlay(config.sync_option, profile.sync_option);
        overlay(config.remote_time_offset_in_hours, profile.remote_time_offset_in_hours);
        overlay(config.remote_explorer_files_exclude, profile.remote_explorer_files_exclude);
        overlay(config.ignore, profile.ignore);
        overlay(config.ignore_file, profile.ignore_file);
    }

    std::optional<ValidationError> validate_config(const FileServiceConfig &config)
    {
        const bool networked = config.protocol == "sftp" || config.protocol == "ftp";
        if (!networked && config.protocol != "local")
        {
            return ValidationError{"unsupported protocol \"" + config.protocol + "\""};
        }
        if (networked && config.host.empty())
        {
            return ValidationError{"\"host\" is required"};
        }
        if (networked && config.port == 0)
        {
            return ValidationError{"\"port\" must be between 1 and 65535"};
        }
        if (config.remote_path.empty() || config.remote_path.front() != '/')
        {
            return ValidationError{"\"remotePath\" must be an absolute path"};
        }
        if (config.concurrency == 0)
        {
            return ValidationError{"\"concurrency\" must be at least 1"};
        }
        return std::nullopt;
    }

    ServiceConfig resolve_config(const FileServiceConfig &raw, const std::optional<std::string> &active_profile,
                                 const std::filesystem::path &base_dir, IgnoreFileCache &ignore_cache,
                                 const ConfigValidator &validator)
    {
        FileServiceConfig merged = raw;
        merged.profiles.clear();

        if (merged.agent && merged.agent->starts_with('$'))
        {
            const auto variable = merged.agent->substr(1);
            const char *value = std::getenv(variable.c_str());
            if (value == nullptr || *value == '\0')
            {
                throw ConfigError("Environment variable \"" + variable + "\" not found", "agent");
            }
            merged.agent = std::string(value);
        }

        const bool has_profiles = !raw.profiles.empty();
        if (has_profiles && active_profile)
        {
            spdlog::info("Using profile: {}", *active_profile);
            const auto it = raw.profiles.find(*active_profile);
            if (it == raw.profiles.end())
            {
                throw ConfigError("Unknown profile \"" + *active_profile + "\". Please check your profile setting." +
                                      " You can select a profile with --profile <name>.",
                                  "profiles");
            }
            apply_override(merged, it->second);
        }

        if (validator)
        {
            if (const auto error = validator(merged))
            {
                auto message = "Config validation fail: " + error->message + ".";
                if (has_profiles && !active_profile)
                {
                    message += " Maybe you should set a profile first.";
                }
                throw ConfigError(std::move(message));
            }
        }

        if (merged.ignore_file && merged.ignore_file->is_relative() && !base_dir.empty())
        {
            merged.ignore_file = base_dir / *merged.ignore_file;
        }

        ServiceConfig resolved;
        static_cast<ConnectionSettings &>(resolved) = merged;
        resolved.ignore = resolve_ignore(merged.ignore, merged.ignore_file, base_dir, merged.remote_path, ignore_cache);
        return resolved;
    }

    nlohmann::json host_info(const ConnectionSettings &config)
    {
        nlohmann::json json = config;
        for (const auto *key : kLocalOnlyKeys)
        {
            json.erase(key);
        }
        return json;
    }

    void to_json(nlohmann::json &json, const WatcherConfig &watcher)
    {
        json = {
            {"files", watcher.files ? nlohmann::json(*watcher.files) : nlohmann::json(false)},
            {"autoUpload", watcher.auto_upload},
            {"autoDelete", watcher.auto_delete},
        };
    }

    void from_json(const nlohmann::json &json, WatcherConfig &watcher)
    {
        watcher = WatcherConfig{};
        if (auto it = json.find("files"); it != json.end() && it->is_string())
        {
            watcher.files = it->get<std::string>();
        }
        watcher.auto_upload = json.value("autoUpload", false);
        watcher.auto_delete = json.value("autoDelete", false);
    }

    void to_json(nlohmann::json &json, const SyncOption &option)
    {
        json = {
            {"delete", option.delete_extraneous},
            {"skipCreate", option.skip_create},
            {"ignoreExisting", option.ignore_existing},
            {"update", option.update},
        };
    }

    void from_json(const nlohmann::json &json, SyncOption &option)
    {
        option.delete_extraneous = json.value("delete", false);
        option.skip_create = json.value("skipCreate", false);
        option.ignore_existing = json.value("ignoreExisting", false);
        option.update = json.value("update", false);
    }

    void to_json(nlohmann::json &json, const ConnectionSettings &settings)
    {
        json = {
            {"host", settings.host},
            {"port", settings.port},
            {"connectTimeout", settings.connect_timeout},
            {"username", settings.username},
            {"interactiveAuth", settings.interactive_auth},
            {"algorithms", settings.algorithms},
            {"secure", std::string(to_string(settings.secure))},
            {"secureOptions", settings.secure_options},
            {"name", settings.name},
            {"protocol", settings.protocol},
            {"context", settings.context.generic_string()},
            {"remotePath", settings.remote_path},
            {"uploadOnSave", settings.upload_on_save},
            {"downloadOnOpen", std::string(to_string(settings.download_on_open))},
            {"concurrency", settings.concurrency},
            {"watcher", settings.watcher},
            {"syncOption", settings.sync_option},
            {"remoteTimeOffsetInHours", settings.remote_time_offset_in_hours},
            {"remoteExplorer", {{"filesExclude", settings.remote_explorer_files_exclude}}},
        };
        if (settings.password)
        {
            json["password"] = *settings.password;
        }
        if (settings.passphrase)
        {
            json["passphrase"] = *settings.passphrase;
        }
        if (settings.agent)
        {
            json["agent"] = *settings.agent;
        }
        if (settings.private_key_path)
        {
            json["privateKeyPath"] = *settings.private_key_path;
        }
        if (settings.ssh_config_path)
        {
            json["sshConfigPath"] = *settings.ssh_config_path;
        }
    }

    void from_json(const nlohmann::json &json, ConfigOverride &profile)
    {
        profile = ConfigOverride{};
        read_optional(json, "host", profile.host);
        read_optional(json, "port", profile.port);
        read_optional(json, "connectTimeout", profile.connect_timeout);
        read_optional(json, "username", profile.username);
        read_optional(json, "password", profile.password);
        if (auto it = json.find("passphrase"); it != json.end() && it->is_string())
        {
            profile.passphrase = it->get<std::string>();
        }
        read_optional(json, "interactiveAuth", profile.interactive_auth);
        read_optional(json, "algorithms", profile.algorithms);
        if (auto it = json.find("secure"); it != json.end() && !it->is_null())
        {
            profile.secure = secure_mode_from_json(*it);
        }
        read_optional(json, "secureOptions", profile.secure_options);
        read_optional(json, "agent", profile.agent);
        read_optional(json, "privateKeyPath", profile.private_key_path);
        read_optional(json, "sshConfigPath", profile.ssh_config_path);
        read_optional(json, "name", profile.name);
        read_optional(json, "protocol", profile.protocol);
        read_optional_path(json, "context", profile.context);
        read_optional(json, "remotePath", profile.remote_path);
        read_optional(json, "uploadOnSave", profile.upload_on_save);
        if (auto it = json.find("downloadOnOpen"); it != json.end() && !it->is_null())
        {
            profile.download_on_open = download_on_open_from_json(*it);
        }
        read_optional(json, "concurrency", profile.concurrency);
        read_optional(json, "watcher", profile.watcher);
        read_optional(json, "syncOption", profile.sync_option);
        read_optional(json, "remoteTimeOffsetInHours", profile.remote_time_offset_in_hours);
        if (auto it = json.find("remoteExplorer"); it != json.end() && it->is_object())
        {
            read_optional(*it, "filesExclude", profile.remote_explorer_files_exclude);
        }
        read_optional(json, "ignore", profile.ignore);
        read_optional_path(json, "ignoreFile", profile.ignore_file);
    }

    void from_json(const nlohmann::json &json, FileServiceConfig &config)
    {
        config = FileServiceConfig{};
        read_connection_settings(json, config);
        config.ignore = json.value("ignore", std::vector<std::string>{});
        read_optional_path(json, "ignoreFile", config.ignore_file);
        if (auto it = json.find("profiles"); it != json.end() && it->is_object())
        {
            for (const auto &item : it->items())
            {
                config.profiles[item.key()] = item.value().get<ConfigOverride>();
            }
        }
    }

    FileServiceConfig parse_config(const nlohmann::json &json, const std::filesystem::path &config_dir)
    {
        if (!json.is_object())
        {
            throw ConfigError("Config must be a JSON object");
        }
        FileServiceConfig config;
        try
        {
            config = json.get<FileServiceConfig>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw ConfigError(std::string("Invalid config: ") + ex.what());
        }

        if (config.context.empty())
        {
            config.context = config_dir;
        }
        else if (config.context.is_relative() && !config_dir.empty())
        {
            config.context = (config_dir / config.context).lexically_normal();
        }
        return config;
    }

    FileServiceConfig load_config_file(const std::filesystem::path &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw ConfigError("Config file " + path.string() + " not found");
        }
        nlohmann::json json;
        try
        {
            in >> json;
        }
        catch (const nlohmann::json::parse_error &ex)
        {
            throw ConfigError("Config file " + path.string() + " is not valid JSON: " + ex.what());
        }
        auto directory = std::filesystem::absolute(path).parent_path();
        return parse_config(json, directory);
    }

} // namespace ferry
