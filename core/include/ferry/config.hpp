/**
 * Ferry - Connection configuration, profile overrides and resolution.
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "ferry/ignore.hpp"

namespace ferry
{

    enum class DownloadOnOpen : std::uint8_t
    {
        Off,
        On,
        Confirm
    };

    enum class SecureMode : std::uint8_t
    {
        Off,
        Explicit,
        Control,
        Implicit
    };

    struct WatcherConfig
    {
        std::optional<std::string> files;
        bool auto_upload{false};
        bool auto_delete{false};

        bool operator==(const WatcherConfig &) const = default;
    };

    struct SyncOption
    {
        bool delete_extraneous{false};
        bool skip_create{false};
        bool ignore_existing{false};
        bool update{false};

        bool operator==(const SyncOption &) const = default;
    };

    // Everything a resolved configuration exposes except the ignore predicate.
    struct ConnectionSettings
    {
        // host
        std::string host;
        std::uint16_t port{22};
        std::uint32_t connect_timeout{10000};
        std::string username;
        std::optional<std::string> password;
        std::optional<std::string> passphrase;
        bool interactive_auth{false};
        nlohmann::json algorithms;
        SecureMode secure{SecureMode::Off};
        nlohmann::json secure_options;
        std::optional<std::string> agent;
        std::optional<std::string> private_key_path;
        std::optional<std::string> ssh_config_path;

        // service
        std::string name;
        std::string protocol{"sftp"};
        std::filesystem::path context;
        std::string remote_path{"/"};
        bool upload_on_save{false};
        DownloadOnOpen download_on_open{DownloadOnOpen::Off};
        std::size_t concurrency{4};
        WatcherConfig watcher;
        SyncOption sync_option;
        double remote_time_offset_in_hours{0};
        std::vector<std::string> remote_explorer_files_exclude;
    };

    // A named profile. Every present field replaces the base field as a whole.
    struct ConfigOverride
    {
        std::optional<std::string> host;
        std::optional<std::uint16_t> port;
        std::optional<std::uint32_t> connect_timeout;
        std::optional<std::string> username;
        std::optional<std::string> password;
        std::optional<std::string> passphrase;
        std::optional<bool> interactive_auth;
        std::optional<nlohmann::json> algorithms;
        std::optional<SecureMode> secure;
        std::optional<nlohmann::json> secure_options;
        std::optional<std::string> agent;
        std::optional<std::string> private_key_path;
        std::optional<std::string> ssh_config_path;
        std::optional<std::string> name;
        std::optional<std::string> protocol;
        std::optional<std::filesystem::path> context;
        std::optional<std::string> remote_path;
        std::optional<bool> upload_on_save;
        std::optional<DownloadOnOpen> download_on_open;
        std::optional<std::size_t> concurrency;
        std::optional<WatcherConfig> watcher;
        std::optional<SyncOption> sync_option;
        std::optional<double> remote_time_offset_in_hours;
        std::optional<std::vector<std::string>> remote_explorer_files_exclude;
        std::optional<std::vector<std::string>> ignore;
        std::optional<std::filesystem::path> ignore_file;
    };

    // Configuration as the user wrote it.
    struct FileServiceConfig : ConnectionSettings
    {
        std::vector<std::string> ignore;
        std::optional<std::filesystem::path> ignore_file;
        std::map<std::string, ConfigOverride> profiles;
    };

    // Configuration handed to transfers: profile applied, ignore rules compiled.
    struct ServiceConfig : ConnectionSettings
    {
        IgnorePredicate ignore;
    };

    struct ValidationError
    {
        std::string message;
    };

    using ConfigValidator = std::function<std::optional<ValidationError>(const FileServiceConfig &)>;

    void apply_override(FileServiceConfig &config, const ConfigOverride &profile);

    std::optional<ValidationError> validate_config(const FileServiceConfig &config);

    /**
     * Produces the effective configuration for one connection.
     *
     * Order: strip profiles, expand a "$NAME" agent from the environment, overlay the
     * active profile, validate, compile ignore rules. Throws ConfigError. Apart from the
     * ignore file cache nothing is touched.
     */
    ServiceConfig resolve_config(const FileServiceConfig &raw, const std::optional<std::string> &active_profile,
                                 const std::filesystem::path &base_dir, IgnoreFileCache &ignore_cache,
                                 const ConfigValidator &validator = {});

    // Connection parameters with the local-only keys stripped; keys the remote registry.
    nlohmann::json host_info(const ConnectionSettings &config);

    std::string_view to_string(SecureMode mode) noexcept;
    std::string_view to_string(DownloadOnOpen mode) noexcept;

    void to_json(nlohmann::json &json, const WatcherConfig &watcher);
    void from_json(const nlohmann::json &json, WatcherConfig &watcher);
    void to_json(nlohmann::json &json, const SyncOption &option);
    void from_json(const nlohmann::json &json, SyncOption &option);
    void to_json(nlohmann::json &json, const ConnectionSettings &settings);
    void from_json(const nlohmann::json &json, ConfigOverride &profile);
    void from_json(const nlohmann::json &json, FileServiceConfig &config);

    // Throws ConfigError for unreadable or malformed documents.
    FileServiceConfig parse_config(const nlohmann::json &json, const std::filesystem::path &config_dir = {});
    FileServiceConfig load_config_file(const std::filesystem::path &path);

} // namespace ferry
