#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "ferry/cli/options.hpp"
#include "ferry/errors.hpp"
#include "ferry/file_service.hpp"
#include "ferry/path_utils.hpp"
#include "ferry/transfer_handlers.hpp"
#include "ferry/version.hpp"

namespace
{

    void install_logger(const ferry::cli::Options &options)
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (options.log_path)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.log_path->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("ferry", sinks.begin(), sinks.end());
        logger->set_level(options.verbose ? spdlog::level::debug : spdlog::level::info);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
    }

    std::string absolute_local(const std::string &path)
    {
        return std::filesystem::absolute(path).lexically_normal().generic_string();
    }

    std::string absolute_remote(const ferry::ServiceConfig &config, const std::string &path)
    {
        if (!path.empty() && path.front() == '/')
        {
            return ferry::paths::normalize(path);
        }
        return ferry::paths::join(config.remote_path, path);
    }

    void dispatch(ferry::cli::Command command, ferry::FileService &service, const ferry::ServiceConfig &config,
                  const std::string &path, ferry::TransferCallback on_complete)
    {
        using ferry::cli::Command;
        switch (command)
        {
        case Command::Upload:
            ferry::upload(service, config, ferry::target_from_local(service, config, absolute_local(path)),
                          std::move(on_complete));
            break;
        case Command::SyncRemote:
            ferry::sync_to_remote(service, config, ferry::target_from_local(service, config, absolute_local(path)),
                                  std::move(on_complete));
            break;
        case Command::Download:
            ferry::download(service, config,
                            ferry::target_from_remote(service, config, absolute_remote(config, path)),
                            std::move(on_complete));
            break;
        case Command::SyncLocal:
            ferry::sync_to_local(service, config,
                                 ferry::target_from_remote(service, config, absolute_remote(config, path)),
                                 std::move(on_complete));
            break;
        case Command::Delete:
            ferry::remove_remote(service, config,
                                 ferry::target_from_remote(service, config, absolute_remote(config, path)),
                                 std::move(on_complete));
            break;
        case Command::Profiles:
            break;
        }
    }

} // namespace

int main(int argc, char *argv[])
{
    ferry::cli::Options options;
    try
    {
        options = ferry::cli::parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Ferry " << ferry::version() << "\n"
                  << ex.what() << "\n"
                  << ferry::cli::usage(argv[0]) << std::endl;
        return EXIT_FAILURE;
    }

    try
    {
        install_logger(options);

        auto raw = ferry::load_config_file(options.config_path);
        ferry::AppContext context;
        context.active_profile = options.profile;

        asio::io_context io_context;
        const auto base_dir = raw.context;
        ferry::FileService service(io_context, context, base_dir, base_dir.filename().string(), std::move(raw));
        service.set_config_validator(ferry::validate_config);

        if (options.command == ferry::cli::Command::Profiles)
        {
            for (const auto &profile : service.available_profiles())
            {
                std::cout << profile << "\n";
            }
            return EXIT_SUCCESS;
        }

        const auto config = service.get_config();
        spdlog::info("Ferry {} {} {} ({}://{}{})", ferry::version(), ferry::cli::to_string(options.command),
                     *options.path, config.protocol, config.host, config.remote_path);

        service.before_transfer([](const ferry::TransferTask &task)
                                { spdlog::info("start {}", task.describe()); });
        service.after_transfer([](const ferry::TaskOutcome &outcome, const ferry::TransferTask &task)
                               {
            if (outcome.failed()) {
                spdlog::error("{} failed: {} ({})", task.describe(), outcome.message, ferry::to_string(outcome.error));
            } else {
                spdlog::info("{} {}", ferry::to_string(outcome.status), task.describe());
            } });

        asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&service](const std::error_code &ec, int signal)
                           {
            if (!ec) {
                spdlog::warn("Received signal {}, cancelling transfers", signal);
                service.cancel_transfer_tasks();
            } });

        std::optional<ferry::TransferReport> result;
        dispatch(options.command, service, config, *options.path,
                 [&result, &signals](const ferry::TransferReport &report)
                 {
                     result = report;
                     signals.cancel();
                 });

        io_context.run();
        service.dispose();

        if (!result)
        {
            spdlog::error("Transfers did not complete");
            return EXIT_FAILURE;
        }
        spdlog::info("{} succeeded ({} skipped), {} failed, {} cancelled", result->succeeded, result->skipped,
                     result->failed, result->cancelled);
        for (const auto &error : result->errors)
        {
            spdlog::error("{}", error);
        }
        return result->ok() ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    catch (const ferry::ConfigError &ex)
    {
        std::cerr << "Configuration error: " << ex.what() << std::endl;
        spdlog::error("Configuration error: {}", ex.what());
        return EXIT_FAILURE;
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Ferry failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }
}
