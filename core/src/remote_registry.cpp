#include "ferry/remote_registry.hpp"

#include <spdlog/spdlog.h>

#include "ferry/errors.hpp"

namespace ferry
{

    RemoteRegistry::RemoteRegistry()
    {
        factories_["local"] = [](const nlohmann::json &)
        { return std::make_shared<LocalFileSystem>(); };
    }

    void RemoteRegistry::register_protocol(std::string protocol, FileSystemFactory factory)
    {
        std::lock_guard lock(mutex_);
        factories_[std::move(protocol)] = std::move(factory);
    }

    std::shared_ptr<FileSystem> RemoteRegistry::create_remote_if_none_exist(const nlohmann::json &host_info)
    {
        const auto key = key_for(host_info);
        std::lock_guard lock(mutex_);
        if (auto it = remotes_.find(key); it != remotes_.end())
        {
            return it->second;
        }

        const auto protocol = host_info.value("protocol", std::string{"sftp"});
        const auto factory = factories_.find(protocol);
        if (factory == factories_.end())
        {
            throw TransferError(ErrorCode::Unsupported, "No file system registered for protocol \"" + protocol + "\"");
        }
        auto remote = factory->second(host_info);
        if (!remote)
        {
            throw TransferError(ErrorCode::ConnectionFailed,
                                "Could not connect to " + host_info.value("host", std::string{"remote"}));
        }
        spdlog::debug("Opened {} file system for {}", protocol, host_info.value("host", std::string{}));
        remotes_.emplace(key, remote);
        return remote;
    }

    bool RemoteRegistry::remove_remote(const nlohmann::json &host_info)
    {
        std::lock_guard lock(mutex_);
        return remotes_.erase(key_for(host_info)) > 0;
    }

    std::size_t RemoteRegistry::size() const
    {
        std::lock_guard lock(mutex_);
        return remotes_.size();
    }

    std::string RemoteRegistry::key_for(const nlohmann::json &host_info)
    {
        // object keys are sorted, so equal parameters dump to the same string
        return host_info.dump();
    }

} // namespace ferry
