#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "ferry/file_system.hpp"

namespace ferry
{

    using FileSystemFactory = std::function<std::shared_ptr<FileSystem>(const nlohmann::json &host_info)>;

    /**
     * Live remote file systems keyed by their host parameters. Connections are shared
     * between every File Service whose host info compares equal.
     *
     * The "local" protocol is always available and treats remotePath as a directory
     * on this machine (a mounted share).
     */
    class RemoteRegistry
    {
    public:
        RemoteRegistry();

        void register_protocol(std::string protocol, FileSystemFactory factory);

        // Throws TransferError(Unsupported) when no factory is registered for the protocol.
        std::shared_ptr<FileSystem> create_remote_if_none_exist(const nlohmann::json &host_info);

        // Returns false when nothing was registered for host_info.
        bool remove_remote(const nlohmann::json &host_info);

        std::size_t size() const;

    private:
        static std::string key_for(const nlohmann::json &host_info);

        mutable std::mutex mutex_;
        std::map<std::string, FileSystemFactory> factories_;
        std::map<std::string, std::shared_ptr<FileSystem>> remotes_;
    };

} // namespace ferry
