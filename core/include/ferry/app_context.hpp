#pragma once

#include <optional>
#include <string>

#include "ferry/ignore.hpp"
#include "ferry/remote_registry.hpp"

namespace ferry
{

    // Process wide state shared by every File Service. Owned by the host.
    struct AppContext
    {
        IgnoreFileCache ignore_file_cache;
        RemoteRegistry remotes;
        std::optional<std::string> active_profile;
    };

} // namespace ferry
