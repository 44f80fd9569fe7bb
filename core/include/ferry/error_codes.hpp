/**
 * Ferry - Error codes shared by configuration resolution and transfer tasks.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace ferry
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidConfig = 1,
        NotFound = 2,
        PermissionDenied = 3,
        AlreadyExists = 4,
        Conflict = 5,
        IoError = 6,
        ConnectionFailed = 7,
        Timeout = 8,
        Cancelled = 9,
        Unsupported = 10,
        InternalError = 11
    };

    std::string_view to_string(ErrorCode code) noexcept;

} // namespace ferry
