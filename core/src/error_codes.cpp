#include "ferry/error_codes.hpp"

#include <array>

namespace ferry
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 12> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::InvalidConfig, "invalid_config"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::PermissionDenied, "permission_denied"},
            {ErrorCode::AlreadyExists, "already_exists"},
            {ErrorCode::Conflict, "conflict"},
            {ErrorCode::IoError, "io_error"},
            {ErrorCode::ConnectionFailed, "connection_failed"},
            {ErrorCode::Timeout, "timeout"},
            {ErrorCode::Cancelled, "cancelled"},
            {ErrorCode::Unsupported, "unsupported"},
            {ErrorCode::InternalError, "internal_error"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

} // namespace ferry
