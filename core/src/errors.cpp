#include "ferry/errors.hpp"

namespace ferry
{

    ConfigError::ConfigError(std::string message, std::string key)
        : std::runtime_error(std::move(message)), key_(std::move(key)) {}

    TransferError::TransferError(ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    ErrorCode error_code_from(const std::error_code &ec) noexcept
    {
        if (!ec)
        {
            return ErrorCode::Ok;
        }
        if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory)
        {
            return ErrorCode::NotFound;
        }
        if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted ||
            ec == std::errc::read_only_file_system)
        {
            return ErrorCode::PermissionDenied;
        }
        if (ec == std::errc::file_exists || ec == std::errc::directory_not_empty)
        {
            return ErrorCode::Conflict;
        }
        if (ec == std::errc::timed_out)
        {
            return ErrorCode::Timeout;
        }
        if (ec == std::errc::connection_refused || ec == std::errc::connection_reset ||
            ec == std::errc::network_unreachable || ec == std::errc::host_unreachable)
        {
            return ErrorCode::ConnectionFailed;
        }
        return ErrorCode::IoError;
    }

    TransferError transfer_error_from(const std::filesystem::filesystem_error &error)
    {
        return TransferError(error_code_from(error.code()), error.what());
    }

} // namespace ferry
