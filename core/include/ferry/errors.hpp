#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

#include "ferry/error_codes.hpp"

namespace ferry
{

    // Raised while resolving a connection's configuration. Never retried.
    class ConfigError : public std::runtime_error
    {
    public:
        explicit ConfigError(std::string message, std::string key = {});

        ErrorCode code() const noexcept { return ErrorCode::InvalidConfig; }
        const std::string &key() const noexcept { return key_; }

    private:
        std::string key_;
    };

    // Failure of a single file operation.
    class TransferError : public std::runtime_error
    {
    public:
        TransferError(ErrorCode code, std::string message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

    ErrorCode error_code_from(const std::error_code &ec) noexcept;

    TransferError transfer_error_from(const std::filesystem::filesystem_error &error);

} // namespace ferry
