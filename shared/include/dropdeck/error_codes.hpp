/**
 * DropDeck - Shared error codes used across client and server layers.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace dropdeck
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidCommand = 1,
        InvalidPayload = 2,
        NotFound = 3,
        AuthenticationRequired = 4,
        Conflict = 5,
        IoError = 6,
        Unsupported = 7,
        InternalError = 8
    };

    std::string_view to_string(ErrorCode code) noexcept;

    // Transient failures: a merge already running, or storage that failed mid-write.
    bool is_retryable(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

} // namespace dropdeck
