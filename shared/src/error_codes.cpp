#include "dropdeck/error_codes.hpp"

#include <array>

namespace dropdeck
{

    namespace
    {
        // Wire label and whether the same request may succeed when simply sent again.
        struct ErrorCodeTraits
        {
            ErrorCode code;
            std::string_view label;
            bool retryable;
        };

        constexpr std::array<ErrorCodeTraits, 9> kTraits{{
            {ErrorCode::Ok, "ok", false},
            {ErrorCode::InvalidCommand, "invalid_command", false},
            {ErrorCode::InvalidPayload, "invalid_payload", false},
            {ErrorCode::NotFound, "not_found", false},
            {ErrorCode::AuthenticationRequired, "authentication_required", false},
            {ErrorCode::Conflict, "conflict", true},
            {ErrorCode::IoError, "io_error", true},
            {ErrorCode::Unsupported, "unsupported", false},
            {ErrorCode::InternalError, "internal_error", false},
        }};

        constexpr const ErrorCodeTraits *find_traits(ErrorCode code) noexcept
        {
            for (const auto &entry : kTraits)
            {
                if (entry.code == code)
                {
                    return &entry;
                }
            }
            return nullptr;
        }

        static_assert(find_traits(ErrorCode::InternalError) != nullptr);
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        const auto *traits = find_traits(code);
        return traits ? traits->label : "unknown";
    }

    bool is_retryable(ErrorCode code) noexcept
    {
        const auto *traits = find_traits(code);
        return traits != nullptr && traits->retryable;
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept
    {
        const auto *traits = find_traits(static_cast<ErrorCode>(value));
        return traits ? traits->code : ErrorCode::InternalError;
    }

} // namespace dropdeck
