#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include "dropdeck/error_codes.hpp"

namespace dropdeck::server
{

    class TransferError : public std::runtime_error
    {
    public:
        TransferError(dropdeck::ErrorCode code, std::string message);

        dropdeck::ErrorCode code() const noexcept { return code_; }

    private:
        dropdeck::ErrorCode code_;
    };

    // Raised by upload completion when a chunk index has not been received yet.
    class MissingChunkError : public TransferError
    {
    public:
        explicit MissingChunkError(std::uint64_t index);

        std::uint64_t index() const noexcept { return index_; }

    private:
        std::uint64_t index_;
    };

} // namespace dropdeck::server
