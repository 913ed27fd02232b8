#include "dropdeck/server/errors.hpp"

namespace dropdeck::server
{

    TransferError::TransferError(dropdeck::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    MissingChunkError::MissingChunkError(std::uint64_t index)
        : TransferError(dropdeck::ErrorCode::Conflict, "missing chunk " + std::to_string(index)), index_(index) {}

} // namespace dropdeck::server
