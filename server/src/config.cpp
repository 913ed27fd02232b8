#include "dropdeck/server/config.hpp"

#include "dropdeck/framing.hpp"

namespace dropdeck::server
{

    namespace
    {
        // Room for the envelope around a chunk: command, upload id, index and request id.
        constexpr std::uint64_t kChunkEnvelopeReserve = 4 * 1024;

        constexpr std::uint64_t encoded_chunk_size(std::uint64_t chunk_size)
        {
            return (chunk_size / 3 + (chunk_size % 3 != 0 ? 1 : 0)) * 4;
        }

        static_assert(encoded_chunk_size(kDefaultMaxChunkSize) + kChunkEnvelopeReserve <=
                      dropdeck::protocol::kMaxFrameSize);
    } // namespace

    std::optional<std::string> validate(const ServerConfig &config)
    {
        if (config.port == 0)
        {
            return "--port is required";
        }
        if (config.root.empty())
        {
            return "--root is required";
        }
        if (config.max_chunk_size == 0)
        {
            return "--max-chunk-size must be positive";
        }
        if (config.max_chunk_size > dropdeck::protocol::kMaxFrameSize ||
            encoded_chunk_size(config.max_chunk_size) + kChunkEnvelopeReserve > dropdeck::protocol::kMaxFrameSize)
        {
            return "--max-chunk-size " + std::to_string(config.max_chunk_size) +
                   " does not fit in a frame once base64 encoded";
        }
        if (config.upload_timeout.count() < 0)
        {
            return "--upload-timeout must not be negative";
        }
        return std::nullopt;
    }

} // namespace dropdeck::server
