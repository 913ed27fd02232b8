#include "dropdeck/framing.hpp"

#include <algorithm>
#include <stdexcept>
#include <string_view>

namespace dropdeck::protocol
{

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message)
    {
        const auto text = message.dump();
        if (text.size() > kMaxFrameSize)
        {
            throw std::length_error("JSON message too large to frame");
        }
        const auto size = static_cast<std::uint32_t>(text.size());
        std::vector<std::uint8_t> frame(kFrameHeaderSize + text.size());
        frame[0] = static_cast<std::uint8_t>((size >> 24) & 0xFF);
        frame[1] = static_cast<std::uint8_t>((size >> 16) & 0xFF);
        frame[2] = static_cast<std::uint8_t>((size >> 8) & 0xFF);
        frame[3] = static_cast<std::uint8_t>(size & 0xFF);
        std::copy(text.begin(), text.end(), frame.begin() + static_cast<std::ptrdiff_t>(kFrameHeaderSize));
        return frame;
    }

    std::uint32_t frame_payload_size(const FrameHeader &header) noexcept
    {
        return (static_cast<std::uint32_t>(header[0]) << 24) | (static_cast<std::uint32_t>(header[1]) << 16) |
               (static_cast<std::uint32_t>(header[2]) << 8) | static_cast<std::uint32_t>(header[3]);
    }

    nlohmann::json parse_frame_payload(std::span<const std::uint8_t> payload)
    {
        const std::string_view text(reinterpret_cast<const char *>(payload.data()), payload.size());
        return nlohmann::json::parse(text);
    }

} // namespace dropdeck::protocol
