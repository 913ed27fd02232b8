/**
 * DropDeck - Length-prefixed JSON framing helpers.
 *
 * Every message on the wire is a 4-byte big-endian payload length followed by
 * a UTF-8 JSON document of exactly that many bytes.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include <nlohmann/json.hpp>

namespace dropdeck::protocol
{

    inline constexpr std::size_t kFrameHeaderSize = sizeof(std::uint32_t);
    inline constexpr std::uint32_t kMaxFrameSize = 64u * 1024u * 1024u;

    using FrameHeader = std::array<std::uint8_t, kFrameHeaderSize>;

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message);

    std::uint32_t frame_payload_size(const FrameHeader &header) noexcept;

    // Throws nlohmann::json::parse_error for payloads that are not JSON.
    nlohmann::json parse_frame_payload(std::span<const std::uint8_t> payload);

} // namespace dropdeck::protocol
