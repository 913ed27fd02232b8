#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace dropdeck::encoding
{

    std::string encode_base64(std::span<const std::byte> data);

    // Returns std::nullopt for malformed input; an empty string decodes to an empty buffer.
    std::optional<std::vector<std::byte>> decode_base64(std::string_view input);

} // namespace dropdeck::encoding
