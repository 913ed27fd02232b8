#include "dropdeck/encoding/base64.hpp"

#include <array>
#include <cstdint>

namespace dropdeck::encoding
{

    namespace
    {

        constexpr std::string_view kAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
        constexpr char kPad = '=';
        constexpr std::int8_t kInvalid = -1;

        consteval auto make_decode_table()
        {
            std::array<std::int8_t, 256> table{};
            table.fill(kInvalid);
            for (std::size_t i = 0; i < kAlphabet.size(); ++i)
            {
                table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<std::int8_t>(i);
            }
            return table;
        }

        constexpr auto kDecodeTable = make_decode_table();

        char sextet(std::uint32_t group, int shift)
        {
            return kAlphabet[(group >> shift) & 0x3Fu];
        }

    } // namespace

    std::string encode_base64(std::span<const std::byte> data)
    {
        std::string output;
        output.reserve(((data.size() + 2) / 3) * 4);

        std::size_t i = 0;
        for (; i + 3 <= data.size(); i += 3)
        {
            const auto group = (std::to_integer<std::uint32_t>(data[i]) << 16) |
                               (std::to_integer<std::uint32_t>(data[i + 1]) << 8) |
                               std::to_integer<std::uint32_t>(data[i + 2]);
            output.push_back(sextet(group, 18));
            output.push_back(sextet(group, 12));
            output.push_back(sextet(group, 6));
            output.push_back(sextet(group, 0));
        }

        const auto remaining = data.size() - i;
        if (remaining == 1)
        {
            const auto group = std::to_integer<std::uint32_t>(data[i]) << 16;
            output.push_back(sextet(group, 18));
            output.push_back(sextet(group, 12));
            output.append(2, kPad);
        }
        else if (remaining == 2)
        {
            const auto group = (std::to_integer<std::uint32_t>(data[i]) << 16) |
                               (std::to_integer<std::uint32_t>(data[i + 1]) << 8);
            output.push_back(sextet(group, 18));
            output.push_back(sextet(group, 12));
            output.push_back(sextet(group, 6));
            output.push_back(kPad);
        }

        return output;
    }

    std::optional<std::vector<std::byte>> decode_base64(std::string_view input)
    {
        if (input.size() % 4 != 0)
        {
            return std::nullopt;
        }

        std::vector<std::byte> output;
        output.reserve((input.size() / 4) * 3);

        for (std::size_t i = 0; i < input.size(); i += 4)
        {
            const bool last_group = i + 4 == input.size();
            std::uint32_t group = 0;
            int padding = 0;
            for (std::size_t j = 0; j < 4; ++j)
            {
                const auto ch = input[i + j];
                if (ch == kPad)
                {
                    // Padding is only legal in the final two positions of the last group.
                    if (!last_group || j < 2)
                    {
                        return std::nullopt;
                    }
                    ++padding;
                    group <<= 6;
                    continue;
                }
                if (padding > 0)
                {
                    return std::nullopt;
                }
                const auto value = kDecodeTable[static_cast<unsigned char>(ch)];
                if (value == kInvalid)
                {
                    return std::nullopt;
                }
                group = (group << 6) | static_cast<std::uint32_t>(value);
            }

            output.push_back(static_cast<std::byte>((group >> 16) & 0xFFu));
            if (padding < 2)
            {
                output.push_back(static_cast<std::byte>((group >> 8) & 0xFFu));
            }
            if (padding < 1)
            {
                output.push_back(static_cast<std::byte>(group & 0xFFu));
            }
        }

        return output;
    }

} // namespace dropdeck::encoding
