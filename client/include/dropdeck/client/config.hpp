#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace dropdeck::client
{

    struct ClientConfig
    {
        std::optional<std::string> username;
        std::string host;
        std::uint16_t port{};
        std::optional<std::filesystem::path> log_path;
        std::uint64_t chunk_size{0}; // 0 lets the server pick
    };

    ClientConfig parse_arguments(int argc, char *argv[]);

} // namespace dropdeck::client
