#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "dropdeck/server/chunk_store.hpp"

namespace dropdeck::server
{

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{0};
        // Holds transfer/index.json, transfer/chunks/ and transfer/files/.
        std::filesystem::path root;
        std::size_t worker_threads{0}; // 0 uses the hardware concurrency
        // Upload sessions idle for longer are reaped; 0 keeps them forever.
        std::chrono::seconds upload_timeout{std::chrono::hours{24}};
        std::uint64_t max_chunk_size{kDefaultMaxChunkSize};
        std::optional<std::filesystem::path> log_file;
        bool verbose{false};
    };

    // Returns a message for the first setting the server cannot start with.
    std::optional<std::string> validate(const ServerConfig &config);

} // namespace dropdeck::server
