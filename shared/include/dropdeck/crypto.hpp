/**
 * DropDeck - Identifier generation and content hashing built on libsodium.
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <span>
#include <string>

#include <sodium.h>

namespace dropdeck::crypto
{

    void ensure_sodium_init();

    // Random lowercase hex identifier encoding `bytes` bytes of entropy.
    std::string generate_id(std::size_t bytes = 16);

    // Incremental BLAKE2b digest, hex encoded by finish().
    class ContentHasher
    {
    public:
        ContentHasher();

        void update(std::span<const std::byte> data);
        std::string finish();

    private:
        crypto_generichash_state state_{};
        bool finished_{false};
    };

    std::string hash_bytes(std::span<const std::byte> data);

    std::string hash_file(const std::filesystem::path &path);

} // namespace dropdeck::crypto
