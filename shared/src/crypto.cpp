#include "dropdeck/crypto.hpp"

#include <fstream>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace dropdeck::crypto
{

    namespace
    {

        std::string to_hex(std::span<const unsigned char> data)
        {
            std::string hex(data.size() * 2 + 1, '\0');
            sodium_bin2hex(hex.data(), hex.size(), data.data(), data.size());
            hex.pop_back();
            return hex;
        }

    } // namespace

    void ensure_sodium_init()
    {
        static std::once_flag flag;
        std::call_once(flag, []
                       {
                           if (sodium_init() < 0)
                           {
                               throw std::runtime_error("libsodium initialization failed");
                           } });
    }

    std::string generate_id(std::size_t bytes)
    {
        ensure_sodium_init();
        std::vector<unsigned char> buffer(bytes);
        randombytes_buf(buffer.data(), buffer.size());
        return to_hex(buffer);
    }

    ContentHasher::ContentHasher()
    {
        ensure_sodium_init();
        if (crypto_generichash_init(&state_, nullptr, 0, crypto_generichash_BYTES) != 0)
        {
            throw std::runtime_error("crypto_generichash_init failed");
        }
    }

    void ContentHasher::update(std::span<const std::byte> data)
    {
        if (finished_)
        {
            throw std::logic_error("ContentHasher already finished");
        }
        if (data.empty())
        {
            return;
        }
        if (crypto_generichash_update(&state_, reinterpret_cast<const unsigned char *>(data.data()), data.size()) != 0)
        {
            throw std::runtime_error("crypto_generichash_update failed");
        }
    }

    std::string ContentHasher::finish()
    {
        if (finished_)
        {
            throw std::logic_error("ContentHasher already finished");
        }
        finished_ = true;
        std::vector<unsigned char> digest(crypto_generichash_BYTES);
        if (crypto_generichash_final(&state_, digest.data(), digest.size()) != 0)
        {
            throw std::runtime_error("crypto_generichash_final failed");
        }
        return to_hex(digest);
    }

    std::string hash_bytes(std::span<const std::byte> data)
    {
        ContentHasher hasher;
        hasher.update(data);
        return hasher.finish();
    }

    std::string hash_file(const std::filesystem::path &path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            throw std::runtime_error("Failed to open file for hashing: " + path.string());
        }
        ContentHasher hasher;
        std::vector<char> buffer(64 * 1024);
        while (file)
        {
            file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const auto read_count = static_cast<std::size_t>(file.gcount());
            hasher.update(std::as_bytes(std::span(buffer.data(), read_count)));
        }
        return hasher.finish();
    }

} // namespace dropdeck::crypto
