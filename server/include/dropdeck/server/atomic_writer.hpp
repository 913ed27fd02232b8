#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <span>
#include <string_view>
#include <system_error>

#include <nlohmann/json.hpp>

namespace dropdeck::server
{

    struct AtomicWriteOptions
    {
        int rename_attempts{5};
        std::chrono::milliseconds rename_backoff{20};
        bool sync{true};
    };

    // Test seams. `before_rename` runs after the temporary file is complete and may throw to
    // simulate a crash; `rename` replaces the rename syscall and reports its outcome.
    struct AtomicWriteHooks
    {
        std::function<void(const std::filesystem::path &temp, const std::filesystem::path &target)> before_rename;
        std::function<std::error_code(const std::filesystem::path &temp, const std::filesystem::path &target)> rename;
    };

    /**
     * Write-then-replace for a single named file. Readers observe either the previous content
     * or the complete new content. The data goes to a unique sibling temporary file which is
     * flushed to disk and renamed over the target; rename failures are retried with linear
     * backoff, after which a copy-then-delete fallback is used. The fallback is not atomic and
     * is logged as degraded. Failures throw TransferError(IoError); the temporary file never
     * outlives a failed call.
     */
    class AtomicWriter
    {
    public:
        explicit AtomicWriter(AtomicWriteOptions options = {}, AtomicWriteHooks hooks = {});

        void write(const std::filesystem::path &target, std::span<const std::byte> data) const;
        void write(const std::filesystem::path &target, std::string_view text) const;
        void write_json(const std::filesystem::path &target, const nlohmann::json &document) const;

    private:
        std::filesystem::path make_temp_path(const std::filesystem::path &target) const;
        void write_temp(const std::filesystem::path &temp, std::span<const std::byte> data) const;
        void replace(const std::filesystem::path &temp, const std::filesystem::path &target) const;

        AtomicWriteOptions options_;
        AtomicWriteHooks hooks_;
    };

} // namespace dropdeck::server
