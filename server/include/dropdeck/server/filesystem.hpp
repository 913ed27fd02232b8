#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace dropdeck::server
{

    // On-disk layout under the server root:
    //   <root>/transfer/chunks/<upload id>/   in-flight upload sessions
    //   <root>/transfer/files/                merged artifacts
    //   <root>/transfer/index.json            transfer index document
    class Filesystem
    {
    public:
        explicit Filesystem(std::filesystem::path root);

        std::filesystem::path chunks_root() const;
        std::filesystem::path artifacts_root() const;
        std::filesystem::path index_path() const;

        // Resolves an artifact name for reading. Throws TransferError(InvalidPayload) for names
        // that are not a single plain component and TransferError(NotFound) when absent.
        std::filesystem::path resolve_artifact(std::string_view name) const;

        // Joins a single validated component onto base without touching the filesystem.
        static std::filesystem::path safe_join(const std::filesystem::path &base, std::string_view name);

        static bool is_safe_component(std::string_view name) noexcept;

        // Maps an arbitrary client file name onto [A-Za-z0-9._-], never empty, no leading dot.
        static std::string sanitize_file_name(std::string_view name);

    private:
        std::filesystem::path base_;
    };

} // namespace dropdeck::server
