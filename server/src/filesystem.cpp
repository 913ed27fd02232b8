#include "dropdeck/server/filesystem.hpp"

#include <algorithm>
#include <cctype>

#include "dropdeck/server/errors.hpp"

namespace dropdeck::server
{

    namespace
    {
        constexpr auto kTransferDir = "transfer";
        constexpr auto kChunksDir = "chunks";
        constexpr auto kArtifactsDir = "files";
        constexpr auto kIndexFile = "index.json";
        constexpr std::size_t kMaxComponentLength = 200;

        bool is_allowed_char(char ch) noexcept
        {
            const auto c = static_cast<unsigned char>(ch);
            return std::isalnum(c) || ch == '.' || ch == '_' || ch == '-';
        }

    } // namespace

    Filesystem::Filesystem(std::filesystem::path root) : base_(std::move(root))
    {
        std::filesystem::create_directories(chunks_root());
        std::filesystem::create_directories(artifacts_root());
    }

    std::filesystem::path Filesystem::chunks_root() const
    {
        return base_ / kTransferDir / kChunksDir;
    }

    std::filesystem::path Filesystem::artifacts_root() const
    {
        return base_ / kTransferDir / kArtifactsDir;
    }

    std::filesystem::path Filesystem::index_path() const
    {
        return base_ / kTransferDir / kIndexFile;
    }

    std::filesystem::path Filesystem::resolve_artifact(std::string_view name) const
    {
        const auto path = safe_join(artifacts_root(), name);
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec))
        {
            throw TransferError(dropdeck::ErrorCode::NotFound, "File not found");
        }
        return path;
    }

    std::filesystem::path Filesystem::safe_join(const std::filesystem::path &base, std::string_view name)
    {
        if (!is_safe_component(name))
        {
            throw TransferError(dropdeck::ErrorCode::InvalidPayload, "Invalid file name");
        }
        return base / std::filesystem::path(std::string(name));
    }

    bool Filesystem::is_safe_component(std::string_view name) noexcept
    {
        if (name.empty() || name.size() > kMaxComponentLength)
        {
            return false;
        }
        if (name.front() == '.' || name.find("..") != std::string_view::npos)
        {
            return false;
        }
        return std::all_of(name.begin(), name.end(), is_allowed_char);
    }

    std::string Filesystem::sanitize_file_name(std::string_view name)
    {
        // Keep only the last path component a client may have sent.
        if (const auto slash = name.find_last_of("/\\"); slash != std::string_view::npos)
        {
            name.remove_prefix(slash + 1);
        }

        std::string result;
        result.reserve(name.size());
        for (const char ch : name)
        {
            result.push_back(is_allowed_char(ch) ? ch : '_');
        }

        while (result.find("..") != std::string::npos)
        {
            result.replace(result.find(".."), 2, "_");
        }
        const auto first = result.find_first_not_of('.');
        result.erase(0, first == std::string::npos ? result.size() : first);

        if (result.size() > kMaxComponentLength - 16)
        {
            result.resize(kMaxComponentLength - 16);
        }
        if (result.empty())
        {
            result = "file";
        }
        return result;
    }

} // namespace dropdeck::server
