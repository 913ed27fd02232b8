#include "dropdeck/server/transfer_service.hpp"

#include <algorithm>
#include <cctype>

#include <spdlog/spdlog.h>

#include "dropdeck/crypto.hpp"
#include "dropdeck/server/errors.hpp"

namespace dropdeck::server
{

    namespace
    {
        constexpr std::string_view kFileUrlPrefix = "/file/";
        constexpr std::size_t kItemIdBytes = 12;

        bool is_blank(const std::string &text)
        {
            return std::all_of(text.begin(), text.end(), [](char ch)
                               { return std::isspace(static_cast<unsigned char>(ch)); });
        }

    } // namespace

    TransferService::TransferService(const Filesystem &filesystem, ChunkStore &chunks, TransferIndex &index,
                                     Broadcaster &broadcaster, std::chrono::seconds upload_timeout)
        : filesystem_(filesystem), chunks_(chunks), index_(index), broadcaster_(broadcaster),
          upload_timeout_(upload_timeout)
    {
        index_.add_commit_hook([this](const TransferEvent &event)
                               { broadcaster_.publish(event); });
    }

    TransferItem TransferService::submit_text(const std::string &sender, const std::string &text)
    {
        if (text.empty() || is_blank(text))
        {
            throw TransferError(dropdeck::ErrorCode::InvalidPayload, "Text must not be empty");
        }

        TransferItem item{};
        item.id = crypto::generate_id(kItemIdBytes);
        item.type = ItemType::Text;
        item.content = text;
        item.timestamp = current_timestamp_ms();
        item.sender = sender;

        auto stored = index_.append(std::move(item));
        spdlog::info("Text item {} from {} ({} bytes)", stored.id, stored.sender, stored.content.size());
        return stored;
    }

    UploadSession TransferService::upload_init(const UploadRequest &request)
    {
        reap_abandoned_uploads();
        return chunks_.begin_upload(request);
    }

    void TransferService::put_chunk(const std::string &upload_id, std::uint64_t index, std::span<const std::byte> data)
    {
        chunks_.put_chunk(upload_id, index, data);
    }

    TransferItem TransferService::upload_complete(const std::string &upload_id)
    {
        std::optional<TransferItem> stored;
        chunks_.complete(upload_id, [&](const MergedUpload &merged)
                         {
                             TransferItem item{};
                             item.id = crypto::generate_id(kItemIdBytes);
                             item.type = ItemType::File;
                             item.file = FileInfo{
                                 .name = merged.meta.file_name,
                                 .size = merged.bytes,
                                 .mime = merged.meta.mime,
                                 .url = artifact_url(merged.artifact_name),
                                 .hash = merged.hash,
                             };
                             item.timestamp = current_timestamp_ms();
                             item.sender = merged.meta.sender;

                             try
                             {
                                 stored = index_.append(std::move(item));
                             }
                             catch (const std::exception &ex)
                             {
                                 spdlog::error("Indexing upload {} failed: {}", upload_id, ex.what());
                                 throw;
                             } });
        return std::move(*stored);
    }

    std::vector<TransferItem> TransferService::list_items(ItemFilter filter, std::optional<std::size_t> limit) const
    {
        return index_.list(filter, limit);
    }

    std::optional<TransferItem> TransferService::delete_item(const std::string &id)
    {
        if (id.empty())
        {
            throw TransferError(dropdeck::ErrorCode::InvalidPayload, "id is required");
        }
        auto removed = index_.remove(id);
        if (!removed)
        {
            spdlog::debug("Delete of unknown item {} ignored", id);
            return std::nullopt;
        }
        if (removed->type == ItemType::File)
        {
            unlink_artifact(*removed);
        }
        spdlog::info("Deleted {} item {}", to_string(removed->type), removed->id);
        return removed;
    }

    std::filesystem::path TransferService::serve_file(std::string_view file_name) const
    {
        return filesystem_.resolve_artifact(file_name);
    }

    std::size_t TransferService::reap_abandoned_uploads()
    {
        return chunks_.cleanup_expired(upload_timeout_);
    }

    std::string TransferService::artifact_url(std::string_view artifact_name)
    {
        return std::string(kFileUrlPrefix) + std::string(artifact_name);
    }

    std::optional<std::string> TransferService::artifact_name_from_url(std::string_view url)
    {
        if (!url.starts_with(kFileUrlPrefix))
        {
            return std::nullopt;
        }
        url.remove_prefix(kFileUrlPrefix.size());
        if (!Filesystem::is_safe_component(url))
        {
            return std::nullopt;
        }
        return std::string(url);
    }

    void TransferService::unlink_artifact(const TransferItem &item) const
    {
        const auto name = item.file ? artifact_name_from_url(item.file->url) : std::nullopt;
        if (!name)
        {
            spdlog::warn("Item {} has no servable artifact url, nothing to unlink", item.id);
            return;
        }
        const auto path = Filesystem::safe_join(filesystem_.artifacts_root(), *name);
        std::error_code ec;
        if (!std::filesystem::remove(path, ec))
        {
            if (ec)
            {
                spdlog::warn("Failed to unlink artifact {} for item {}: {}", path.string(), item.id, ec.message());
            }
            else
            {
                spdlog::warn("Artifact {} for item {} was already gone", path.string(), item.id);
            }
        }
    }

} // namespace dropdeck::server
