#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "dropdeck/server/broadcaster.hpp"
#include "dropdeck/server/chunk_store.hpp"
#include "dropdeck/server/filesystem.hpp"
#include "dropdeck/server/transfer_index.hpp"
#include "dropdeck/transfer_item.hpp"

namespace dropdeck::server
{

    /**
     * Entry point for every transfer operation. Owns no state of its own: it validates requests,
     * drives the chunk store and the index, and wires index commits to the broadcaster so that
     * viewers only hear about mutations that are already durable.
     */
    class TransferService
    {
    public:
        TransferService(const Filesystem &filesystem, ChunkStore &chunks, TransferIndex &index,
                        Broadcaster &broadcaster, std::chrono::seconds upload_timeout = std::chrono::hours{24});

        TransferItem submit_text(const std::string &sender, const std::string &text);

        UploadSession upload_init(const UploadRequest &request);
        void put_chunk(const std::string &upload_id, std::uint64_t index, std::span<const std::byte> data);
        TransferItem upload_complete(const std::string &upload_id);

        std::vector<TransferItem> list_items(ItemFilter filter, std::optional<std::size_t> limit) const;

        // Returns the removed item, or std::nullopt when the id was already gone.
        std::optional<TransferItem> delete_item(const std::string &id);

        std::filesystem::path serve_file(std::string_view file_name) const;

        std::size_t reap_abandoned_uploads();

        static std::string artifact_url(std::string_view artifact_name);
        static std::optional<std::string> artifact_name_from_url(std::string_view url);

    private:
        void unlink_artifact(const TransferItem &item) const;

        const Filesystem &filesystem_;
        ChunkStore &chunks_;
        TransferIndex &index_;
        Broadcaster &broadcaster_;
        std::chrono::seconds upload_timeout_;
    };

} // namespace dropdeck::server
