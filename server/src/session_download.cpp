#include "dropdeck/server/session.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <vector>

#include <spdlog/spdlog.h>

#include "dropdeck/crypto.hpp"
#include "dropdeck/encoding/base64.hpp"
#include "dropdeck/server/errors.hpp"
#include "session_common.hpp"

namespace dropdeck::server
{

    namespace
    {
        constexpr std::uint64_t kDownloadChunkSize = 1 << 20; // 1 MiB
        constexpr std::size_t kMaxOpenDownloads = 16;
    } // namespace

    void Session::handle_download_init(const dropdeck::protocol::RequestEnvelope &envelope)
    {
        if (!require_identity(envelope))
        {
            return;
        }
        guarded(envelope, [&]
                {
                    const auto request = envelope.payload.get<dropdeck::protocol::DownloadInitRequest>();
                    const auto path = services_.transfers.serve_file(request.file_name);
                    if (downloads_.size() >= kMaxOpenDownloads)
                    {
                        throw TransferError(dropdeck::ErrorCode::Conflict, "Too many open downloads");
                    }

                    const dropdeck::protocol::TransferDescriptor descriptor{
                        .transfer_id = crypto::generate_id(8),
                        .total_size = std::filesystem::file_size(path),
                        .chunk_size = kDownloadChunkSize,
                        .hash = crypto::hash_file(path),
                    };
                    downloads_[descriptor.transfer_id] = DownloadTransfer{
                        .path = path,
                        .total_size = descriptor.total_size,
                        .chunk_size = descriptor.chunk_size,
                    };

                    nlohmann::json payload;
                    payload["descriptor"] = descriptor;
                    send_response(session_common::make_ok_response(std::move(payload), envelope.request_id));
                    spdlog::info("{} downloading {} ({} bytes)", identity_, request.file_name, descriptor.total_size); });
    }

    void Session::handle_download_chunk(const dropdeck::protocol::RequestEnvelope &envelope)
    {
        if (!require_identity(envelope))
        {
            return;
        }
        guarded(envelope, [&]
                {
                    const auto request = envelope.payload.get<dropdeck::protocol::DownloadChunkRequest>();
                    auto it = downloads_.find(request.transfer_id);
                    if (it == downloads_.end())
                    {
                        throw TransferError(dropdeck::ErrorCode::NotFound, "Unknown transfer");
                    }
                    const auto transfer = it->second;
                    if (request.offset > transfer.total_size)
                    {
                        throw TransferError(dropdeck::ErrorCode::InvalidPayload, "Invalid offset");
                    }

                    std::ifstream file(transfer.path, std::ios::binary);
                    if (!file.is_open())
                    {
                        downloads_.erase(it);
                        throw TransferError(dropdeck::ErrorCode::NotFound, "File no longer available");
                    }
                    file.seekg(static_cast<std::streamoff>(request.offset));
                    const auto max_bytes = request.max_bytes == 0
                                               ? transfer.chunk_size
                                               : std::min<std::uint64_t>(transfer.chunk_size, request.max_bytes);
                    std::vector<std::byte> buffer(static_cast<std::size_t>(max_bytes));
                    file.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
                    const auto read_bytes = static_cast<std::size_t>(file.gcount());
                    buffer.resize(read_bytes);

                    const bool done = (request.offset + read_bytes) >= transfer.total_size;
                    const dropdeck::protocol::DownloadChunkResponse chunk{
                        .transfer_id = request.transfer_id,
                        .offset = request.offset,
                        .bytes = static_cast<std::uint64_t>(read_bytes),
                        .done = done,
                        .data_base64 = dropdeck::encoding::encode_base64(buffer),
                        .chunk_hash = crypto::hash_bytes(buffer),
                    };
                    send_response(session_common::make_ok_response(chunk, envelope.request_id));

                    if (done)
                    {
                        downloads_.erase(request.transfer_id);
                    } });
    }

} // namespace dropdeck::server
