/**
 * DropDeck - Shared protocol schema and serialization helpers.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "dropdeck/error_codes.hpp"

namespace dropdeck::protocol
{

    enum class Command : std::uint8_t
    {
        Identify,
        UploadInit,
        UploadChunk,
        UploadComplete,
        SubmitText,
        ListItems,
        DeleteItem,
        DownloadInit,
        DownloadChunk,
        Ping
    };

    std::string_view to_string(Command command) noexcept;
    std::optional<Command> command_from_string(std::string_view value) noexcept;

    enum class ResponseKind : std::uint8_t
    {
        Ok = 0,
        Error = 1,
        Event = 2
    };

    std::string_view to_string(ResponseKind kind) noexcept;
    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept;

    struct RequestEnvelope
    {
        Command command{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope);
    void from_json(const nlohmann::json &json, RequestEnvelope &envelope);

    struct ResponseEnvelope
    {
        ResponseKind kind{ResponseKind::Ok};
        ErrorCode error{ErrorCode::Ok};
        std::string message{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope);
    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope);

    struct IdentifyRequest
    {
        std::string username;
    };

    void to_json(nlohmann::json &json, const IdentifyRequest &request);
    void from_json(const nlohmann::json &json, IdentifyRequest &request);

    struct UploadInitRequest
    {
        std::string file_name;
        std::uint64_t size{};
        std::string mime;
        std::string file_key;
        std::uint64_t chunk_size{};
    };

    void to_json(nlohmann::json &json, const UploadInitRequest &request);
    void from_json(const nlohmann::json &json, UploadInitRequest &request);

    struct UploadInitResponse
    {
        std::string upload_id;
        std::uint64_t chunk_size{};
        std::uint64_t total_chunks{};
        std::vector<std::uint64_t> uploaded;
    };

    void to_json(nlohmann::json &json, const UploadInitResponse &response);
    void from_json(const nlohmann::json &json, UploadInitResponse &response);

    struct UploadChunkRequest
    {
        std::string upload_id;
        std::uint64_t index{};
        std::string data_base64;
    };

    void to_json(nlohmann::json &json, const UploadChunkRequest &request);
    void from_json(const nlohmann::json &json, UploadChunkRequest &request);

    struct UploadCompleteRequest
    {
        std::string upload_id;
    };

    void to_json(nlohmann::json &json, const UploadCompleteRequest &request);
    void from_json(const nlohmann::json &json, UploadCompleteRequest &request);

    struct SubmitTextRequest
    {
        std::string text;
    };

    void to_json(nlohmann::json &json, const SubmitTextRequest &request);
    void from_json(const nlohmann::json &json, SubmitTextRequest &request);

    struct ListItemsRequest
    {
        std::optional<std::string> type{};
        std::optional<std::uint64_t> limit{};
    };

    void to_json(nlohmann::json &json, const ListItemsRequest &request);
    void from_json(const nlohmann::json &json, ListItemsRequest &request);

    struct DeleteItemRequest
    {
        std::string id;
    };

    void to_json(nlohmann::json &json, const DeleteItemRequest &request);
    void from_json(const nlohmann::json &json, DeleteItemRequest &request);

    struct DownloadInitRequest
    {
        std::string file_name;
    };

    void to_json(nlohmann::json &json, const DownloadInitRequest &request);
    void from_json(const nlohmann::json &json, DownloadInitRequest &request);

    struct TransferDescriptor
    {
        std::string transfer_id;
        std::uint64_t total_size{};
        std::uint64_t chunk_size{};
        std::optional<std::string> hash{};
    };

    void to_json(nlohmann::json &json, const TransferDescriptor &descriptor);
    void from_json(const nlohmann::json &json, TransferDescriptor &descriptor);

    struct DownloadChunkRequest
    {
        std::string transfer_id;
        std::uint64_t offset{};
        std::uint64_t max_bytes{};
    };

    void to_json(nlohmann::json &json, const DownloadChunkRequest &request);
    void from_json(const nlohmann::json &json, DownloadChunkRequest &request);

    struct DownloadChunkResponse
    {
        std::string transfer_id;
        std::uint64_t offset{};
        std::uint64_t bytes{};
        bool done{};
        std::string data_base64;
        std::string chunk_hash;
    };

    void to_json(nlohmann::json &json, const DownloadChunkResponse &response);
    void from_json(const nlohmann::json &json, DownloadChunkResponse &response);

} // namespace dropdeck::protocol
