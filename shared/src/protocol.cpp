#include "dropdeck/protocol.hpp"

#include <array>
#include <stdexcept>

namespace dropdeck::protocol
{

    namespace
    {

        struct CommandMapping
        {
            Command command;
            std::string_view label;
        };

        constexpr std::array<CommandMapping, 10> kCommandMappings{{
            {Command::Identify, "IDENTIFY"},
            {Command::UploadInit, "UPLOAD_INIT"},
            {Command::UploadChunk, "UPLOAD_CHUNK"},
            {Command::UploadComplete, "UPLOAD_COMPLETE"},
            {Command::SubmitText, "SUBMIT_TEXT"},
            {Command::ListItems, "LIST_ITEMS"},
            {Command::DeleteItem, "DELETE_ITEM"},
            {Command::DownloadInit, "DOWNLOAD_INIT"},
            {Command::DownloadChunk, "DOWNLOAD_CHUNK"},
            {Command::Ping, "PING"},
        }};

        struct ResponseKindMapping
        {
            ResponseKind kind;
            std::string_view label;
        };

        constexpr std::array<ResponseKindMapping, 3> kResponseMappings{{
            {ResponseKind::Ok, "OK"},
            {ResponseKind::Error, "ERROR"},
            {ResponseKind::Event, "EVENT"},
        }};

        std::optional<std::string> optional_string(const nlohmann::json &json, const char *key)
        {
            if (auto it = json.find(key); it != json.end() && !it->is_null())
            {
                return it->get<std::string>();
            }
            return std::nullopt;
        }

    } // namespace

    std::string_view to_string(Command command) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.command == command)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<Command> command_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.label == value)
            {
                return mapping.command;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(ResponseKind kind) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.label == value)
            {
                return mapping.kind;
            }
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope)
    {
        json = {
            {"cmd", to_string(envelope.command)},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, RequestEnvelope &envelope)
    {
        const auto cmd_label = json.at("cmd").get<std::string>();
        auto cmd = command_from_string(cmd_label);
        if (!cmd)
        {
            throw std::runtime_error("Unknown command: " + cmd_label);
        }
        envelope.command = *cmd;
        envelope.payload = json.value("payload", nlohmann::json::object());
        envelope.request_id = optional_string(json, "id");
    }

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope)
    {
        json = {
            {"status", to_string(envelope.kind)},
            {"error", to_int(envelope.error)},
            {"message", envelope.message},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope)
    {
        const auto status_label = json.at("status").get<std::string>();
        auto kind = response_kind_from_string(status_label);
        if (!kind)
        {
            throw std::runtime_error("Unknown response status: " + status_label);
        }
        envelope.kind = *kind;
        const auto error_value = json.value("error", 0u);
        envelope.error = error_code_from_int(static_cast<std::uint16_t>(error_value));
        envelope.message = json.value("message", std::string{});
        envelope.payload = json.value("payload", nlohmann::json::object());
        envelope.request_id = optional_string(json, "id");
    }

    void to_json(nlohmann::json &json, const IdentifyRequest &request)
    {
        json = {{"username", request.username}};
    }

    void from_json(const nlohmann::json &json, IdentifyRequest &request)
    {
        request.username = json.at("username").get<std::string>();
    }

    void to_json(nlohmann::json &json, const UploadInitRequest &request)
    {
        json = {
            {"fileName", request.file_name},
            {"size", request.size},
            {"mime", request.mime},
            {"fileKey", request.file_key},
            {"chunkSize", request.chunk_size},
        };
    }

    void from_json(const nlohmann::json &json, UploadInitRequest &request)
    {
        request.file_name = json.at("fileName").get<std::string>();
        request.size = json.at("size").get<std::uint64_t>();
        request.mime = json.value("mime", std::string{});
        request.file_key = json.value("fileKey", std::string{});
        request.chunk_size = json.value("chunkSize", 0ULL);
    }

    void to_json(nlohmann::json &json, const UploadInitResponse &response)
    {
        json = {
            {"uploadId", response.upload_id},
            {"chunkSize", response.chunk_size},
            {"totalChunks", response.total_chunks},
            {"uploaded", response.uploaded},
        };
    }

    void from_json(const nlohmann::json &json, UploadInitResponse &response)
    {
        response.upload_id = json.at("uploadId").get<std::string>();
        response.chunk_size = json.at("chunkSize").get<std::uint64_t>();
        response.total_chunks = json.at("totalChunks").get<std::uint64_t>();
        response.uploaded = json.value("uploaded", std::vector<std::uint64_t>{});
    }

    void to_json(nlohmann::json &json, const UploadChunkRequest &request)
    {
        json = {
            {"uploadId", request.upload_id},
            {"index", request.index},
            {"data", request.data_base64},
        };
    }

    void from_json(const nlohmann::json &json, UploadChunkRequest &request)
    {
        request.upload_id = json.at("uploadId").get<std::string>();
        request.index = json.at("index").get<std::uint64_t>();
        request.data_base64 = json.at("data").get<std::string>();
    }

    void to_json(nlohmann::json &json, const UploadCompleteRequest &request)
    {
        json = {{"uploadId", request.upload_id}};
    }

    void from_json(const nlohmann::json &json, UploadCompleteRequest &request)
    {
        request.upload_id = json.at("uploadId").get<std::string>();
    }

    void to_json(nlohmann::json &json, const SubmitTextRequest &request)
    {
        json = {{"text", request.text}};
    }

    void from_json(const nlohmann::json &json, SubmitTextRequest &request)
    {
        request.text = json.at("text").get<std::string>();
    }

    void to_json(nlohmann::json &json, const ListItemsRequest &request)
    {
        json = nlohmann::json::object();
        if (request.type)
        {
            json["type"] = *request.type;
        }
        if (request.limit)
        {
            json["limit"] = *request.limit;
        }
    }

    void from_json(const nlohmann::json &json, ListItemsRequest &request)
    {
        request.type = optional_string(json, "type");
        if (auto it = json.find("limit"); it != json.end() && !it->is_null())
        {
            request.limit = it->get<std::uint64_t>();
        }
        else
        {
            request.limit.reset();
        }
    }

    void to_json(nlohmann::json &json, const DeleteItemRequest &request)
    {
        json = {{"id", request.id}};
    }

    void from_json(const nlohmann::json &json, DeleteItemRequest &request)
    {
        request.id = json.at("id").get<std::string>();
    }

    void to_json(nlohmann::json &json, const DownloadInitRequest &request)
    {
        json = {{"fileName", request.file_name}};
    }

    void from_json(const nlohmann::json &json, DownloadInitRequest &request)
    {
        request.file_name = json.at("fileName").get<std::string>();
    }

    void to_json(nlohmann::json &json, const TransferDescriptor &descriptor)
    {
        json = {
            {"transferId", descriptor.transfer_id},
            {"totalSize", descriptor.total_size},
            {"chunkSize", descriptor.chunk_size},
        };
        if (descriptor.hash)
        {
            json["hash"] = *descriptor.hash;
        }
    }

    void from_json(const nlohmann::json &json, TransferDescriptor &descriptor)
    {
        descriptor.transfer_id = json.at("transferId").get<std::string>();
        descriptor.total_size = json.value("totalSize", 0ULL);
        descriptor.chunk_size = json.value("chunkSize", 0ULL);
        descriptor.hash = optional_string(json, "hash");
    }

    void to_json(nlohmann::json &json, const DownloadChunkRequest &request)
    {
        json = {
            {"transferId", request.transfer_id},
            {"offset", request.offset},
            {"maxBytes", request.max_bytes},
        };
    }

    void from_json(const nlohmann::json &json, DownloadChunkRequest &request)
    {
        request.transfer_id = json.at("transferId").get<std::string>();
        request.offset = json.value("offset", 0ULL);
        request.max_bytes = json.value("maxBytes", 0ULL);
    }

    void to_json(nlohmann::json &json, const DownloadChunkResponse &response)
    {
        json = {
            {"transferId", response.transfer_id},
            {"offset", response.offset},
            {"bytes", response.bytes},
            {"done", response.done},
            {"data", response.data_base64},
            {"chunkHash", response.chunk_hash},
        };
    }

    void from_json(const nlohmann::json &json, DownloadChunkResponse &response)
    {
        response.transfer_id = json.at("transferId").get<std::string>();
        response.offset = json.value("offset", 0ULL);
        response.bytes = json.value("bytes", 0ULL);
        response.done = json.value("done", false);
        response.data_base64 = json.value("data", std::string{});
        response.chunk_hash = json.value("chunkHash", std::string{});
    }

} // namespace dropdeck::protocol
