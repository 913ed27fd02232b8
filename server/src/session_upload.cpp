#include "dropdeck/server/session.hpp"

#include <nlohmann/json.hpp>

#include "dropdeck/encoding/base64.hpp"
#include "dropdeck/server/errors.hpp"
#include "session_common.hpp"

namespace dropdeck::server
{

    void Session::handle_upload_init(const dropdeck::protocol::RequestEnvelope &envelope)
    {
        if (!require_identity(envelope))
        {
            return;
        }
        guarded(envelope, [&]
                {
                    const auto request = envelope.payload.get<dropdeck::protocol::UploadInitRequest>();
                    const auto session = services_.transfers.upload_init(UploadRequest{
                        .file_name = request.file_name,
                        .size = request.size,
                        .mime = request.mime,
                        .chunk_size = request.chunk_size,
                        .sender = identity_,
                        .file_key = request.file_key,
                    });

                    const dropdeck::protocol::UploadInitResponse response{
                        .upload_id = session.meta.upload_id,
                        .chunk_size = session.meta.chunk_size,
                        .total_chunks = session.meta.total_chunks(),
                        .uploaded = session.uploaded,
                    };
                    nlohmann::json payload = response;
                    payload["resumed"] = session.resumed;
                    send_response(session_common::make_ok_response(std::move(payload), envelope.request_id)); });
    }

    void Session::handle_upload_chunk(const dropdeck::protocol::RequestEnvelope &envelope)
    {
        if (!require_identity(envelope))
        {
            return;
        }
        guarded(envelope, [&]
                {
                    const auto request = envelope.payload.get<dropdeck::protocol::UploadChunkRequest>();
                    const auto data = dropdeck::encoding::decode_base64(request.data_base64);
                    if (!data)
                    {
                        throw TransferError(dropdeck::ErrorCode::InvalidPayload, "Invalid chunk data");
                    }
                    services_.transfers.put_chunk(request.upload_id, request.index, *data);

                    nlohmann::json payload;
                    payload["index"] = request.index;
                    payload["bytes"] = data->size();
                    send_response(session_common::make_ok_response(std::move(payload), envelope.request_id)); });
    }

    void Session::handle_upload_complete(const dropdeck::protocol::RequestEnvelope &envelope)
    {
        if (!require_identity(envelope))
        {
            return;
        }
        guarded(envelope, [&]
                {
                    const auto request = envelope.payload.get<dropdeck::protocol::UploadCompleteRequest>();
                    const auto item = services_.transfers.upload_complete(request.upload_id);
                    send_response(session_common::make_ok_response(item, envelope.request_id)); });
    }

} // namespace dropdeck::server
