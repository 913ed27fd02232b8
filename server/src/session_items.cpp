#include "dropdeck/server/session.hpp"

#include <nlohmann/json.hpp>

#include "dropdeck/server/errors.hpp"
#include "dropdeck/transfer_item.hpp"
#include "session_common.hpp"

namespace dropdeck::server
{

    void Session::handle_submit_text(const dropdeck::protocol::RequestEnvelope &envelope)
    {
        if (!require_identity(envelope))
        {
            return;
        }
        guarded(envelope, [&]
                {
                    const auto request = envelope.payload.get<dropdeck::protocol::SubmitTextRequest>();
                    const auto item = services_.transfers.submit_text(identity_, request.text);
                    send_response(session_common::make_ok_response(item, envelope.request_id)); });
    }

    void Session::handle_list_items(const dropdeck::protocol::RequestEnvelope &envelope)
    {
        if (!require_identity(envelope))
        {
            return;
        }
        guarded(envelope, [&]
                {
                    const auto request = envelope.payload.get<dropdeck::protocol::ListItemsRequest>();
                    auto filter = ItemFilter::All;
                    if (request.type)
                    {
                        const auto parsed = item_filter_from_string(*request.type);
                        if (!parsed)
                        {
                            throw TransferError(dropdeck::ErrorCode::InvalidPayload, "Unknown type filter: " + *request.type);
                        }
                        filter = *parsed;
                    }
                    std::optional<std::size_t> limit;
                    if (request.limit)
                    {
                        limit = static_cast<std::size_t>(*request.limit);
                    }

                    nlohmann::json payload;
                    payload["items"] = services_.transfers.list_items(filter, limit);
                    send_response(session_common::make_ok_response(std::move(payload), envelope.request_id)); });
    }

    void Session::handle_delete_item(const dropdeck::protocol::RequestEnvelope &envelope)
    {
        if (!require_identity(envelope))
        {
            return;
        }
        guarded(envelope, [&]
                {
                    const auto request = envelope.payload.get<dropdeck::protocol::DeleteItemRequest>();
                    const auto removed = services_.transfers.delete_item(request.id);

                    nlohmann::json payload;
                    payload["id"] = request.id;
                    payload["removed"] = removed.has_value();
                    send_response(session_common::make_ok_response(std::move(payload), envelope.request_id)); });
    }

} // namespace dropdeck::server
