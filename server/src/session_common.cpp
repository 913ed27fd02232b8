#include "session_common.hpp"

#include <algorithm>
#include <cctype>

#include "dropdeck/error_codes.hpp"
#include "dropdeck/transfer_item.hpp"

namespace dropdeck::server::session_common
{

    namespace
    {
        constexpr std::size_t kMaxUsernameLength = 64;
    } // namespace

    dropdeck::protocol::ResponseEnvelope make_ok_response(nlohmann::json payload,
                                                          const std::optional<std::string> &request_id)
    {
        dropdeck::protocol::ResponseEnvelope envelope;
        envelope.kind = dropdeck::protocol::ResponseKind::Ok;
        envelope.payload = std::move(payload);
        envelope.message = "";
        envelope.error = dropdeck::ErrorCode::Ok;
        envelope.request_id = request_id;
        return envelope;
    }

    dropdeck::protocol::ResponseEnvelope make_event(const dropdeck::TransferEvent &event)
    {
        dropdeck::protocol::ResponseEnvelope envelope;
        envelope.kind = dropdeck::protocol::ResponseKind::Event;
        envelope.payload = event;
        envelope.message = std::string(dropdeck::to_string(event.kind));
        envelope.error = dropdeck::ErrorCode::Ok;
        return envelope;
    }

    nlohmann::json error_payload(const TransferError &error)
    {
        if (const auto *missing = dynamic_cast<const MissingChunkError *>(&error))
        {
            return {{"missingChunk", missing->index()}};
        }
        return nlohmann::json::object();
    }

    bool is_valid_username(const std::string &username) noexcept
    {
        if (username.empty() || username.size() > kMaxUsernameLength)
        {
            return false;
        }
        return std::all_of(username.begin(), username.end(), [](char ch)
                           {
                               const auto c = static_cast<unsigned char>(ch);
                               return std::isalnum(c) || ch == '_' || ch == '-' || ch == '.'; });
    }

} // namespace dropdeck::server::session_common
