#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "dropdeck/protocol.hpp"
#include "dropdeck/server/errors.hpp"
#include "dropdeck/transfer_item.hpp"

namespace dropdeck::server::session_common
{

    dropdeck::protocol::ResponseEnvelope make_ok_response(nlohmann::json payload,
                                                          const std::optional<std::string> &request_id);

    dropdeck::protocol::ResponseEnvelope make_event(const dropdeck::TransferEvent &event);

    // Extra payload attached to an error response, e.g. the missing chunk index.
    nlohmann::json error_payload(const TransferError &error);

    bool is_valid_username(const std::string &username) noexcept;

} // namespace dropdeck::server::session_common
