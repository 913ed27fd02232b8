#include "dropdeck/client/session.hpp"

#include <iostream>
#include <string>
#include <vector>

#include "dropdeck/protocol.hpp"
#include "dropdeck/transfer_item.hpp"

namespace dropdeck::client
{

    bool ClientSession::handle_text(const std::string &text)
    {
        if (text.empty())
        {
            std::cout << "ERROR: invalid_usage" << std::endl;
            std::cout << "Usage: TEXT <message>" << std::endl;
            return true;
        }
        auto response = rpc(dropdeck::protocol::Command::SubmitText, dropdeck::protocol::SubmitTextRequest{.text = text});
        if (response.kind == dropdeck::protocol::ResponseKind::Error)
        {
            print_error(response);
            return true;
        }
        print_item(response.payload.get<dropdeck::TransferItem>());
        return true;
    }

    bool ClientSession::handle_list(const std::vector<std::string> &args)
    {
        if (args.size() > 2)
        {
            std::cout << "ERROR: invalid_usage" << std::endl;
            std::cout << "Usage: LIST [all|text|file|photo] [limit]" << std::endl;
            return true;
        }
        dropdeck::protocol::ListItemsRequest request;
        if (!args.empty())
        {
            request.type = args[0];
        }
        if (args.size() == 2)
        {
            request.limit = std::stoull(args[1]);
        }

        auto response = rpc(dropdeck::protocol::Command::ListItems, request);
        if (response.kind == dropdeck::protocol::ResponseKind::Error)
        {
            print_error(response);
            return true;
        }
        const auto items = response.payload.at("items").get<std::vector<dropdeck::TransferItem>>();
        for (const auto &item : items)
        {
            print_item(item);
        }
        std::cout << items.size() << " item(s)" << std::endl;
        return true;
    }

    bool ClientSession::handle_delete(const std::vector<std::string> &args)
    {
        if (args.size() != 1)
        {
            std::cout << "ERROR: invalid_usage" << std::endl;
            std::cout << "Usage: DELETE <id>" << std::endl;
            return true;
        }
        auto response = rpc(dropdeck::protocol::Command::DeleteItem, dropdeck::protocol::DeleteItemRequest{.id = args[0]});
        if (response.kind == dropdeck::protocol::ResponseKind::Error)
        {
            print_error(response);
            return true;
        }
        std::cout << (response.payload.value("removed", false) ? "OK" : "OK (already gone)") << std::endl;
        return true;
    }

    bool ClientSession::handle_watch(const std::vector<std::string> &args)
    {
        if (args.size() > 1)
        {
            std::cout << "ERROR: invalid_usage" << std::endl;
            std::cout << "Usage: WATCH [count]" << std::endl;
            return true;
        }
        // Without a count this blocks until the connection closes.
        const std::uint64_t count = args.empty() ? 0 : std::stoull(args[0]);
        std::cout << "Waiting for events..." << std::endl;
        for (std::uint64_t seen = 0; count == 0 || seen < count;)
        {
            auto frame = read_frame().get<dropdeck::protocol::ResponseEnvelope>();
            if (frame.kind != dropdeck::protocol::ResponseKind::Event)
            {
                continue;
            }
            print_event(frame);
            ++seen;
        }
        return true;
    }

} // namespace dropdeck::client
