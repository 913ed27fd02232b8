#include "dropdeck/client/session.hpp"

#include <asio/connect.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "dropdeck/error_codes.hpp"
#include "dropdeck/framing.hpp"
#include "dropdeck/protocol.hpp"

namespace dropdeck::client
{

    namespace
    {

        std::string trim(const std::string &input)
        {
            const auto begin = input.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
            {
                return "";
            }
            const auto end = input.find_last_not_of(" \t\r\n");
            return input.substr(begin, end - begin + 1);
        }

        std::vector<std::string> split_tokens(const std::string &input)
        {
            std::vector<std::string> tokens;
            std::istringstream iss(input);
            std::string token;
            while (iss >> token)
            {
                tokens.push_back(token);
            }
            return tokens;
        }

        std::string to_upper(std::string value)
        {
            for (auto &ch : value)
            {
                ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
            }
            return value;
        }

        std::string format_timestamp(std::int64_t timestamp_ms)
        {
            const auto seconds = static_cast<std::time_t>(timestamp_ms / 1000);
            std::tm tm{};
            localtime_r(&seconds, &tm);
            std::ostringstream oss;
            oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
            return oss.str();
        }

    } // namespace

    ClientSession::ClientSession(ClientConfig config, Logger logger)
        : config_(std::move(config)),
          logger_(std::move(logger)),
          socket_(io_context_) {}

    int ClientSession::run()
    {
        try
        {
            connect();
            identify();
            interactive_shell();
        }
        catch (const std::exception &ex)
        {
            std::cerr << "ERROR: " << ex.what() << std::endl;
            logger_.warn(LogTag::Session, "fatal: ", ex.what());
            return 1;
        }
        return 0;
    }

    void ClientSession::connect()
    {
        asio::ip::tcp::resolver resolver(io_context_);
        const auto results = resolver.resolve(config_.host, std::to_string(config_.port));
        asio::connect(socket_, results);
        logger_.log(LogTag::Session, "connected to ", config_.host, ':', config_.port);
    }

    void ClientSession::identify()
    {
        std::string username = config_.username.value_or("");
        if (username.empty())
        {
            std::cout << "Username: " << std::flush;
            if (!std::getline(std::cin, username))
            {
                throw std::runtime_error("No username given");
            }
            username = trim(username);
        }

        auto response = rpc(dropdeck::protocol::Command::Identify, dropdeck::protocol::IdentifyRequest{.username = username});
        if (response.kind != dropdeck::protocol::ResponseKind::Ok)
        {
            throw std::runtime_error("Identification failed: " + response.message);
        }
        identity_ = response.payload.value("identity", username);
        std::cout << "Connected as " << identity_ << std::endl;
        logger_.set_identity(identity_);
        logger_.log(LogTag::Session, "identified as ", identity_);
    }

    void ClientSession::interactive_shell()
    {
        while (true)
        {
            std::cout << identity_ << "> " << std::flush;
            std::string line;
            if (!std::getline(std::cin, line))
            {
                std::cout << std::endl;
                break;
            }
            line = trim(line);
            if (line.empty())
            {
                continue;
            }
            logger_.log(LogTag::Command, line);

            const auto tokens = split_tokens(line);
            const auto command = to_upper(tokens[0]);
            const std::vector<std::string> args(tokens.begin() + 1, tokens.end());
            const auto rest = trim(line.substr(tokens[0].size()));

            if (command == "EXIT" || command == "QUIT")
            {
                std::cout << "OK" << std::endl;
                break;
            }
            if (command == "HELP")
            {
                print_help();
                continue;
            }

            try
            {
                if (!dispatch(command, args, rest))
                {
                    std::cout << "ERROR: unsupported_command" << std::endl;
                }
            }
            catch (const asio::system_error &ex)
            {
                logger_.warn(LogTag::Session, "connection lost: ", ex.what());
                throw;
            }
            catch (const std::exception &ex)
            {
                std::cout << "ERROR: internal_error" << std::endl;
                std::cout << ex.what() << std::endl;
                logger_.warn(LogTag::Command, "command failed: ", ex.what());
            }
        }
    }

    bool ClientSession::dispatch(const std::string &command, const std::vector<std::string> &args,
                                 const std::string &rest)
    {
        if (command == "TEXT")
        {
            return handle_text(rest);
        }
        if (command == "LIST")
        {
            return handle_list(args);
        }
        if (command == "DELETE")
        {
            return handle_delete(args);
        }
        if (command == "UPLOAD")
        {
            return handle_upload(args);
        }
        if (command == "FETCH")
        {
            return handle_fetch(args);
        }
        if (command == "WATCH")
        {
            return handle_watch(args);
        }
        return false;
    }

    void ClientSession::print_help() const
    {
        std::cout << "Available commands:" << std::endl;
        std::cout << "  HELP                       Show this help" << std::endl;
        std::cout << "  EXIT                       Disconnect and exit" << std::endl;
        std::cout << "  TEXT <message>             Share a text snippet" << std::endl;
        std::cout << "  UPLOAD <local>             Upload a file (resumes an interrupted upload)" << std::endl;
        std::cout << "  LIST [all|text|file|photo] [limit]" << std::endl;
        std::cout << "                             List shared items, newest first" << std::endl;
        std::cout << "  DELETE <id>                Remove an item" << std::endl;
        std::cout << "  FETCH <name> [local]       Download an uploaded file" << std::endl;
        std::cout << "  WATCH [count]              Wait for and print pushed events" << std::endl;
        std::cout << "\nFlags:\n";
        std::cout << "  --log <file>               Append structured logs to file\n";
        std::cout << "  --chunk-size <bytes>       Upload chunk size (server default when omitted)\n";
    }

    void ClientSession::print_error(const dropdeck::protocol::ResponseEnvelope &response) const
    {
        std::cout << "ERROR: " << dropdeck::to_string(response.error) << std::endl;
        if (!response.message.empty())
        {
            std::cout << response.message << std::endl;
        }
    }

    void ClientSession::print_item(const dropdeck::TransferItem &item)
    {
        std::cout << item.id << "  " << std::left << std::setw(5) << dropdeck::to_string(item.type) << "  "
                  << format_timestamp(item.timestamp) << "  " << item.sender << "  ";
        if (item.file)
        {
            std::cout << item.file->name << " (" << item.file->size << " bytes, " << item.file->mime << ") "
                      << item.file->url;
        }
        else
        {
            std::cout << item.content;
        }
        std::cout << std::endl;
    }

    void ClientSession::print_event(const dropdeck::protocol::ResponseEnvelope &event)
    {
        const auto transfer_event = event.payload.get<dropdeck::TransferEvent>();
        logger_.log(LogTag::Event, dropdeck::to_string(transfer_event.kind), ' ', transfer_event.id);
        if (transfer_event.kind == dropdeck::EventKind::Add && transfer_event.item)
        {
            std::cout << "[add] ";
            print_item(*transfer_event.item);
        }
        else
        {
            std::cout << "[delete] " << transfer_event.id << std::endl;
        }
    }

    void ClientSession::send_frame(const nlohmann::json &message)
    {
        const auto frame = dropdeck::protocol::encode_frame(message);
        asio::write(socket_, asio::buffer(frame));
    }

    nlohmann::json ClientSession::read_frame()
    {
        dropdeck::protocol::FrameHeader header{};
        asio::read(socket_, asio::buffer(header));
        const auto size = dropdeck::protocol::frame_payload_size(header);
        if (size > dropdeck::protocol::kMaxFrameSize)
        {
            throw std::runtime_error("Server sent an oversized frame");
        }
        std::vector<std::uint8_t> buffer(size);
        asio::read(socket_, asio::buffer(buffer));
        try
        {
            return dropdeck::protocol::parse_frame_payload(buffer);
        }
        catch (const nlohmann::json::exception &ex)
        {
            logger_.warn(LogTag::Rpc, "parse_error size=", size, " msg=", ex.what());
            throw std::runtime_error("Failed to decode server response");
        }
    }

    dropdeck::protocol::ResponseEnvelope ClientSession::rpc(dropdeck::protocol::Command command,
                                                            const nlohmann::json &payload)
    {
        dropdeck::protocol::RequestEnvelope envelope;
        envelope.command = command;
        envelope.payload = payload;
        envelope.request_id = next_request_id();
        send_frame(envelope);

        for (;;)
        {
            auto response = read_frame().get<dropdeck::protocol::ResponseEnvelope>();
            if (response.kind == dropdeck::protocol::ResponseKind::Event)
            {
                print_event(response);
                continue;
            }
            if (response.request_id && *response.request_id != *envelope.request_id)
            {
                logger_.log(LogTag::Rpc, "dropping stale response id=", *response.request_id);
                continue;
            }
            if (response.kind == dropdeck::protocol::ResponseKind::Error)
            {
                logger_.warn(LogTag::Rpc, "cmd=", dropdeck::protocol::to_string(command),
                             " error=", dropdeck::to_string(response.error), " msg=", response.message);
            }
            else
            {
                logger_.log(LogTag::Rpc, "success cmd=", dropdeck::protocol::to_string(command));
            }
            return response;
        }
    }

    std::string ClientSession::next_request_id()
    {
        std::ostringstream oss;
        oss << "req-" << (++request_counter_);
        return oss.str();
    }

} // namespace dropdeck::client
