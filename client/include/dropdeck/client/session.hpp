#pragma once

#include <asio.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "dropdeck/client/config.hpp"
#include "dropdeck/client/logger.hpp"
#include "dropdeck/protocol.hpp"
#include "dropdeck/transfer_item.hpp"

namespace dropdeck::client
{

    class ClientSession
    {
    public:
        ClientSession(ClientConfig config, Logger logger);

        int run();

    private:
        void connect();
        void identify();
        void interactive_shell();
        bool dispatch(const std::string &command, const std::vector<std::string> &args, const std::string &rest);

        bool handle_text(const std::string &text);
        bool handle_list(const std::vector<std::string> &args);
        bool handle_delete(const std::vector<std::string> &args);
        bool handle_watch(const std::vector<std::string> &args);
        bool handle_upload(const std::vector<std::string> &args);
        bool handle_fetch(const std::vector<std::string> &args);
        bool perform_upload(const std::filesystem::path &local_path);
        bool send_chunk(std::ifstream &in, const std::string &upload_id, std::uint64_t index,
                        std::uint64_t chunk_size, std::uint64_t file_size);
        bool perform_download(const std::string &file_name, const std::filesystem::path &local_target);

        // Sends one request and waits for its response; EVENT frames received meanwhile are printed.
        dropdeck::protocol::ResponseEnvelope rpc(dropdeck::protocol::Command command,
                                                 const nlohmann::json &payload = nlohmann::json::object());
        void send_frame(const nlohmann::json &message);
        nlohmann::json read_frame();

        void print_help() const;
        void print_error(const dropdeck::protocol::ResponseEnvelope &response) const;
        static void print_item(const dropdeck::TransferItem &item);
        void print_event(const dropdeck::protocol::ResponseEnvelope &event);
        std::string next_request_id();

        ClientConfig config_;
        Logger logger_;
        asio::io_context io_context_;
        asio::ip::tcp::socket socket_;
        std::string identity_;
        std::uint64_t request_counter_{0};
    };

} // namespace dropdeck::client
