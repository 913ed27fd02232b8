#pragma once

#include <asio/ip/tcp.hpp>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "dropdeck/error_codes.hpp"
#include "dropdeck/framing.hpp"
#include "dropdeck/protocol.hpp"
#include "dropdeck/server/broadcaster.hpp"
#include "dropdeck/server/transfer_service.hpp"

namespace dropdeck::server
{

    struct ServerServices
    {
        TransferService &transfers;
        Broadcaster &broadcaster;
    };

    /**
     * One client connection. The socket is bound to a strand, so every completion handler and
     * every queued event runs serialized; outbound frames go through write_queue_ so responses
     * and pushed events never interleave on the wire.
     */
    class Session : public std::enable_shared_from_this<Session>, public Subscriber
    {
    public:
        Session(asio::ip::tcp::socket socket, ServerServices services);
        ~Session() override;

        void start();

        void stop();

        void deliver(const TransferEvent &event) override;

    private:
        using Frame = std::shared_ptr<const std::vector<std::uint8_t>>;

        void read_frame_header();
        void read_frame_payload(std::size_t size);
        void process_message(const nlohmann::json &json);
        void send_response(const dropdeck::protocol::ResponseEnvelope &envelope);
        void send_error(dropdeck::ErrorCode code, std::string message,
                        std::optional<std::string> request_id = std::nullopt,
                        nlohmann::json payload = nlohmann::json::object());
        void queue_frame(Frame frame);
        void write_next();
        bool require_identity(const dropdeck::protocol::RequestEnvelope &envelope);
        void on_disconnect();

        // Runs a handler body and maps TransferError, JSON and unexpected errors to responses.
        void guarded(const dropdeck::protocol::RequestEnvelope &envelope, const std::function<void()> &handler);

        // Command handlers
        void handle_identify(const dropdeck::protocol::RequestEnvelope &envelope);
        void handle_upload_init(const dropdeck::protocol::RequestEnvelope &envelope);
        void handle_upload_chunk(const dropdeck::protocol::RequestEnvelope &envelope);
        void handle_upload_complete(const dropdeck::protocol::RequestEnvelope &envelope);
        void handle_submit_text(const dropdeck::protocol::RequestEnvelope &envelope);
        void handle_list_items(const dropdeck::protocol::RequestEnvelope &envelope);
        void handle_delete_item(const dropdeck::protocol::RequestEnvelope &envelope);
        void handle_download_init(const dropdeck::protocol::RequestEnvelope &envelope);
        void handle_download_chunk(const dropdeck::protocol::RequestEnvelope &envelope);

        std::string remote_endpoint() const;

        asio::ip::tcp::socket socket_;
        ServerServices services_;

        dropdeck::protocol::FrameHeader header_buffer_{};
        std::vector<std::uint8_t> buffer_;
        std::deque<Frame> write_queue_;
        bool closed_{false};

        std::string identity_;
        std::optional<Broadcaster::SubscriptionId> subscription_;

        struct DownloadTransfer
        {
            std::filesystem::path path;
            std::uint64_t total_size{};
            std::uint64_t chunk_size{};
        };
        std::unordered_map<std::string, DownloadTransfer> downloads_;
    };

} // namespace dropdeck::server
