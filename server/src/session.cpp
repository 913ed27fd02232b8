#include "dropdeck/server/session.hpp"

#include <asio/post.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>
#include <nlohmann/json.hpp>

#include <string>

#include <spdlog/spdlog.h>

#include "dropdeck/error_codes.hpp"
#include "dropdeck/framing.hpp"
#include "dropdeck/server/errors.hpp"
#include "session_common.hpp"

namespace dropdeck::server
{

    Session::Session(asio::ip::tcp::socket socket, ServerServices services)
        : socket_(std::move(socket)), services_(services) {}

    Session::~Session()
    {
        on_disconnect();
    }

    void Session::start()
    {
        spdlog::info("Client connected from {}", remote_endpoint());
        read_frame_header();
    }

    void Session::stop()
    {
        if (closed_)
        {
            return;
        }
        closed_ = true;
        std::error_code ec;
        spdlog::info("Closing connection for {}", remote_endpoint());
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
        on_disconnect();
    }

    void Session::deliver(const TransferEvent &event)
    {
        // Called from whichever thread committed the index change; hop onto this session's strand.
        Frame frame = std::make_shared<const std::vector<std::uint8_t>>(
            dropdeck::protocol::encode_frame(nlohmann::json(session_common::make_event(event))));
        auto self = shared_from_this();
        asio::post(socket_.get_executor(), [self, frame]()
                   {
                       if (!self->closed_)
                       {
                           self->queue_frame(frame);
                       } });
    }

    void Session::read_frame_header()
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(header_buffer_),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             const std::uint32_t payload_size = dropdeck::protocol::frame_payload_size(header_buffer_);
                             if (payload_size == 0)
                             {
                                 read_frame_header();
                                 return;
                             }
                             if (payload_size > dropdeck::protocol::kMaxFrameSize)
                             {
                                 spdlog::warn("{} sent an oversized frame ({} bytes), disconnecting", remote_endpoint(),
                                              payload_size);
                                 stop();
                                 return;
                             }
                             buffer_.resize(payload_size);
                             read_frame_payload(payload_size);
                         });
    }

    void Session::read_frame_payload(std::size_t size)
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(buffer_.data(), size),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             try
                             {
                                 const auto json = dropdeck::protocol::parse_frame_payload(buffer_);
                                 process_message(json);
                             }
                             catch (const std::exception &ex)
                             {
                                 send_error(dropdeck::ErrorCode::InvalidPayload, ex.what());
                             }
                             buffer_.clear();
                             buffer_.shrink_to_fit();
                             read_frame_header();
                         });
    }

    void Session::process_message(const nlohmann::json &json)
    {
        dropdeck::protocol::RequestEnvelope envelope;
        try
        {
            envelope = json.get<dropdeck::protocol::RequestEnvelope>();
        }
        catch (const std::exception &ex)
        {
            send_error(dropdeck::ErrorCode::InvalidCommand, ex.what());
            return;
        }

        spdlog::debug("{} -> command {}", remote_endpoint(), dropdeck::protocol::to_string(envelope.command));

        switch (envelope.command)
        {
        case dropdeck::protocol::Command::Ping:
            send_response(session_common::make_ok_response(nlohmann::json::object(), envelope.request_id));
            break;
        case dropdeck::protocol::Command::Identify:
            handle_identify(envelope);
            break;
        case dropdeck::protocol::Command::UploadInit:
            handle_upload_init(envelope);
            break;
        case dropdeck::protocol::Command::UploadChunk:
            handle_upload_chunk(envelope);
            break;
        case dropdeck::protocol::Command::UploadComplete:
            handle_upload_complete(envelope);
            break;
        case dropdeck::protocol::Command::SubmitText:
            handle_submit_text(envelope);
            break;
        case dropdeck::protocol::Command::ListItems:
            handle_list_items(envelope);
            break;
        case dropdeck::protocol::Command::DeleteItem:
            handle_delete_item(envelope);
            break;
        case dropdeck::protocol::Command::DownloadInit:
            handle_download_init(envelope);
            break;
        case dropdeck::protocol::Command::DownloadChunk:
            handle_download_chunk(envelope);
            break;
        default:
            send_error(dropdeck::ErrorCode::Unsupported, "Command not supported", envelope.request_id);
            break;
        }
    }

    void Session::send_response(const dropdeck::protocol::ResponseEnvelope &envelope)
    {
        try
        {
            const auto json = nlohmann::json(envelope);
            queue_frame(std::make_shared<const std::vector<std::uint8_t>>(dropdeck::protocol::encode_frame(json)));
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Failed to encode response for {}: {}", remote_endpoint(), ex.what());
            if (envelope.kind != dropdeck::protocol::ResponseKind::Error)
            {
                send_error(dropdeck::ErrorCode::InternalError, ex.what(), envelope.request_id);
            }
        }
    }

    void Session::send_error(dropdeck::ErrorCode code, std::string message, std::optional<std::string> request_id,
                             nlohmann::json payload)
    {
        dropdeck::protocol::ResponseEnvelope envelope;
        envelope.kind = dropdeck::protocol::ResponseKind::Error;
        envelope.error = code;
        envelope.message = std::move(message);
        envelope.payload = std::move(payload);
        envelope.request_id = std::move(request_id);
        send_response(envelope);
    }

    void Session::queue_frame(Frame frame)
    {
        if (closed_)
        {
            return;
        }
        write_queue_.push_back(std::move(frame));
        if (write_queue_.size() == 1)
        {
            write_next();
        }
    }

    void Session::write_next()
    {
        auto self = shared_from_this();
        const auto &frame = write_queue_.front();
        asio::async_write(socket_, asio::buffer(*frame),
                          [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              if (ec)
                              {
                                  write_queue_.clear();
                                  stop();
                                  return;
                              }
                              write_queue_.pop_front();
                              if (!write_queue_.empty())
                              {
                                  write_next();
                              }
                          });
    }

    void Session::guarded(const dropdeck::protocol::RequestEnvelope &envelope, const std::function<void()> &handler)
    {
        try
        {
            handler();
        }
        catch (const TransferError &error)
        {
            send_error(error.code(), error.what(), envelope.request_id, session_common::error_payload(error));
        }
        catch (const nlohmann::json::exception &ex)
        {
            send_error(dropdeck::ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("{} failed for {}: {}", dropdeck::protocol::to_string(envelope.command), remote_endpoint(),
                          ex.what());
            send_error(dropdeck::ErrorCode::InternalError, ex.what(), envelope.request_id);
        }
    }

    bool Session::require_identity(const dropdeck::protocol::RequestEnvelope &envelope)
    {
        if (identity_.empty())
        {
            send_error(dropdeck::ErrorCode::AuthenticationRequired, "Identify first", envelope.request_id);
            return false;
        }
        return true;
    }

    void Session::handle_identify(const dropdeck::protocol::RequestEnvelope &envelope)
    {
        guarded(envelope, [&]
                {
                    const auto request = envelope.payload.get<dropdeck::protocol::IdentifyRequest>();
                    if (!session_common::is_valid_username(request.username))
                    {
                        throw TransferError(dropdeck::ErrorCode::InvalidPayload, "Invalid username");
                    }
                    if (!identity_.empty() && identity_ != request.username)
                    {
                        throw TransferError(dropdeck::ErrorCode::Conflict, "Already identified as " + identity_);
                    }
                    identity_ = request.username;
                    if (!subscription_)
                    {
                        subscription_ = services_.broadcaster.subscribe(shared_from_this());
                    }

                    nlohmann::json payload;
                    payload["identity"] = identity_;
                    send_response(session_common::make_ok_response(std::move(payload), envelope.request_id));
                    spdlog::info("Session identified as {} ({})", identity_, remote_endpoint()); });
    }

    void Session::on_disconnect()
    {
        if (subscription_)
        {
            services_.broadcaster.unsubscribe(*subscription_);
            subscription_.reset();
        }
        downloads_.clear();
    }

    std::string Session::remote_endpoint() const
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        if (ec)
        {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

} // namespace dropdeck::server
