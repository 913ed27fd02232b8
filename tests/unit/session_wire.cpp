#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/read.hpp>
#include <asio/strand.hpp>
#include <asio/write.hpp>

#include <cassert>
#include <chrono>
#include <deque>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "dropdeck/encoding/base64.hpp"
#include "dropdeck/error_codes.hpp"
#include "dropdeck/framing.hpp"
#include "dropdeck/protocol.hpp"
#include "dropdeck/server/atomic_writer.hpp"
#include "dropdeck/server/broadcaster.hpp"
#include "dropdeck/server/chunk_store.hpp"
#include "dropdeck/server/errors.hpp"
#include "dropdeck/server/filesystem.hpp"
#include "dropdeck/server/session.hpp"
#include "dropdeck/server/transfer_index.hpp"
#include "dropdeck/server/transfer_service.hpp"
#include "session_common.hpp"

using namespace dropdeck;
using namespace dropdeck::server;
using asio::ip::tcp;

namespace
{

    // Services first: sessions left in the context unsubscribe from the broadcaster on teardown.
    struct WireFixture
    {
        explicit WireFixture(const std::string &name)
            : root(prepare(name)),
              filesystem(root),
              writer(AtomicWriteOptions{.rename_attempts = 2, .rename_backoff = std::chrono::milliseconds(1), .sync = false}),
              chunks(filesystem, writer),
              index(filesystem.index_path(), writer),
              service(filesystem, chunks, index, broadcaster),
              io(std::in_place),
              client(client_io)
        {
        }

        ~WireFixture()
        {
            std::error_code ec;
            client.close(ec);
            if (runner.joinable())
            {
                runner.join();
            }
            io.reset();
            std::filesystem::remove_all(root, ec);
        }

        static std::filesystem::path prepare(const std::string &name)
        {
            const auto path = std::filesystem::temp_directory_path() / name;
            std::error_code ec;
            std::filesystem::remove_all(path, ec);
            return path;
        }

        // Connects the client socket to a fresh Session and runs the server side on a thread.
        void connect()
        {
            tcp::acceptor acceptor(*io, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
            client.connect(acceptor.local_endpoint());
            tcp::socket server_side(asio::make_strand(*io));
            acceptor.accept(server_side);

            auto session = std::make_shared<Session>(std::move(server_side), ServerServices{service, broadcaster});
            session->start();
            runner = std::thread([this]
                                 { io->run(); });
        }

        void send(const std::string &command, nlohmann::json payload, const std::string &id)
        {
            const auto frame = protocol::encode_frame(
                nlohmann::json{{"cmd", command}, {"payload", std::move(payload)}, {"id", id}});
            asio::write(client, asio::buffer(frame));
        }

        nlohmann::json read_frame()
        {
            protocol::FrameHeader header{};
            asio::read(client, asio::buffer(header));
            std::vector<std::uint8_t> payload(protocol::frame_payload_size(header));
            asio::read(client, asio::buffer(payload));
            return protocol::parse_frame_payload(payload);
        }

        // Reads until the response for `id`; events seen on the way are queued.
        nlohmann::json request(const std::string &command, nlohmann::json payload, const std::string &id)
        {
            send(command, std::move(payload), id);
            for (;;)
            {
                auto frame = read_frame();
                if (frame.at("status") == "EVENT")
                {
                    events.push_back(std::move(frame));
                    continue;
                }
                assert(frame.value("id", std::string{}) == id);
                return frame;
            }
        }

        nlohmann::json next_event()
        {
            if (events.empty())
            {
                auto frame = read_frame();
                assert(frame.at("status") == "EVENT");
                return frame;
            }
            auto frame = std::move(events.front());
            events.pop_front();
            return frame;
        }

        std::filesystem::path root;
        Filesystem filesystem;
        AtomicWriter writer;
        ChunkStore chunks;
        TransferIndex index;
        Broadcaster broadcaster;
        TransferService service;

        std::optional<asio::io_context> io;
        std::thread runner;

        asio::io_context client_io;
        tcp::socket client;
        std::deque<nlohmann::json> events;
    };

    void test_error_payloads()
    {
        const auto missing = session_common::error_payload(MissingChunkError(4));
        assert(missing == (nlohmann::json{{"missingChunk", 4}}));

        const auto plain = session_common::error_payload(TransferError(ErrorCode::NotFound, "session not found"));
        assert(plain.is_object() && plain.empty());

        assert(session_common::is_valid_username("alice.b-2_x"));
        assert(!session_common::is_valid_username(""));
        assert(!session_common::is_valid_username("bob smith"));
        assert(!session_common::is_valid_username(std::string(65, 'a')));
    }

    void test_event_frames()
    {
        TransferItem item{};
        item.id = "abc";
        item.type = ItemType::Text;
        item.content = "hi";
        item.timestamp = 10;
        item.sender = "alice";

        const auto added = nlohmann::json(session_common::make_event(TransferEvent::added(item)));
        assert(added.at("status") == "EVENT");
        assert(added.at("error") == to_int(ErrorCode::Ok));
        assert(!added.contains("id"));
        assert(added.at("payload").at("type") == "add");
        assert(added.at("payload").at("item").at("id") == "abc");
        assert(added.at("payload").at("item").at("content") == "hi");

        const auto removed = nlohmann::json(session_common::make_event(TransferEvent::deleted("abc")));
        assert(removed.at("status") == "EVENT");
        assert(removed.at("payload") == (nlohmann::json{{"type", "delete"}, {"id", "abc"}}));

        const auto ok = nlohmann::json(session_common::make_ok_response({{"removed", true}}, std::string("r1")));
        assert(ok.at("status") == "OK");
        assert(ok.at("id") == "r1");
    }

    void test_commands_require_identity()
    {
        WireFixture fixture("dropdeck_wire_identity");
        fixture.connect();

        for (const auto *command : {"LIST_ITEMS", "SUBMIT_TEXT", "UPLOAD_INIT", "DELETE_ITEM", "DOWNLOAD_INIT"})
        {
            const auto response = fixture.request(command, {{"text", "sneaky"}}, command);
            assert(response.at("status") == "ERROR");
            assert(response.at("error") == to_int(ErrorCode::AuthenticationRequired));
        }
        assert(fixture.broadcaster.subscriber_count() == 0);
        assert(fixture.service.list_items(ItemFilter::All, std::nullopt).empty());

        const auto invalid = fixture.request("IDENTIFY", {{"username", "not valid"}}, "bad");
        assert(invalid.at("error") == to_int(ErrorCode::InvalidPayload));

        const auto identified = fixture.request("IDENTIFY", {{"username", "alice"}}, "who");
        assert(identified.at("status") == "OK");
        assert(identified.at("payload").at("identity") == "alice");
        assert(fixture.broadcaster.subscriber_count() == 1);

        const auto listed = fixture.request("LIST_ITEMS", nlohmann::json::object(), "list");
        assert(listed.at("status") == "OK");
        assert(listed.at("payload").at("items").empty());
    }

    void test_wire_events_and_missing_chunk()
    {
        WireFixture fixture("dropdeck_wire_events");
        fixture.connect();
        assert(fixture.request("IDENTIFY", {{"username", "alice"}}, "1").at("status") == "OK");

        const auto text = fixture.request("SUBMIT_TEXT", {{"text", "hello"}}, "2");
        assert(text.at("status") == "OK");
        const auto item_id = text.at("payload").at("id").get<std::string>();

        const auto added = fixture.next_event();
        assert(added.at("payload").at("type") == "add");
        assert(added.at("payload").at("item").at("id") == item_id);
        assert(added.at("payload").at("item").at("content") == "hello");
        assert(added.at("payload").at("item").at("sender") == "alice");

        const auto init = fixture.request("UPLOAD_INIT", {{"fileName", "gap.bin"}, {"size", 8}, {"chunkSize", 4}}, "3");
        assert(init.at("status") == "OK");
        assert(init.at("payload").at("totalChunks") == 2);
        const auto upload_id = init.at("payload").at("uploadId").get<std::string>();

        const std::string tail = "5678";
        const auto encoded = encoding::encode_base64(std::as_bytes(std::span(tail.data(), tail.size())));
        const auto chunk = fixture.request("UPLOAD_CHUNK", {{"uploadId", upload_id}, {"index", 1}, {"data", encoded}}, "4");
        assert(chunk.at("status") == "OK");
        assert(chunk.at("payload").at("bytes") == 4);

        const auto bad_chunk = fixture.request("UPLOAD_CHUNK", {{"uploadId", upload_id}, {"index", 0}, {"data", "%%%"}}, "5");
        assert(bad_chunk.at("error") == to_int(ErrorCode::InvalidPayload));

        const auto incomplete = fixture.request("UPLOAD_COMPLETE", {{"uploadId", upload_id}}, "6");
        assert(incomplete.at("status") == "ERROR");
        assert(incomplete.at("error") == to_int(ErrorCode::Conflict));
        assert(incomplete.at("payload").at("missingChunk") == 0);

        const auto removed = fixture.request("DELETE_ITEM", {{"id", item_id}}, "7");
        assert(removed.at("payload").at("removed") == true);
        const auto deleted = fixture.next_event();
        assert(deleted.at("payload") == (nlohmann::json{{"type", "delete"}, {"id", item_id}}));

        // A second delete is acknowledged without an event.
        assert(fixture.request("DELETE_ITEM", {{"id", item_id}}, "8").at("payload").at("removed") == false);
        assert(fixture.events.empty());
    }

    void test_teardown_with_live_session()
    {
        WireFixture fixture("dropdeck_wire_teardown");
        fixture.connect();
        assert(fixture.request("IDENTIFY", {{"username", "alice"}}, "1").at("status") == "OK");
        assert(fixture.broadcaster.subscriber_count() == 1);

        // Stop with a read still pending, as a signal does; the session is only released when
        // the context itself is destroyed.
        fixture.io->stop();
        fixture.runner.join();
        fixture.io.reset();

        assert(fixture.broadcaster.subscriber_count() == 0);
        assert(fixture.service.submit_text("bob", "after shutdown").sender == "bob");
    }

} // namespace

void run_session_tests()
{
    test_error_payloads();
    test_event_frames();
    test_commands_require_identity();
    test_wire_events_and_missing_chunk();
    test_teardown_with_live_session();
}
