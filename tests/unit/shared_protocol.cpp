#include <algorithm>
#include <array>
#include <cassert>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "dropdeck/crypto.hpp"
#include "dropdeck/encoding/base64.hpp"
#include "dropdeck/error_codes.hpp"
#include "dropdeck/framing.hpp"
#include "dropdeck/protocol.hpp"
#include "dropdeck/transfer_item.hpp"

using namespace dropdeck;
using namespace dropdeck::protocol;

void run_server_component_tests();
void run_transfer_service_tests();
void run_session_tests();

namespace
{

    std::vector<std::byte> bytes_of(std::string_view text)
    {
        const auto view = std::as_bytes(std::span(text.data(), text.size()));
        return {view.begin(), view.end()};
    }

    void test_request_envelope()
    {
        RequestEnvelope envelope{};
        envelope.command = Command::ListItems;
        envelope.payload = ListItemsRequest{.type = std::string("photo"), .limit = 5};
        envelope.request_id = std::string("req-42");

        const auto json = nlohmann::json(envelope);
        assert(json.at("cmd") == "LIST_ITEMS");
        assert(json.at("id") == "req-42");
        assert(json.at("payload").at("type") == "photo");

        const auto decoded = json.get<RequestEnvelope>();
        assert(decoded.command == Command::ListItems);
        assert(decoded.payload == envelope.payload);
        assert(decoded.request_id == envelope.request_id);

        const auto list = decoded.payload.get<ListItemsRequest>();
        assert(list.type == std::optional<std::string>("photo"));
        assert(list.limit == std::optional<std::uint64_t>(5));

        bool caught = false;
        try
        {
            (void)nlohmann::json{{"cmd", "FORMAT_DISK"}, {"payload", nlohmann::json::object()}}.get<RequestEnvelope>();
        }
        catch (const std::exception &)
        {
            caught = true;
        }
        assert(caught);
    }

    void test_response_envelope()
    {
        ResponseEnvelope envelope{};
        envelope.kind = ResponseKind::Error;
        envelope.error = ErrorCode::Conflict;
        envelope.message = "missing chunk 3";
        envelope.payload = {{"missingChunk", 3}};
        envelope.request_id = std::string("req-7");

        const auto json = nlohmann::json(envelope);
        assert(json.at("status") == "ERROR");
        assert(json.at("error") == to_int(ErrorCode::Conflict));

        const auto decoded = json.get<ResponseEnvelope>();
        assert(decoded.kind == ResponseKind::Error);
        assert(decoded.error == ErrorCode::Conflict);
        assert(decoded.message == envelope.message);
        assert(decoded.payload.at("missingChunk") == 3);
        assert(decoded.request_id == envelope.request_id);

        // Pushed events carry no request id.
        ResponseEnvelope event{.kind = ResponseKind::Event, .message = "delete", .payload = {{"type", "delete"}, {"id", "x"}}};
        const auto event_json = nlohmann::json(event);
        assert(!event_json.contains("id"));
        assert(event_json.get<ResponseEnvelope>().kind == ResponseKind::Event);
    }

    void test_upload_payloads()
    {
        const auto init = nlohmann::json{
            {"fileName", "holiday.jpg"},
            {"size", 5000000},
            {"mime", "image/jpeg"},
            {"fileKey", "holiday.jpg:5000000:1700000000"},
        }
                              .get<UploadInitRequest>();
        assert(init.file_name == "holiday.jpg");
        assert(init.size == 5000000);
        assert(init.chunk_size == 0);

        UploadInitResponse response{
            .upload_id = "0123456789abcdef0123456789abcdef",
            .chunk_size = 2097152,
            .total_chunks = 3,
            .uploaded = {0, 2},
        };
        const auto response_json = nlohmann::json(response);
        assert(response_json.at("uploadId") == response.upload_id);
        assert(response_json.at("totalChunks") == 3);
        assert(response_json.at("uploaded") == nlohmann::json::array({0, 2}));

        UploadChunkRequest chunk{.upload_id = response.upload_id, .index = 2, .data_base64 = "aGk="};
        const auto chunk_json = nlohmann::json(chunk);
        assert(chunk_json.at("data") == "aGk=");
        assert(chunk_json.get<UploadChunkRequest>().index == 2);

        bool caught = false;
        try
        {
            (void)nlohmann::json{{"uploadId", "abc"}}.get<UploadChunkRequest>();
        }
        catch (const nlohmann::json::exception &)
        {
            caught = true;
        }
        assert(caught);
    }

    void test_download_payloads()
    {
        TransferDescriptor descriptor{
            .transfer_id = "t-1",
            .total_size = 4096,
            .chunk_size = 1024,
            .hash = std::string("cafe"),
        };
        const auto decoded_descriptor = nlohmann::json(descriptor).get<TransferDescriptor>();
        assert(decoded_descriptor.transfer_id == descriptor.transfer_id);
        assert(decoded_descriptor.hash == descriptor.hash);

        DownloadChunkResponse response{
            .transfer_id = "t-1",
            .offset = 1024,
            .bytes = 4,
            .done = false,
            .data_base64 = "dGVzdA==",
            .chunk_hash = "1234",
        };
        const auto json = nlohmann::json(response);
        assert(json.at("chunkHash") == "1234");
        const auto decoded = json.get<DownloadChunkResponse>();
        assert(decoded.offset == response.offset);
        assert(decoded.data_base64 == response.data_base64);
        assert(!decoded.done);
    }

    void test_framing()
    {
        const nlohmann::json message = {{"cmd", "PING"}, {"payload", nlohmann::json::object()}};
        const auto frame = encode_frame(message);
        assert(frame.size() > kFrameHeaderSize);

        FrameHeader header{};
        std::copy_n(frame.begin(), kFrameHeaderSize, header.begin());
        const auto size = frame_payload_size(header);
        assert(size == frame.size() - kFrameHeaderSize);
        assert(header[0] == 0);

        const auto decoded = parse_frame_payload(std::span(frame).subspan(kFrameHeaderSize));
        assert(decoded == message);

        const FrameHeader big = {0x01, 0x02, 0x03, 0x04};
        assert(frame_payload_size(big) == 0x01020304u);

        const std::array<std::uint8_t, 3> garbage = {'{', 'x', '}'};
        bool caught = false;
        try
        {
            (void)parse_frame_payload(garbage);
        }
        catch (const nlohmann::json::parse_error &)
        {
            caught = true;
        }
        assert(caught);
    }

    void test_base64()
    {
        using dropdeck::encoding::decode_base64;
        using dropdeck::encoding::encode_base64;

        assert(encode_base64(bytes_of("")).empty());
        assert(encode_base64(bytes_of("f")) == "Zg==");
        assert(encode_base64(bytes_of("fo")) == "Zm8=");
        assert(encode_base64(bytes_of("foo")) == "Zm9v");
        assert(encode_base64(bytes_of("foobar")) == "Zm9vYmFy");

        const auto decoded = decode_base64("Zm9vYg==");
        assert(decoded && *decoded == bytes_of("foob"));

        const std::array<std::byte, 4> binary = {std::byte{0x00}, std::byte{0xFF}, std::byte{0x10}, std::byte{0x80}};
        const auto roundtrip = decode_base64(encode_base64(binary));
        assert(roundtrip && std::equal(roundtrip->begin(), roundtrip->end(), binary.begin(), binary.end()));

        assert(!decode_base64("Zm9"));      // not a multiple of four
        assert(!decode_base64("Zm9v!A==")); // outside the alphabet
        assert(!decode_base64("Zg==Zm8=")); // padding before the last group
        assert(!decode_base64("Z==="));     // too much padding
        assert(!decode_base64("Zm=v"));     // data after padding
    }

    void test_transfer_item_json()
    {
        TransferItem text{
            .id = "a1",
            .type = ItemType::Text,
            .content = "hello",
            .timestamp = 1700000000000,
            .sender = "alice",
        };
        const auto text_json = nlohmann::json(text);
        assert(text_json.at("type") == "text");
        assert(text_json.at("content") == "hello");
        assert(!text_json.contains("file"));
        assert(text_json.get<TransferItem>() == text);

        TransferItem photo{
            .id = "b2",
            .type = ItemType::File,
            .file = FileInfo{.name = "cat.png", .size = 10, .mime = "image/png", .url = "/file/b2_cat.png"},
            .timestamp = 1700000000001,
            .sender = "bob",
        };
        const auto photo_json = nlohmann::json(photo);
        assert(photo_json.at("file").at("url") == "/file/b2_cat.png");
        assert(!photo_json.contains("content"));
        assert(photo_json.get<TransferItem>() == photo);

        assert(photo.is_photo());
        assert(!text.is_photo());
        assert(matches(ItemFilter::Photo, photo));
        assert(matches(ItemFilter::File, photo));
        assert(!matches(ItemFilter::Text, photo));
        assert(matches(ItemFilter::All, text));

        auto document = photo;
        document.file->mime = "application/pdf";
        assert(!matches(ItemFilter::Photo, document));

        assert(item_filter_from_string("photo") == ItemFilter::Photo);
        assert(to_string(ItemFilter::Photo) == "photo");
        assert(!item_filter_from_string("video"));
    }

    void test_transfer_event_json()
    {
        TransferItem item{.id = "c3", .type = ItemType::Text, .content = "hi", .timestamp = 1, .sender = "carol"};

        const auto added = nlohmann::json(TransferEvent::added(item));
        assert(added.at("type") == "add");
        assert(added.at("item").at("id") == "c3");
        const auto decoded_added = added.get<TransferEvent>();
        assert(decoded_added.kind == EventKind::Add);
        assert(decoded_added.item && *decoded_added.item == item);

        const auto deleted = nlohmann::json(TransferEvent::deleted("c3"));
        assert(deleted == (nlohmann::json{{"type", "delete"}, {"id", "c3"}}));
        const auto decoded_deleted = deleted.get<TransferEvent>();
        assert(decoded_deleted.kind == EventKind::Delete);
        assert(decoded_deleted.id == "c3");
        assert(!decoded_deleted.item);
    }

    void test_error_codes()
    {
        assert(to_string(ErrorCode::NotFound) == "not_found");
        assert(error_code_from_int(to_int(ErrorCode::IoError)) == ErrorCode::IoError);
        assert(error_code_from_int(999) == ErrorCode::InternalError);
        assert(to_string(static_cast<ErrorCode>(77)) == "unknown");

        assert(is_retryable(ErrorCode::Conflict));
        assert(is_retryable(ErrorCode::IoError));
        assert(!is_retryable(ErrorCode::NotFound));
        assert(!is_retryable(ErrorCode::InvalidPayload));
        assert(!is_retryable(ErrorCode::Ok));
    }

    void test_crypto()
    {
        const auto id = crypto::generate_id();
        assert(id.size() == 32);
        assert(id.find_first_not_of("0123456789abcdef") == std::string::npos);
        assert(crypto::generate_id() != id);
        assert(crypto::generate_id(12).size() == 24);

        const std::array<std::byte, 4> chunk = {
            std::byte{0xDE},
            std::byte{0xAD},
            std::byte{0xBE},
            std::byte{0xEF},
        };
        const auto chunk_hash = crypto::hash_bytes(chunk);
        assert(chunk_hash.size() == 64);

        crypto::ContentHasher incremental;
        incremental.update(std::span(chunk).first(1));
        incremental.update(std::span(chunk).subspan(1));
        assert(incremental.finish() == chunk_hash);

        const auto file_path = std::filesystem::temp_directory_path() / "dropdeck_crypto_test.bin";
        {
            std::ofstream file(file_path, std::ios::binary);
            file.write("\xDE\xAD\xBE\xEF", 4);
        }
        assert(crypto::hash_file(file_path) == chunk_hash);
        std::filesystem::remove(file_path);
    }

} // namespace

int main()
{
    try
    {
        test_request_envelope();
        test_response_envelope();
        test_upload_payloads();
        test_download_payloads();
        test_framing();
        test_base64();
        test_transfer_item_json();
        test_transfer_event_json();
        test_error_codes();
        test_crypto();
        run_server_component_tests();
        run_transfer_service_tests();
        run_session_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    std::cout << "All tests passed\n";
    return 0;
}
