#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <iterator>
#include <limits>
#include <numeric>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "dropdeck/crypto.hpp"
#include "dropdeck/server/atomic_writer.hpp"
#include "dropdeck/server/chunk_store.hpp"
#include "dropdeck/server/config.hpp"
#include "dropdeck/server/errors.hpp"
#include "dropdeck/server/filesystem.hpp"
#include "dropdeck/server/transfer_index.hpp"

using namespace dropdeck;
using namespace dropdeck::server;

namespace
{

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::filesystem::path fresh_dir(const std::string &name)
    {
        const auto path = std::filesystem::temp_directory_path() / name;
        cleanup_path(path);
        std::filesystem::create_directories(path);
        return path;
    }

    std::string read_text(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }

    std::vector<std::byte> bytes_of(std::string_view text)
    {
        const auto view = std::as_bytes(std::span(text.data(), text.size()));
        return {view.begin(), view.end()};
    }

    std::size_t count_entries(const std::filesystem::path &dir)
    {
        return static_cast<std::size_t>(std::distance(std::filesystem::directory_iterator(dir),
                                                      std::filesystem::directory_iterator()));
    }

    template <typename Fn>
    void expect_transfer_error(Fn &&fn, ErrorCode code)
    {
        bool caught = false;
        try
        {
            fn();
        }
        catch (const TransferError &ex)
        {
            caught = ex.code() == code;
        }
        assert(caught);
    }

    const AtomicWriteOptions kFastWrites{.rename_attempts = 3, .rename_backoff = std::chrono::milliseconds(1), .sync = false};

    UploadRequest upload_request(const std::string &name, std::uint64_t size, std::uint64_t chunk_size,
                                 const std::string &key = {})
    {
        return UploadRequest{
            .file_name = name,
            .size = size,
            .mime = "application/octet-stream",
            .chunk_size = chunk_size,
            .sender = "alice",
            .file_key = key,
        };
    }

    void test_atomic_writer_replaces_content()
    {
        const auto root = fresh_dir("dropdeck_atomic_basic");
        const AtomicWriter writer(kFastWrites);
        const auto target = root / "doc.json";

        writer.write(target, std::string_view("first"));
        assert(read_text(target) == "first");
        writer.write_json(target, nlohmann::json{{"k", 1}});
        assert(nlohmann::json::parse(read_text(target)) == (nlohmann::json{{"k", 1}}));
        assert(count_entries(root) == 1);

        cleanup_path(root);
    }

    void test_atomic_writer_crash_before_rename()
    {
        const auto root = fresh_dir("dropdeck_atomic_crash");
        const auto target = root / "index.json";
        const AtomicWriter good(kFastWrites);
        good.write(target, std::string_view("previous content"));

        AtomicWriteHooks hooks;
        std::filesystem::path seen_temp;
        hooks.before_rename = [&](const std::filesystem::path &temp, const std::filesystem::path &)
        {
            seen_temp = temp;
            assert(read_text(temp) == "new content");
            throw std::runtime_error("simulated crash");
        };
        const AtomicWriter crashing(kFastWrites, hooks);

        bool caught = false;
        try
        {
            crashing.write(target, std::string_view("new content"));
        }
        catch (const std::runtime_error &)
        {
            caught = true;
        }
        assert(caught);
        assert(read_text(target) == "previous content");
        assert(!seen_temp.empty() && !std::filesystem::exists(seen_temp));
        assert(count_entries(root) == 1);

        // A target that never existed stays absent.
        const auto fresh_target = root / "never.json";
        caught = false;
        try
        {
            crashing.write(fresh_target, std::string_view("new content"));
        }
        catch (const std::runtime_error &)
        {
            caught = true;
        }
        assert(caught);
        assert(!std::filesystem::exists(fresh_target));

        cleanup_path(root);
    }

    void test_atomic_writer_rename_retry_and_fallback()
    {
        const auto root = fresh_dir("dropdeck_atomic_retry");
        const auto target = root / "data.bin";

        int attempts = 0;
        AtomicWriteHooks flaky;
        flaky.rename = [&](const std::filesystem::path &temp, const std::filesystem::path &dest)
        {
            if (++attempts < 3)
            {
                return std::make_error_code(std::errc::device_or_resource_busy);
            }
            std::error_code ec;
            std::filesystem::rename(temp, dest, ec);
            return ec;
        };
        AtomicWriter(kFastWrites, flaky).write(target, std::string_view("after retries"));
        assert(attempts == 3);
        assert(read_text(target) == "after retries");

        int failures = 0;
        AtomicWriteHooks broken;
        broken.rename = [&](const std::filesystem::path &, const std::filesystem::path &)
        {
            ++failures;
            return std::make_error_code(std::errc::permission_denied);
        };
        AtomicWriter(kFastWrites, broken).write(target, std::string_view("via fallback"));
        assert(failures == kFastWrites.rename_attempts);
        assert(read_text(target) == "via fallback");
        assert(count_entries(root) == 1);

        cleanup_path(root);
    }

    void test_filesystem_guard()
    {
        const auto root = fresh_dir("dropdeck_fs_guard");
        Filesystem fs(root);
        assert(std::filesystem::is_directory(fs.chunks_root()));
        assert(std::filesystem::is_directory(fs.artifacts_root()));

        assert(Filesystem::is_safe_component("report-2024_v1.pdf"));
        assert(!Filesystem::is_safe_component(""));
        assert(!Filesystem::is_safe_component(".."));
        assert(!Filesystem::is_safe_component(".hidden"));
        assert(!Filesystem::is_safe_component("a/b"));
        assert(!Filesystem::is_safe_component("a\\b"));
        assert(!Filesystem::is_safe_component("a..b"));
        assert(!Filesystem::is_safe_component(std::string("a\0b", 3)));

        assert(Filesystem::sanitize_file_name("my photo.png") == "my_photo.png");
        assert(Filesystem::sanitize_file_name("../../etc/passwd") == "passwd");
        assert(Filesystem::sanitize_file_name(".bashrc") == "bashrc");
        assert(Filesystem::is_safe_component(Filesystem::sanitize_file_name("...")));
        assert(Filesystem::sanitize_file_name("") == "file");

        expect_transfer_error([&]
                              { (void)fs.resolve_artifact("../index.json"); },
                              ErrorCode::InvalidPayload);
        expect_transfer_error([&]
                              { (void)fs.resolve_artifact("missing.txt"); },
                              ErrorCode::NotFound);

        {
            std::ofstream out(fs.artifacts_root() / "present.txt");
            out << "x";
        }
        assert(fs.resolve_artifact("present.txt") == fs.artifacts_root() / "present.txt");

        cleanup_path(root);
    }

    void test_server_config_validation()
    {
        ServerConfig config;
        assert(validate(config) == std::optional<std::string>("--port is required"));
        config.port = 9000;
        assert(validate(config) == std::optional<std::string>("--root is required"));
        config.root = "/srv/dropdeck";
        assert(!validate(config));

        config.max_chunk_size = 0;
        assert(validate(config));
        config.max_chunk_size = 32ULL * 1024 * 1024;
        assert(!validate(config));
        // 48 MiB of base64 text plus the envelope overflows a 64 MiB frame.
        config.max_chunk_size = 48ULL * 1024 * 1024;
        assert(validate(config));

        config.max_chunk_size = kDefaultMaxChunkSize;
        config.upload_timeout = std::chrono::seconds(-1);
        assert(validate(config));
        config.upload_timeout = std::chrono::seconds(0);
        assert(!validate(config));
    }

    void test_chunk_store_merges_out_of_order()
    {
        const auto root = fresh_dir("dropdeck_chunks_merge");
        Filesystem fs(root);
        const AtomicWriter writer(kFastWrites);
        ChunkStore store(fs, writer);

        const std::string content = "0123456789";
        const auto session = store.begin_upload(upload_request("ten bytes.txt", content.size(), 4));
        assert(ChunkStore::is_valid_upload_id(session.meta.upload_id));
        assert(session.meta.total_chunks() == 3);
        assert(session.uploaded.empty());
        assert(!session.resumed);

        const auto bytes = bytes_of(content);
        const std::span<const std::byte> all(bytes);
        store.put_chunk(session.meta.upload_id, 2, all.subspan(8, 2));
        store.put_chunk(session.meta.upload_id, 0, all.subspan(0, 4));
        store.put_chunk(session.meta.upload_id, 1, all.subspan(4, 4));
        assert((store.uploaded_chunks(session.meta.upload_id) == std::vector<std::uint64_t>{0, 1, 2}));

        const auto merged = store.complete(session.meta.upload_id);
        assert(merged.bytes == content.size());
        assert(merged.artifact_name == session.meta.upload_id.substr(0, 8) + "_ten_bytes.txt");
        assert(read_text(merged.path) == content);
        assert(merged.hash == crypto::hash_bytes(bytes));
        assert(!std::filesystem::exists(fs.chunks_root() / session.meta.upload_id));
        assert(!store.find(session.meta.upload_id));
        assert(count_entries(fs.artifacts_root()) == 1);

        expect_transfer_error([&]
                              { (void)store.complete(session.meta.upload_id); },
                              ErrorCode::NotFound);

        cleanup_path(root);
    }

    void test_chunk_store_merges_every_order()
    {
        const auto root = fresh_dir("dropdeck_chunks_orders");
        Filesystem fs(root);
        const AtomicWriter writer(kFastWrites);
        ChunkStore store(fs, writer);

        const std::string content = "abcdefghijk";
        const auto bytes = bytes_of(content);
        const std::span<const std::byte> all(bytes);
        constexpr std::uint64_t kChunk = 3;

        for (std::uint64_t count = 1; count <= 4; ++count)
        {
            // The last chunk is short.
            const auto size = count * kChunk - 1;
            std::vector<std::uint64_t> order(count);
            std::iota(order.begin(), order.end(), std::uint64_t{0});
            do
            {
                const auto session = store.begin_upload(upload_request("order.bin", size, kChunk));
                assert(session.meta.total_chunks() == count);
                for (const auto index : order)
                {
                    const auto offset = index * kChunk;
                    store.put_chunk(session.meta.upload_id, index,
                                    all.subspan(offset, std::min(kChunk, size - offset)));
                }
                const auto merged = store.complete(session.meta.upload_id);
                assert(merged.bytes == size);
                assert(read_text(merged.path) == content.substr(0, size));
                assert(merged.hash == crypto::hash_bytes(all.first(size)));
            } while (std::next_permutation(order.begin(), order.end()));
        }
        assert(count_entries(fs.chunks_root()) == 0);

        cleanup_path(root);
    }

    void test_chunk_store_missing_chunk()
    {
        const auto root = fresh_dir("dropdeck_chunks_missing");
        Filesystem fs(root);
        const AtomicWriter writer(kFastWrites);
        ChunkStore store(fs, writer);

        const auto session = store.begin_upload(upload_request("gap.bin", 9, 3));
        const auto chunk = bytes_of("abc");
        store.put_chunk(session.meta.upload_id, 0, chunk);
        store.put_chunk(session.meta.upload_id, 2, chunk);

        bool caught = false;
        try
        {
            (void)store.complete(session.meta.upload_id);
        }
        catch (const MissingChunkError &ex)
        {
            caught = true;
            assert(ex.index() == 1);
            assert(ex.code() == ErrorCode::Conflict);
            assert(std::string(ex.what()) == "missing chunk 1");
        }
        assert(caught);
        assert(count_entries(fs.artifacts_root()) == 0);
        assert(store.find(session.meta.upload_id));

        // The session stays usable: fill the gap and finish.
        store.put_chunk(session.meta.upload_id, 1, chunk);
        const auto merged = store.complete(session.meta.upload_id);
        assert(read_text(merged.path) == "abcabcabc");

        cleanup_path(root);
    }

    void test_chunk_store_validation()
    {
        const auto root = fresh_dir("dropdeck_chunks_validation");
        Filesystem fs(root);
        const AtomicWriter writer(kFastWrites);
        ChunkStore store(fs, writer, 1024);

        const auto session = store.begin_upload(upload_request("small.bin", 10, 5));
        const auto data = bytes_of("first");

        // Retried chunks overwrite; the last write wins.
        store.put_chunk(session.meta.upload_id, 0, data);
        store.put_chunk(session.meta.upload_id, 0, bytes_of("FIRST"));
        store.put_chunk(session.meta.upload_id, 1, bytes_of("-tail"));
        assert(read_text(store.complete(session.meta.upload_id).path) == "FIRST-tail");

        const auto other = store.begin_upload(upload_request("small.bin", 10, 5));
        expect_transfer_error([&]
                              { store.put_chunk(other.meta.upload_id, 2, data); },
                              ErrorCode::InvalidPayload);
        expect_transfer_error([&]
                              { store.put_chunk("0123456789abcdef0123456789abcdef", 0, data); },
                              ErrorCode::NotFound);
        expect_transfer_error([&]
                              { store.put_chunk("../../etc", 0, data); },
                              ErrorCode::NotFound);
        expect_transfer_error([&]
                              { (void)store.begin_upload(upload_request("big.bin", 10, 4096)); },
                              ErrorCode::InvalidPayload);
        expect_transfer_error([&]
                              { (void)store.begin_upload(upload_request("", 10, 5)); },
                              ErrorCode::InvalidPayload);

        // Default chunk size when the client leaves it to the server.
        ChunkStore roomy(fs, writer);
        const auto defaulted = roomy.begin_upload(upload_request("default.bin", kDefaultChunkSize + 1, 0));
        assert(defaulted.meta.chunk_size == kDefaultChunkSize);
        assert(defaulted.meta.total_chunks() == 2);

        // Sizes near the top of the range do not wrap the chunk count.
        UploadMeta huge{};
        huge.size = std::numeric_limits<std::uint64_t>::max();
        huge.chunk_size = 4;
        assert(huge.total_chunks() == std::numeric_limits<std::uint64_t>::max() / 4 + 1);
        huge.chunk_size = 1;
        assert(huge.total_chunks() == std::numeric_limits<std::uint64_t>::max());
        const auto giant = store.begin_upload(upload_request("giant.bin", std::numeric_limits<std::uint64_t>::max(), 5));
        bool gap = false;
        try
        {
            (void)store.complete(giant.meta.upload_id);
        }
        catch (const MissingChunkError &ex)
        {
            gap = ex.index() == 0;
        }
        assert(gap);

        // Empty files merge into an empty artifact.
        const auto empty = store.begin_upload(upload_request("empty.txt", 0, 5));
        assert(empty.meta.total_chunks() == 0);
        const auto merged = store.complete(empty.meta.upload_id);
        assert(merged.bytes == 0);
        assert(std::filesystem::file_size(merged.path) == 0);

        cleanup_path(root);
    }

    void test_chunk_store_resume()
    {
        const auto root = fresh_dir("dropdeck_chunks_resume");
        Filesystem fs(root);
        const AtomicWriter writer(kFastWrites);
        ChunkStore store(fs, writer);

        const auto first = store.begin_upload(upload_request("movie.mp4", 12, 4, "movie.mp4:12:99"));
        store.put_chunk(first.meta.upload_id, 1, bytes_of("4567"));

        const auto resumed = store.begin_upload(upload_request("movie.mp4", 12, 4, "movie.mp4:12:99"));
        assert(resumed.resumed);
        assert(resumed.meta.upload_id == first.meta.upload_id);
        assert(resumed.uploaded == std::vector<std::uint64_t>{1});

        // Another sender with the same key never picks up this session.
        auto foreign = upload_request("movie.mp4", 12, 4, "movie.mp4:12:99");
        foreign.sender = "mallory";
        const auto separate = store.begin_upload(foreign);
        assert(!separate.resumed);
        assert(separate.meta.upload_id != first.meta.upload_id);

        // Same key, different size: the stale session is discarded.
        const auto restarted = store.begin_upload(upload_request("movie.mp4", 16, 4, "movie.mp4:12:99"));
        assert(!restarted.resumed);
        assert(restarted.meta.upload_id != first.meta.upload_id);
        assert(!store.find(first.meta.upload_id));

        // Leftover sessions for the same key do not hide the live one, wherever they list.
        const auto live = store.begin_upload(upload_request("clip.mov", 8, 4, "clip.mov:8:1"));
        store.put_chunk(live.meta.upload_id, 0, bytes_of("clip"));
        for (const auto &leftover_id : {std::string(32, '0'), std::string(32, 'f')})
        {
            const auto dir = fs.chunks_root() / leftover_id;
            std::filesystem::create_directory(dir);
            writer.write_json(dir / "meta.json", nlohmann::json{
                                                     {"uploadId", leftover_id},
                                                     {"fileName", "clip.mov"},
                                                     {"size", 99},
                                                     {"chunkSize", 4},
                                                     {"fileKey", "clip.mov:8:1"},
                                                     {"sender", "alice"},
                                                 });
        }
        const auto again = store.begin_upload(upload_request("clip.mov", 8, 4, "clip.mov:8:1"));
        assert(again.resumed);
        assert(again.meta.upload_id == live.meta.upload_id);
        assert(again.uploaded == std::vector<std::uint64_t>{0});
        assert(!store.find(std::string(32, '0')));
        assert(!store.find(std::string(32, 'f')));

        // Without a key every init is a new session.
        const auto a = store.begin_upload(upload_request("x.bin", 4, 4));
        const auto b = store.begin_upload(upload_request("x.bin", 4, 4));
        assert(a.meta.upload_id != b.meta.upload_id);

        cleanup_path(root);
    }

    void test_chunk_store_cleanup_expired()
    {
        const auto root = fresh_dir("dropdeck_chunks_reaper");
        Filesystem fs(root);
        const AtomicWriter writer(kFastWrites);
        ChunkStore store(fs, writer);

        const auto stale = store.begin_upload(upload_request("stale.bin", 8, 4));
        const auto active = store.begin_upload(upload_request("active.bin", 8, 4));

        const auto stale_dir = fs.chunks_root() / stale.meta.upload_id;
        std::filesystem::last_write_time(stale_dir,
                                         std::filesystem::file_time_type::clock::now() - std::chrono::hours(2));

        assert(store.cleanup_expired(std::chrono::seconds(0)) == 0);
        assert(store.find(stale.meta.upload_id));

        assert(store.cleanup_expired(std::chrono::hours(1)) == 1);
        assert(!store.find(stale.meta.upload_id));
        assert(store.find(active.meta.upload_id));
        expect_transfer_error([&]
                              { store.put_chunk(stale.meta.upload_id, 0, bytes_of("late")); },
                              ErrorCode::NotFound);

        cleanup_path(root);
    }

    void test_chunk_store_concurrent_complete()
    {
        const auto root = fresh_dir("dropdeck_chunks_concurrent");
        Filesystem fs(root);
        const AtomicWriter writer(kFastWrites);
        ChunkStore store(fs, writer);

        const auto session = store.begin_upload(upload_request("race.bin", 8, 4));
        store.put_chunk(session.meta.upload_id, 0, bytes_of("aaaa"));
        store.put_chunk(session.meta.upload_id, 1, bytes_of("bbbb"));

        std::atomic<int> successes{0};
        std::atomic<int> rejected{0};
        std::vector<std::thread> threads;
        for (int i = 0; i < 4; ++i)
        {
            threads.emplace_back([&]
                                 {
                                     try
                                     {
                                         (void)store.complete(session.meta.upload_id);
                                         ++successes;
                                     }
                                     catch (const TransferError &ex)
                                     {
                                         if (ex.code() == ErrorCode::Conflict || ex.code() == ErrorCode::NotFound)
                                         {
                                             ++rejected;
                                         }
                                     } });
        }
        for (auto &thread : threads)
        {
            thread.join();
        }
        assert(successes == 1);
        assert(rejected == 3);
        assert(count_entries(fs.artifacts_root()) == 1);

        cleanup_path(root);
    }

    void test_chunk_store_complete_waits_for_writes()
    {
        const auto root = fresh_dir("dropdeck_chunks_inflight");
        Filesystem fs(root);

        std::promise<void> write_started;
        std::promise<void> release_write;
        auto released = release_write.get_future().share();
        bool gate_armed = true;
        AtomicWriteHooks hooks;
        hooks.before_rename = [&](const std::filesystem::path &, const std::filesystem::path &target)
        {
            if (gate_armed && target.filename() == "1")
            {
                gate_armed = false;
                write_started.set_value();
                released.wait();
            }
        };
        const AtomicWriter writer(kFastWrites, hooks);
        ChunkStore store(fs, writer);

        const auto session = store.begin_upload(upload_request("slow.bin", 8, 4));
        store.put_chunk(session.meta.upload_id, 0, bytes_of("aaaa"));

        std::thread slow_writer([&]
                                { store.put_chunk(session.meta.upload_id, 1, bytes_of("bbbb")); });
        write_started.get_future().wait();

        std::atomic<bool> done{false};
        std::optional<MergedUpload> merged;
        std::thread completer([&]
                              {
                                  merged = store.complete(session.meta.upload_id);
                                  done = true; });

        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        assert(!done);
        release_write.set_value();
        slow_writer.join();
        completer.join();

        assert(merged);
        assert(read_text(merged->path) == "aaaabbbb");
        assert(!store.find(session.meta.upload_id));
        assert(count_entries(fs.chunks_root()) == 0);

        cleanup_path(root);
    }

    TransferItem make_text(const std::string &id, std::int64_t timestamp)
    {
        return TransferItem{.id = id, .type = ItemType::Text, .content = "note " + id, .timestamp = timestamp, .sender = "alice"};
    }

    TransferItem make_file(const std::string &id, std::int64_t timestamp, const std::string &mime)
    {
        return TransferItem{
            .id = id,
            .type = ItemType::File,
            .file = FileInfo{.name = id, .size = 1, .mime = mime, .url = "/file/" + id},
            .timestamp = timestamp,
            .sender = "bob",
        };
    }

    void test_transfer_index_capacity()
    {
        const auto root = fresh_dir("dropdeck_index_capacity");
        const auto path = root / "index.json";

        // Seed a full document directly: newest first, timestamps 1000 down to 1.
        std::vector<TransferItem> seeded;
        for (int i = 0; i < 1000; ++i)
        {
            seeded.push_back(make_text("item-" + std::to_string(i), 1000 - i));
        }
        {
            std::ofstream out(path);
            out << nlohmann::json{{"version", 1}, {"items", seeded}}.dump();
        }

        const AtomicWriter writer(kFastWrites);
        TransferIndex index(path, writer);
        assert(index.size() == 1000);
        assert(index.capacity() == kTransferIndexCapacity);

        const auto stored = index.append(make_text("newest", 5000));
        assert(stored.timestamp == 5000);
        assert(index.size() == 1000);
        assert(index.find("newest"));
        assert(!index.find("item-999"));
        assert(index.find("item-998"));

        TransferIndex reloaded(path, writer);
        const auto items = reloaded.list();
        assert(items.size() == 1000);
        assert(items.front().id == "newest");
        assert(items.back().id == "item-998");

        cleanup_path(root);
    }

    void test_transfer_index_filters_and_order()
    {
        const auto root = fresh_dir("dropdeck_index_filters");
        const AtomicWriter writer(kFastWrites);
        TransferIndex index(root / "index.json", writer);
        assert(index.list().empty());

        index.append(make_text("t1", 100));
        index.append(make_file("photo1", 200, "image/png"));
        index.append(make_file("doc1", 300, "application/pdf"));
        // An older timestamp is raised to keep the head newest.
        const auto late = index.append(make_file("photo2", 50, "image/jpeg"));
        assert(late.timestamp == 300);

        const auto all = index.list();
        assert(all.size() == 4);
        assert(all[0].id == "photo2");
        assert(all[3].id == "t1");

        const auto photos = index.list(ItemFilter::Photo);
        assert(photos.size() == 2);
        assert(std::all_of(photos.begin(), photos.end(), [](const TransferItem &item)
                           { return item.type == ItemType::File && item.file->mime.starts_with("image/"); }));
        assert(index.list(ItemFilter::File).size() == 3);
        assert(index.list(ItemFilter::Text).size() == 1);

        const auto limited = index.list(ItemFilter::All, 2);
        assert(limited.size() == 2);
        assert(limited[0].id == "photo2");
        assert(index.list(ItemFilter::All, 0).size() == 4);

        const auto document = nlohmann::json::parse(read_text(root / "index.json"));
        assert(document.at("version") == 1);
        assert(document.at("items").size() == 4);

        cleanup_path(root);
    }

    void test_transfer_index_remove_and_hooks()
    {
        const auto root = fresh_dir("dropdeck_index_remove");
        const AtomicWriter writer(kFastWrites);
        TransferIndex index(root / "index.json", writer);

        std::vector<TransferEvent> events;
        index.add_commit_hook([&](const TransferEvent &event)
                              { events.push_back(event); });
        index.add_commit_hook([](const TransferEvent &)
                              { throw std::runtime_error("listener failure"); });

        index.append(make_text("a", 1));
        index.append(make_text("b", 2));
        assert(events.size() == 2);
        assert(events[0].kind == EventKind::Add && events[0].id == "a");

        const auto removed = index.remove("a");
        assert(removed && removed->id == "a");
        assert(events.size() == 3);
        assert(events[2].kind == EventKind::Delete && events[2].id == "a");

        assert(!index.remove("a"));
        assert(!index.remove("never-existed"));
        assert(events.size() == 3);
        assert(index.size() == 1);

        cleanup_path(root);
    }

    void test_transfer_index_failed_write()
    {
        const auto root = fresh_dir("dropdeck_index_failed");
        const auto path = root / "index.json";
        {
            const AtomicWriter writer(kFastWrites);
            TransferIndex index(path, writer);
            index.append(make_text("kept", 1));
        }
        const auto before = read_text(path);

        AtomicWriteHooks hooks;
        hooks.before_rename = [](const std::filesystem::path &, const std::filesystem::path &)
        {
            throw std::runtime_error("disk vanished");
        };
        const AtomicWriter failing(kFastWrites, hooks);
        TransferIndex index(path, failing);

        int notified = 0;
        index.add_commit_hook([&](const TransferEvent &)
                              { ++notified; });

        bool caught = false;
        try
        {
            index.append(make_text("lost", 2));
        }
        catch (const std::runtime_error &)
        {
            caught = true;
        }
        assert(caught);
        assert(notified == 0);
        assert(index.size() == 1);
        assert(!index.find("lost"));
        assert(read_text(path) == before);

        cleanup_path(root);
    }

    void test_transfer_index_corrupt_document()
    {
        const auto root = fresh_dir("dropdeck_index_corrupt");
        const auto path = root / "index.json";
        {
            std::ofstream out(path);
            out << "{\"version\": 1, \"items\": [ {\"id\": ";
        }

        const AtomicWriter writer(kFastWrites);
        TransferIndex index(path, writer);
        assert(index.size() == 0);
        auto aside = path;
        aside += ".corrupt";
        assert(std::filesystem::exists(aside));

        index.append(make_text("fresh", 1));
        TransferIndex reloaded(path, writer);
        assert(reloaded.size() == 1);

        cleanup_path(root);
    }

} // namespace

void run_server_component_tests()
{
    test_atomic_writer_replaces_content();
    test_atomic_writer_crash_before_rename();
    test_atomic_writer_rename_retry_and_fallback();
    test_filesystem_guard();
    test_server_config_validation();
    test_chunk_store_merges_out_of_order();
    test_chunk_store_merges_every_order();
    test_chunk_store_missing_chunk();
    test_chunk_store_validation();
    test_chunk_store_resume();
    test_chunk_store_cleanup_expired();
    test_chunk_store_concurrent_complete();
    test_chunk_store_complete_waits_for_writes();
    test_transfer_index_capacity();
    test_transfer_index_filters_and_order();
    test_transfer_index_remove_and_hooks();
    test_transfer_index_failed_write();
    test_transfer_index_corrupt_document();
}
