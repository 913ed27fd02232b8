#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <vector>

#include "dropdeck/server/atomic_writer.hpp"
#include "dropdeck/server/filesystem.hpp"

namespace dropdeck::server
{

    inline constexpr std::uint64_t kDefaultChunkSize = 2ULL * 1024 * 1024;
    inline constexpr std::uint64_t kDefaultMaxChunkSize = 16ULL * 1024 * 1024;

    struct UploadRequest
    {
        std::string file_name;
        std::uint64_t size{};
        std::string mime;
        std::uint64_t chunk_size{}; // 0 selects kDefaultChunkSize
        std::string sender;
        std::string file_key; // optional client key used to resume an in-flight session
    };

    struct UploadMeta
    {
        std::string upload_id;
        std::string file_name;
        std::uint64_t size{};
        std::string mime;
        std::uint64_t chunk_size{};
        std::string file_key;
        std::string sender;
        std::int64_t start_time{};

        std::uint64_t total_chunks() const noexcept;
    };

    struct UploadSession
    {
        UploadMeta meta;
        std::vector<std::uint64_t> uploaded;
        bool resumed{};
    };

    struct MergedUpload
    {
        UploadMeta meta;
        std::string artifact_name;
        std::filesystem::path path;
        std::uint64_t bytes{};
        std::string hash;
    };

    /**
     * Owns the per-upload session directories. Each session lives in its own directory named by
     * its upload id and holds a `meta.json` sidecar plus one file per received chunk, named by
     * the chunk index. Sessions never share files, so concurrent uploads need no coordination;
     * the only shared state is the set of sessions currently being merged and the count of chunk
     * writes in flight per session. A merge waits for in-flight writes to drain and refuses new ones.
     */
    class ChunkStore
    {
    public:
        // Runs after the merged artifact is in place; throwing keeps the session for a retry.
        using CommitFn = std::function<void(const MergedUpload &)>;

        ChunkStore(const Filesystem &filesystem, const AtomicWriter &writer,
                   std::uint64_t max_chunk_size = kDefaultMaxChunkSize);

        UploadSession begin_upload(const UploadRequest &request);

        void put_chunk(const std::string &upload_id, std::uint64_t index, std::span<const std::byte> data);

        // Verifies every chunk is present, merges them in index order into a hidden temporary
        // artifact and renames it into place. `commit` then records the artifact; only after it
        // returns is the session directory dropped. If it throws, the artifact is removed and the
        // chunks stay on disk so the upload can be completed again.
        MergedUpload complete(const std::string &upload_id, const CommitFn &commit = {});

        std::optional<UploadMeta> find(const std::string &upload_id) const;

        std::vector<std::uint64_t> uploaded_chunks(const std::string &upload_id) const;

        // Removes sessions whose directory has not changed for longer than max_age.
        std::size_t cleanup_expired(std::chrono::seconds max_age);

        static bool is_valid_upload_id(std::string_view upload_id) noexcept;

    private:
        std::filesystem::path session_dir(const std::string &upload_id) const;
        std::filesystem::path require_session(const std::string &upload_id) const;
        UploadMeta read_meta(const std::filesystem::path &dir) const;
        void persist_meta(const std::filesystem::path &dir, const UploadMeta &meta) const;
        std::optional<UploadSession> resume_locked(const UploadRequest &request, std::uint64_t chunk_size);
        std::vector<std::uint64_t> list_chunks(const std::filesystem::path &dir, std::uint64_t total) const;
        bool is_busy_locked(const std::string &upload_id) const;
        void end_write(const std::string &upload_id);

        const Filesystem &filesystem_;
        const AtomicWriter &writer_;
        std::uint64_t max_chunk_size_;

        mutable std::mutex mutex_;
        std::set<std::string> completing_;
        std::map<std::string, std::size_t> writes_in_flight_;
        std::condition_variable writes_drained_;
    };

} // namespace dropdeck::server
