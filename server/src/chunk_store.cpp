#include "dropdeck/server/chunk_store.hpp"

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <fstream>

#include <fcntl.h>
#include <unistd.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "dropdeck/crypto.hpp"
#include "dropdeck/server/errors.hpp"
#include "dropdeck/transfer_item.hpp"

namespace dropdeck::server
{

    namespace
    {
        constexpr auto kMetaFile = "meta.json";
        constexpr auto kDefaultMime = "application/octet-stream";
        constexpr std::size_t kUploadIdLength = 32;
        constexpr std::size_t kArtifactPrefixLength = 8;
        constexpr std::size_t kCopyBufferSize = 64 * 1024;

        nlohmann::json to_json(const UploadMeta &meta)
        {
            return {
                {"uploadId", meta.upload_id},
                {"fileName", meta.file_name},
                {"size", meta.size},
                {"mime", meta.mime},
                {"chunkSize", meta.chunk_size},
                {"fileKey", meta.file_key},
                {"sender", meta.sender},
                {"startTime", meta.start_time},
            };
        }

        UploadMeta meta_from_json(const nlohmann::json &json)
        {
            UploadMeta meta{};
            meta.upload_id = json.at("uploadId").get<std::string>();
            meta.file_name = json.at("fileName").get<std::string>();
            meta.size = json.at("size").get<std::uint64_t>();
            meta.mime = json.value("mime", std::string{kDefaultMime});
            meta.chunk_size = json.at("chunkSize").get<std::uint64_t>();
            meta.file_key = json.value("fileKey", std::string{});
            meta.sender = json.value("sender", std::string{});
            meta.start_time = json.value("startTime", std::int64_t{0});
            return meta;
        }

        std::optional<std::uint64_t> parse_chunk_index(const std::string &name)
        {
            if (name.empty() || !std::all_of(name.begin(), name.end(), [](char ch)
                                             { return ch >= '0' && ch <= '9'; }))
            {
                return std::nullopt;
            }
            std::uint64_t value{};
            const auto [ptr, ec] = std::from_chars(name.data(), name.data() + name.size(), value);
            if (ec != std::errc{} || ptr != name.data() + name.size())
            {
                return std::nullopt;
            }
            return value;
        }

        void fsync_file(const std::filesystem::path &path)
        {
            const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
            if (fd < 0)
            {
                throw TransferError(dropdeck::ErrorCode::IoError,
                                    "Cannot reopen " + path.string() + ": " + std::strerror(errno));
            }
            const int rc = ::fsync(fd);
            const int err = errno;
            ::close(fd);
            if (rc != 0)
            {
                throw TransferError(dropdeck::ErrorCode::IoError,
                                    "fsync failed for " + path.string() + ": " + std::strerror(err));
            }
        }

        // Keeps an upload id in the completing set for the duration of a merge.
        class CompletionGuard
        {
        public:
            CompletionGuard(std::mutex &mutex, std::set<std::string> &completing, std::string upload_id)
                : mutex_(mutex), completing_(completing), upload_id_(std::move(upload_id)) {}
            CompletionGuard(const CompletionGuard &) = delete;
            CompletionGuard &operator=(const CompletionGuard &) = delete;

            ~CompletionGuard()
            {
                std::lock_guard lock(mutex_);
                completing_.erase(upload_id_);
            }

        private:
            std::mutex &mutex_;
            std::set<std::string> &completing_;
            std::string upload_id_;
        };

    } // namespace

    std::uint64_t UploadMeta::total_chunks() const noexcept
    {
        if (chunk_size == 0)
        {
            return 0;
        }
        return size / chunk_size + (size % chunk_size != 0 ? 1 : 0);
    }

    ChunkStore::ChunkStore(const Filesystem &filesystem, const AtomicWriter &writer, std::uint64_t max_chunk_size)
        : filesystem_(filesystem), writer_(writer), max_chunk_size_(max_chunk_size)
    {
        std::filesystem::create_directories(filesystem_.chunks_root());
    }

    UploadSession ChunkStore::begin_upload(const UploadRequest &request)
    {
        if (request.file_name.empty())
        {
            throw TransferError(dropdeck::ErrorCode::InvalidPayload, "fileName is required");
        }
        if (request.sender.empty())
        {
            throw TransferError(dropdeck::ErrorCode::AuthenticationRequired, "Sender identity required");
        }
        const auto chunk_size = request.chunk_size == 0 ? kDefaultChunkSize : request.chunk_size;
        if (chunk_size > max_chunk_size_)
        {
            throw TransferError(dropdeck::ErrorCode::InvalidPayload,
                                "chunkSize exceeds limit of " + std::to_string(max_chunk_size_) + " bytes");
        }

        std::lock_guard lock(mutex_);
        if (!request.file_key.empty())
        {
            if (auto resumed = resume_locked(request, chunk_size))
            {
                spdlog::info("Resuming upload {} of {} for {} ({} of {} chunks present)", resumed->meta.upload_id,
                             resumed->meta.file_name, resumed->meta.sender, resumed->uploaded.size(),
                             resumed->meta.total_chunks());
                return *resumed;
            }
        }

        UploadMeta meta{};
        meta.upload_id = crypto::generate_id(kUploadIdLength / 2);
        meta.file_name = request.file_name;
        meta.size = request.size;
        meta.mime = request.mime.empty() ? std::string{kDefaultMime} : request.mime;
        meta.chunk_size = chunk_size;
        meta.file_key = request.file_key;
        meta.sender = request.sender;
        meta.start_time = current_timestamp_ms();

        const auto dir = session_dir(meta.upload_id);
        std::error_code ec;
        if (!std::filesystem::create_directory(dir, ec) || ec)
        {
            throw TransferError(dropdeck::ErrorCode::IoError,
                                "Cannot create session directory: " + (ec ? ec.message() : std::string("exists")));
        }
        try
        {
            persist_meta(dir, meta);
        }
        catch (...)
        {
            std::filesystem::remove_all(dir, ec);
            throw;
        }

        spdlog::info("Upload {} started: {} ({} bytes, {} chunks) from {}", meta.upload_id, meta.file_name, meta.size,
                     meta.total_chunks(), meta.sender);
        return UploadSession{.meta = std::move(meta), .uploaded = {}, .resumed = false};
    }

    void ChunkStore::put_chunk(const std::string &upload_id, std::uint64_t index, std::span<const std::byte> data)
    {
        const auto dir = require_session(upload_id);
        {
            std::lock_guard lock(mutex_);
            if (completing_.contains(upload_id))
            {
                throw TransferError(dropdeck::ErrorCode::Conflict, "Upload is being completed");
            }
            ++writes_in_flight_[upload_id];
        }
        struct InFlight
        {
            ChunkStore &store;
            const std::string &upload_id;
            ~InFlight() { store.end_write(upload_id); }
        } in_flight{*this, upload_id};

        const auto meta = read_meta(dir);
        if (index >= meta.total_chunks())
        {
            throw TransferError(dropdeck::ErrorCode::InvalidPayload,
                                "Chunk index " + std::to_string(index) + " out of range (total " +
                                    std::to_string(meta.total_chunks()) + ")");
        }

        try
        {
            writer_.write(dir / std::to_string(index), data);
        }
        catch (const TransferError &)
        {
            std::error_code ec;
            if (!std::filesystem::is_directory(dir, ec))
            {
                throw TransferError(dropdeck::ErrorCode::NotFound, "session not found");
            }
            throw;
        }
        spdlog::debug("Upload {} chunk {} stored ({} bytes)", upload_id, index, data.size());
    }

    MergedUpload ChunkStore::complete(const std::string &upload_id, const CommitFn &commit)
    {
        const auto dir = require_session(upload_id);
        {
            std::unique_lock lock(mutex_);
            if (!completing_.insert(upload_id).second)
            {
                throw TransferError(dropdeck::ErrorCode::Conflict, "Upload is already being completed");
            }
            writes_drained_.wait(lock, [&]
                                 { return !writes_in_flight_.contains(upload_id); });
        }
        CompletionGuard guard(mutex_, completing_, upload_id);

        // A concurrent completion may have finished between the lookup and the insert.
        std::error_code ec;
        if (!std::filesystem::is_directory(dir, ec))
        {
            throw TransferError(dropdeck::ErrorCode::NotFound, "session not found");
        }

        const auto meta = read_meta(dir);
        const auto total = meta.total_chunks();
        for (std::uint64_t index = 0; index < total; ++index)
        {
            if (!std::filesystem::is_regular_file(dir / std::to_string(index), ec))
            {
                throw MissingChunkError(index);
            }
        }

        MergedUpload merged{};
        merged.meta = meta;
        merged.artifact_name = upload_id.substr(0, kArtifactPrefixLength) + "_" +
                               Filesystem::sanitize_file_name(meta.file_name);
        merged.path = Filesystem::safe_join(filesystem_.artifacts_root(), merged.artifact_name);
        const auto temp_path = filesystem_.artifacts_root() / ("." + merged.artifact_name + ".part");

        try
        {
            crypto::ContentHasher hasher;
            {
                std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
                if (!out.is_open())
                {
                    throw TransferError(dropdeck::ErrorCode::IoError, "Cannot create " + temp_path.string());
                }
                std::vector<char> buffer(kCopyBufferSize);
                for (std::uint64_t index = 0; index < total; ++index)
                {
                    const auto chunk_path = dir / std::to_string(index);
                    std::ifstream in(chunk_path, std::ios::binary);
                    if (!in.is_open())
                    {
                        throw TransferError(dropdeck::ErrorCode::IoError, "Cannot read " + chunk_path.string());
                    }
                    while (in)
                    {
                        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                        const auto read_count = static_cast<std::size_t>(in.gcount());
                        if (read_count == 0)
                        {
                            break;
                        }
                        out.write(buffer.data(), static_cast<std::streamsize>(read_count));
                        hasher.update(std::as_bytes(std::span(buffer.data(), read_count)));
                        merged.bytes += read_count;
                    }
                    if (in.bad())
                    {
                        throw TransferError(dropdeck::ErrorCode::IoError, "Read failed for " + chunk_path.string());
                    }
                    if (!out)
                    {
                        throw TransferError(dropdeck::ErrorCode::IoError, "Write failed for " + temp_path.string());
                    }
                }
                out.close();
                if (!out)
                {
                    throw TransferError(dropdeck::ErrorCode::IoError, "Close failed for " + temp_path.string());
                }
            }
            merged.hash = hasher.finish();
            fsync_file(temp_path);

            std::filesystem::rename(temp_path, merged.path, ec);
            if (ec)
            {
                throw TransferError(dropdeck::ErrorCode::IoError,
                                    "Cannot move merged file into place: " + ec.message());
            }
        }
        catch (...)
        {
            std::filesystem::remove(temp_path, ec);
            throw;
        }

        if (merged.bytes != meta.size)
        {
            spdlog::warn("Upload {} merged {} bytes but {} were declared", upload_id, merged.bytes, meta.size);
        }

        if (commit)
        {
            try
            {
                commit(merged);
            }
            catch (...)
            {
                std::filesystem::remove(merged.path, ec);
                spdlog::warn("Upload {} was merged but not recorded; chunks kept for another attempt", upload_id);
                throw;
            }
        }

        std::filesystem::remove_all(dir, ec);
        if (ec)
        {
            spdlog::warn("Upload {} merged but session directory removal failed: {}", upload_id, ec.message());
        }
        spdlog::info("Upload {} completed as {} ({} bytes)", upload_id, merged.artifact_name, merged.bytes);
        return merged;
    }

    std::optional<UploadMeta> ChunkStore::find(const std::string &upload_id) const
    {
        if (!is_valid_upload_id(upload_id))
        {
            return std::nullopt;
        }
        const auto dir = session_dir(upload_id);
        std::error_code ec;
        if (!std::filesystem::is_directory(dir, ec))
        {
            return std::nullopt;
        }
        return read_meta(dir);
    }

    std::vector<std::uint64_t> ChunkStore::uploaded_chunks(const std::string &upload_id) const
    {
        const auto dir = require_session(upload_id);
        return list_chunks(dir, read_meta(dir).total_chunks());
    }

    std::size_t ChunkStore::cleanup_expired(std::chrono::seconds max_age)
    {
        if (max_age.count() <= 0)
        {
            return 0;
        }
        std::lock_guard lock(mutex_);
        const auto cutoff = std::filesystem::file_time_type::clock::now() - max_age;
        std::size_t removed = 0;
        std::error_code ec;
        for (const auto &entry : std::filesystem::directory_iterator(filesystem_.chunks_root(), ec))
        {
            const auto name = entry.path().filename().string();
            if (!entry.is_directory(ec) || is_busy_locked(name))
            {
                continue;
            }
            const auto modified = entry.last_write_time(ec);
            if (ec || modified >= cutoff)
            {
                continue;
            }
            std::error_code remove_ec;
            std::filesystem::remove_all(entry.path(), remove_ec);
            if (remove_ec)
            {
                spdlog::warn("Failed to remove expired upload {}: {}", name, remove_ec.message());
                continue;
            }
            ++removed;
        }
        if (ec)
        {
            spdlog::warn("Scanning upload sessions failed: {}", ec.message());
        }
        if (removed > 0)
        {
            spdlog::info("Removed {} expired upload session(s)", removed);
        }
        return removed;
    }

    bool ChunkStore::is_valid_upload_id(std::string_view upload_id) noexcept
    {
        return upload_id.size() == kUploadIdLength &&
               std::all_of(upload_id.begin(), upload_id.end(), [](char ch)
                           { return (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'f'); });
    }

    std::filesystem::path ChunkStore::session_dir(const std::string &upload_id) const
    {
        return Filesystem::safe_join(filesystem_.chunks_root(), upload_id);
    }

    std::filesystem::path ChunkStore::require_session(const std::string &upload_id) const
    {
        if (!is_valid_upload_id(upload_id))
        {
            throw TransferError(dropdeck::ErrorCode::NotFound, "session not found");
        }
        auto dir = session_dir(upload_id);
        std::error_code ec;
        if (!std::filesystem::is_directory(dir, ec))
        {
            throw TransferError(dropdeck::ErrorCode::NotFound, "session not found");
        }
        return dir;
    }

    UploadMeta ChunkStore::read_meta(const std::filesystem::path &dir) const
    {
        std::ifstream in(dir / kMetaFile);
        if (!in.is_open())
        {
            throw TransferError(dropdeck::ErrorCode::NotFound, "session not found");
        }
        try
        {
            nlohmann::json json;
            in >> json;
            return meta_from_json(json);
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw TransferError(dropdeck::ErrorCode::IoError,
                                "Corrupt upload metadata in " + dir.string() + ": " + ex.what());
        }
    }

    void ChunkStore::persist_meta(const std::filesystem::path &dir, const UploadMeta &meta) const
    {
        writer_.write_json(dir / kMetaFile, to_json(meta));
    }

    std::optional<UploadSession> ChunkStore::resume_locked(const UploadRequest &request, std::uint64_t chunk_size)
    {
        // Snapshot first: stale sessions are removed while scanning.
        std::vector<std::filesystem::path> candidates;
        std::error_code ec;
        for (const auto &entry : std::filesystem::directory_iterator(filesystem_.chunks_root(), ec))
        {
            const auto upload_id = entry.path().filename().string();
            if (entry.is_directory(ec) && is_valid_upload_id(upload_id) && !is_busy_locked(upload_id))
            {
                candidates.push_back(entry.path());
            }
        }

        std::optional<UploadSession> match;
        for (const auto &dir : candidates)
        {
            const auto upload_id = dir.filename().string();
            UploadMeta meta;
            try
            {
                meta = read_meta(dir);
            }
            catch (const TransferError &ex)
            {
                spdlog::warn("Skipping unreadable upload session {}: {}", upload_id, ex.what());
                continue;
            }
            if (meta.sender != request.sender || meta.file_key != request.file_key)
            {
                continue;
            }

            if (!match && meta.size == request.size && meta.chunk_size == chunk_size &&
                meta.file_name == request.file_name)
            {
                match = UploadSession{
                    .meta = meta,
                    .uploaded = list_chunks(dir, meta.total_chunks()),
                    .resumed = true,
                };
                continue;
            }

            spdlog::info("Discarding stale upload {} for key {}", upload_id, request.file_key);
            std::error_code remove_ec;
            std::filesystem::remove_all(dir, remove_ec);
            if (remove_ec)
            {
                spdlog::warn("Failed to discard stale upload {}: {}", upload_id, remove_ec.message());
            }
        }
        return match;
    }

    std::vector<std::uint64_t> ChunkStore::list_chunks(const std::filesystem::path &dir, std::uint64_t total) const
    {
        std::vector<std::uint64_t> chunks;
        std::error_code ec;
        for (const auto &entry : std::filesystem::directory_iterator(dir, ec))
        {
            if (!entry.is_regular_file(ec))
            {
                continue;
            }
            const auto index = parse_chunk_index(entry.path().filename().string());
            if (index && *index < total)
            {
                chunks.push_back(*index);
            }
        }
        std::sort(chunks.begin(), chunks.end());
        return chunks;
    }

    bool ChunkStore::is_busy_locked(const std::string &upload_id) const
    {
        return completing_.contains(upload_id) || writes_in_flight_.contains(upload_id);
    }

    void ChunkStore::end_write(const std::string &upload_id)
    {
        std::lock_guard lock(mutex_);
        const auto it = writes_in_flight_.find(upload_id);
        if (it != writes_in_flight_.end() && --it->second == 0)
        {
            writes_in_flight_.erase(it);
            writes_drained_.notify_all();
        }
    }

} // namespace dropdeck::server
