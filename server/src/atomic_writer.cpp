#include "dropdeck/server/atomic_writer.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <thread>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include "dropdeck/crypto.hpp"
#include "dropdeck/server/errors.hpp"

namespace dropdeck::server
{

    namespace
    {

        [[noreturn]] void throw_io(const std::string &what, const std::filesystem::path &path, int err)
        {
            throw TransferError(dropdeck::ErrorCode::IoError,
                                what + " " + path.string() + ": " + std::strerror(err));
        }

        // Removes the temporary file unless released after a successful replace.
        class TempFileGuard
        {
        public:
            explicit TempFileGuard(std::filesystem::path path) : path_(std::move(path)) {}
            TempFileGuard(const TempFileGuard &) = delete;
            TempFileGuard &operator=(const TempFileGuard &) = delete;

            ~TempFileGuard()
            {
                if (armed_)
                {
                    std::error_code ec;
                    std::filesystem::remove(path_, ec);
                    if (ec)
                    {
                        spdlog::warn("Failed to remove temporary file {}: {}", path_.string(), ec.message());
                    }
                }
            }

            void release() noexcept { armed_ = false; }

        private:
            std::filesystem::path path_;
            bool armed_{true};
        };

        void sync_directory(const std::filesystem::path &dir)
        {
            const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
            if (fd < 0)
            {
                spdlog::debug("Cannot open {} for directory sync: {}", dir.string(), std::strerror(errno));
                return;
            }
            if (::fsync(fd) != 0)
            {
                spdlog::debug("Directory sync failed for {}: {}", dir.string(), std::strerror(errno));
            }
            ::close(fd);
        }

    } // namespace

    AtomicWriter::AtomicWriter(AtomicWriteOptions options, AtomicWriteHooks hooks)
        : options_(options), hooks_(std::move(hooks))
    {
        if (options_.rename_attempts < 1)
        {
            options_.rename_attempts = 1;
        }
    }

    void AtomicWriter::write(const std::filesystem::path &target, std::span<const std::byte> data) const
    {
        if (target.empty() || !target.has_filename())
        {
            throw TransferError(dropdeck::ErrorCode::InvalidPayload, "Atomic write requires a file path");
        }

        const auto temp = make_temp_path(target);
        TempFileGuard guard(temp);
        write_temp(temp, data);

        if (hooks_.before_rename)
        {
            hooks_.before_rename(temp, target);
        }

        replace(temp, target);
        guard.release();

        if (options_.sync)
        {
            sync_directory(target.has_parent_path() ? target.parent_path() : std::filesystem::path("."));
        }
    }

    void AtomicWriter::write(const std::filesystem::path &target, std::string_view text) const
    {
        write(target, std::as_bytes(std::span(text.data(), text.size())));
    }

    void AtomicWriter::write_json(const std::filesystem::path &target, const nlohmann::json &document) const
    {
        write(target, std::string_view(document.dump(2)));
    }

    std::filesystem::path AtomicWriter::make_temp_path(const std::filesystem::path &target) const
    {
        auto name = "." + target.filename().string() + ".tmp-" + crypto::generate_id(6);
        return target.has_parent_path() ? target.parent_path() / name : std::filesystem::path(name);
    }

    void AtomicWriter::write_temp(const std::filesystem::path &temp, std::span<const std::byte> data) const
    {
        const int fd = ::open(temp.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0644);
        if (fd < 0)
        {
            throw_io("Cannot create temporary file", temp, errno);
        }

        const auto *cursor = reinterpret_cast<const char *>(data.data());
        std::size_t remaining = data.size();
        while (remaining > 0)
        {
            const auto written = ::write(fd, cursor, remaining);
            if (written < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                const int err = errno;
                ::close(fd);
                throw_io("Write failed for", temp, err);
            }
            cursor += written;
            remaining -= static_cast<std::size_t>(written);
        }

        if (options_.sync && ::fsync(fd) != 0)
        {
            const int err = errno;
            ::close(fd);
            throw_io("fsync failed for", temp, err);
        }
        if (::close(fd) != 0)
        {
            throw_io("Close failed for", temp, errno);
        }
    }

    void AtomicWriter::replace(const std::filesystem::path &temp, const std::filesystem::path &target) const
    {
        std::error_code ec;
        for (int attempt = 1; attempt <= options_.rename_attempts; ++attempt)
        {
            if (hooks_.rename)
            {
                ec = hooks_.rename(temp, target);
            }
            else
            {
                std::filesystem::rename(temp, target, ec);
            }
            if (!ec)
            {
                return;
            }
            spdlog::debug("Rename {} -> {} failed (attempt {}/{}): {}", temp.string(), target.string(), attempt,
                          options_.rename_attempts, ec.message());
            if (attempt < options_.rename_attempts)
            {
                std::this_thread::sleep_for(options_.rename_backoff * attempt);
            }
        }

        spdlog::warn("Rename into {} kept failing ({}), falling back to non-atomic copy", target.string(),
                     ec.message());
        std::error_code copy_ec;
        std::filesystem::copy_file(temp, target, std::filesystem::copy_options::overwrite_existing, copy_ec);
        if (copy_ec)
        {
            throw TransferError(dropdeck::ErrorCode::IoError,
                                "Failed to replace " + target.string() + ": " + copy_ec.message());
        }
        std::error_code remove_ec;
        std::filesystem::remove(temp, remove_ec);
        if (remove_ec)
        {
            spdlog::warn("Failed to remove {} after fallback copy: {}", temp.string(), remove_ec.message());
        }
    }

} // namespace dropdeck::server
