#pragma once

#include <cstdint>
#include <filesystem>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace dropdeck::client
{

    enum class LogTag : std::uint8_t
    {
        Session,
        Command,
        Rpc,
        Upload,
        Download,
        Event
    };

    std::string_view to_string(LogTag tag) noexcept;

    // Session log written to the --log file, silent otherwise. Lines carry the tag and, once
    // identified, the username: "[upload] alice: init id=... chunks=4".
    class Logger
    {
    public:
        explicit Logger(const std::optional<std::filesystem::path> &path);

        void set_identity(std::string identity) { identity_ = std::move(identity); }

        template <typename... Args>
        void log(LogTag tag, Args &&...args)
        {
            write(spdlog::level::info, tag, std::forward<Args>(args)...);
        }

        template <typename... Args>
        void warn(LogTag tag, Args &&...args)
        {
            write(spdlog::level::warn, tag, std::forward<Args>(args)...);
        }

    private:
        template <typename... Args>
        void write(spdlog::level::level_enum level, LogTag tag, Args &&...args)
        {
            if (!logger_)
            {
                return;
            }
            spdlog::fmt_lib::memory_buffer buf;
            (spdlog::fmt_lib::format_to(std::back_inserter(buf), "{}", std::forward<Args>(args)), ...);
            logger_->log(level, "[{}] {}: {}", to_string(tag), identity_.empty() ? "-" : identity_,
                         std::string_view(buf.data(), buf.size()));
        }

        std::shared_ptr<spdlog::logger> logger_;
        std::string identity_;
    };

} // namespace dropdeck::client
