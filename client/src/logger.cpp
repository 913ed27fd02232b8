#include "dropdeck/client/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>

#include <iostream>

namespace dropdeck::client
{

    std::string_view to_string(LogTag tag) noexcept
    {
        switch (tag)
        {
        case LogTag::Session:
            return "session";
        case LogTag::Command:
            return "cmd";
        case LogTag::Rpc:
            return "rpc";
        case LogTag::Upload:
            return "upload";
        case LogTag::Download:
            return "download";
        case LogTag::Event:
            return "event";
        }
        return "log";
    }

    Logger::Logger(const std::optional<std::filesystem::path> &path)
    {
        // Without --log the client keeps no logger at all; every call returns early.
        if (!path)
        {
            return;
        }
        try
        {
            auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path->string(), false);
            logger_ = std::make_shared<spdlog::logger>("dropdeck-client", std::move(sink));
            logger_->set_pattern("%Y-%m-%d %H:%M:%S.%e [%l] %v");
            logger_->set_level(spdlog::level::info);
            logger_->flush_on(spdlog::level::info);
        }
        catch (const spdlog::spdlog_ex &ex)
        {
            std::cerr << "[warning] cannot open log " << path->string() << ": " << ex.what() << std::endl;
            logger_.reset();
        }
    }

} // namespace dropdeck::client
