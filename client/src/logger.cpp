#include "chunkup/client/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>

#include <iostream>

namespace chunkup::client
{

    Logger::Logger(const std::optional<std::filesystem::path> &path)
    {
        if (!path)
        {
            return;
        }
        try
        {
            auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path->string(), false);
            logger_ = std::make_shared<spdlog::logger>("chunkup_client", std::move(sink));
            logger_->set_pattern("%Y-%m-%d %H:%M:%S.%e [%l] %v");
            logger_->set_level(spdlog::level::info);
            logger_->flush_on(spdlog::level::info);
        }
        catch (const spdlog::spdlog_ex &ex)
        {
            std::cerr << "WARNING: cannot open log " << path->string() << ": " << ex.what() << std::endl;
            logger_.reset();
        }
    }

    void Logger::write(spdlog::level::level_enum level, std::string_view event, const std::string &message)
    {
        logger_->log(level, "{:<8} {}", event, message);
    }

} // namespace chunkup::client
