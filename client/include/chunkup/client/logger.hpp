#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace chunkup::client
{

    // Transfer log for --log. Each record carries an event tag; without a file nothing is kept.
    class Logger
    {
    public:
        explicit Logger(const std::optional<std::filesystem::path> &path);

        template <typename... Args>
        void info(std::string_view event, spdlog::format_string_t<Args...> format, Args &&...args)
        {
            if (logger_)
            {
                write(spdlog::level::info, event, spdlog::fmt_lib::format(format, std::forward<Args>(args)...));
            }
        }

        template <typename... Args>
        void warn(std::string_view event, spdlog::format_string_t<Args...> format, Args &&...args)
        {
            if (logger_)
            {
                write(spdlog::level::warn, event, spdlog::fmt_lib::format(format, std::forward<Args>(args)...));
            }
        }

        template <typename... Args>
        void error(std::string_view event, spdlog::format_string_t<Args...> format, Args &&...args)
        {
            if (logger_)
            {
                write(spdlog::level::err, event, spdlog::fmt_lib::format(format, std::forward<Args>(args)...));
            }
        }

    private:
        void write(spdlog::level::level_enum level, std::string_view event, const std::string &message);

        std::shared_ptr<spdlog::logger> logger_;
    };

} // namespace chunkup::client
