#pragma once
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace Log
{
    inline void init(const std::string& path = "retain.log",
                     spdlog::level::level_enum level = spdlog::level::debug)
    {
        // File logger becomes the default; the CLI keeps stdout for the user
        auto file_logger = spdlog::basic_logger_mt("file_logger", path);
        spdlog::set_default_logger(file_logger);

        // Set global log pattern ONCE
        spdlog::set_pattern("[%d:%m:%Y:%H:%M:%S.%e] [%l] %v");

        spdlog::set_level(level);
        spdlog::flush_on(spdlog::level::info);
    }
}
