#pragma once
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace Log
{
    // Installs a file logger as the default logger. Safe to call more than once.
    inline void init(const std::string& path = "pathwise.log",
                     spdlog::level::level_enum level = spdlog::level::debug)
    {
        auto file_logger = spdlog::get("pathwise");
        if (!file_logger) {
            file_logger = spdlog::basic_logger_mt("pathwise", path);
        }

        spdlog::set_default_logger(file_logger);

        // Set global log pattern ONCE
        spdlog::set_pattern("[%d:%m:%Y:%H:%M:%S.%e] [%l] %v");

        spdlog::set_level(level);
        spdlog::flush_on(spdlog::level::info);
    }
}
