#pragma once
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include "Config.hpp"

namespace Log
{
    inline void init(const LoggingConfig& cfg)
    {
        // File logger only; the console belongs to the menu shell
        auto file_logger = spdlog::basic_logger_mt("file_logger", cfg.file);

        spdlog::set_default_logger(file_logger);

        spdlog::set_pattern("[%d:%m:%Y:%H:%M:%S.%e] [%l] %v");

        spdlog::set_level(spdlog::level::from_str(cfg.level));
        spdlog::flush_on(spdlog::level::info);
    }
}
