#pragma once

#include <spdlog/spdlog.h>
#include <cstddef>
#include <memory>
#include <string>

namespace v3lp
{

    struct LogConfig
    {
        std::string dir = "logs";
        std::string file = "v3lp.log";
        std::string level = "info";
        size_t max_size = 1048576; // bytes per file before rotation
        size_t backups = 5;
    };

    // Console + rotating file logger for the process. Pass it to components
    // at construction; nothing in the library uses the spdlog default logger.
    std::shared_ptr<spdlog::logger> make_logger(const LogConfig &config, const std::string &name = "v3lp");

    // Shared logger that discards everything (for components built without one)
    std::shared_ptr<spdlog::logger> null_logger();

    inline std::shared_ptr<spdlog::logger> or_null(std::shared_ptr<spdlog::logger> logger)
    {
        return logger ? std::move(logger) : null_logger();
    }

} // namespace v3lp
