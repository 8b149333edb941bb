#include "logging.hpp"
#include "errors.hpp"
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace v3lp
{

    std::shared_ptr<spdlog::logger> make_logger(const LogConfig &config, const std::string &name)
    {
        auto level = spdlog::level::from_str(config.level);
        if (level == spdlog::level::off && config.level != "off")
        {
            throw ConfigError("unknown log level '" + config.level + "'");
        }

        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

        if (!config.file.empty())
        {
            std::string path = config.dir.empty() ? config.file : config.dir + "/" + config.file;
            try
            {
                sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    path, config.max_size, config.backups));
            }
            catch (const spdlog::spdlog_ex &e)
            {
                throw ConfigError("cannot open log file " + path + ": " + e.what());
            }
        }

        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(level);
        logger->set_pattern("%Y-%m-%d %H:%M:%S - %^%l%$ - %v");
        logger->flush_on(spdlog::level::warn);
        return logger;
    }

    std::shared_ptr<spdlog::logger> null_logger()
    {
        static auto logger = std::make_shared<spdlog::logger>(
            "null", std::make_shared<spdlog::sinks::null_sink_mt>());
        return logger;
    }

} // namespace v3lp
