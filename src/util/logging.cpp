#include <memory>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "util/logging.hpp"
#include "util/file.hpp"

void initialiseLogging(const DownloadConfig &config)
{
    std::shared_ptr<spdlog::logger> logger;

    if (config.useUI)
    {
        ensureDirectory(parentDirectory(config.logFilePath));
        try
        {
            logger = spdlog::basic_logger_mt("segdl", config.logFilePath);
        }
        catch (const spdlog::spdlog_ex &)
        {
            // Still usable without a log file; the UI shows progress
            logger = std::make_shared<spdlog::logger>("segdl");
            logger->set_level(spdlog::level::off);
            spdlog::set_default_logger(logger);
            return;
        }
    }
    else
    {
        logger = spdlog::stderr_color_mt("segdl");
    }

    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    logger->set_level(config.verbose ? spdlog::level::debug : spdlog::level::info);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}
