#include "Logger.hpp"
#include <spdlog/sinks/null_sink.h>
#include <vector>
#include "util/FileUtils.hpp"

namespace cal {

std::shared_ptr<spdlog::logger> Logger::logger_;

void Logger::init(std::string_view appName, bool debug, bool console) {
    auto level = debug ? spdlog::level::debug : spdlog::level::info;

    try {
        spdlog::drop(std::string(appName));

        std::vector<spdlog::sink_ptr> sinks;

        if (console) {
            auto stderrSink =
                    std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            stderrSink->set_pattern("%^[%H:%M:%S.%e] [%l]%$ %v");
            sinks.push_back(stderrSink);
        }

        auto logDir = file::cacheDir() / "logs";
        file::ensureDir(logDir);

        auto logFile = logDir / (std::string(appName) + ".log");
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFile.string(), 1024 * 1024 * 5, 3);
        fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%s:%#] %v");
        sinks.push_back(fileSink);

        logger_ = std::make_shared<spdlog::logger>(
                std::string(appName), sinks.begin(), sinks.end());

        logger_->set_level(level);
        logger_->flush_on(level);

        spdlog::register_logger(logger_);
        spdlog::set_default_logger(logger_);

        LOG_INFO("Logger initialized. Debug mode: {}", debug);
        LOG_DEBUG("Log file: {}", logFile.string());

    } catch (const spdlog::spdlog_ex& ex) {
        spdlog::drop(std::string(appName));
        // Without a file sink and with curses on the terminal there is
        // nowhere safe to write
        logger_ = console ? spdlog::stderr_color_mt(std::string(appName))
                          : spdlog::null_logger_mt(std::string(appName));
        logger_->set_level(level);
        logger_->warn("Failed to create file logger: {}", ex.what());
    }
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
    }
    logger_.reset();
    spdlog::shutdown();
}

std::shared_ptr<spdlog::logger>& Logger::get() {
    if (!logger_) {
        init();
    }
    return logger_;
}

} // namespace cal
