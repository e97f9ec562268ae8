#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

#include "common/Types.h"

namespace tradelab {

class Logger {
public:
    static Logger& getInstance();

    // Console + rotating file sink. Until this is called every LOG_* macro is a no-op.
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info");

    // Console only, no files. Used by tests.
    void initializeConsole(const std::string& level = "info");

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->debug(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->error(fmt, std::forward<Args>(args)...);
        }
    }

    // One CSV line per closed trade in trades.log.
    void logTrade(const std::string& symbol, const ClosedTrade& trade);

    bool isInitialized() const { return initialized_; }

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> trade_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) tradelab::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) tradelab::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) tradelab::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) tradelab::Logger::getInstance().error(__VA_ARGS__)

} // namespace tradelab
