#pragma once

#include <unistd.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <spdlog/async.h>
#include <spdlog/common.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

#include "common/option.h"

namespace retrier {

inline std::mutex& GetLoggerMutex() {
    static std::mutex logger_mutex;
    return logger_mutex;
}

inline std::shared_ptr<spdlog::logger>& GetRetrierLogger() {
    static std::shared_ptr<spdlog::logger> logger = nullptr;
    return logger;
}

inline spdlog::level::level_enum GetLogLevel(const Options& options) {
    spdlog::level::level_enum ret = spdlog::level::info; // default log level

    auto log_level = GetOptionValue<std::string>(options, RETRIER_LOG_LEVEL);
    if (log_level == "DEBUG") {
        ret = spdlog::level::debug;
    } else if (log_level == "INFO") {
        ret = spdlog::level::info;
    } else if (log_level == "WARNING") {
        ret = spdlog::level::warn;
    } else if (log_level == "ERROR") {
        ret = spdlog::level::err;
    } else {
        SPDLOG_ERROR("Unknown log level: {}", log_level);
    }
    return ret;
}

/*
 * Install the process wide async logger. Sinks are appended on every call,
 * the logger itself is created once.
 * @param app_name: logger name and log file prefix
 * @param options: log options (RETRIER_LOG_*)
 */
inline void InitRetrierLog(const std::string& app_name, const Options& options = Options()) {
    std::lock_guard<std::mutex> lock(GetLoggerMutex());
    auto& logger = GetRetrierLogger();
    if (logger == nullptr) {
        spdlog::init_thread_pool(8192, 1);
        logger = std::make_shared<spdlog::async_logger>(
            app_name,
            spdlog::sinks_init_list{},
            spdlog::thread_pool(),
            spdlog::async_overflow_policy::block // When the queue is full, block
        );
    }

    std::vector<spdlog::sink_ptr> sinks;
    if (GetOptionValue<bool>(options, RETRIER_LOG_TO_CONSOLE)) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());
    }

    if (GetOptionValue<bool>(options, RETRIER_LOG_TO_FILE)) {
        // Cut a new file at 00:00 every day, keep the last max_file_days files
        auto log_dir = GetOptionValue<std::string>(options, RETRIER_LOG_DIR);
        std::string log_name = log_dir + "/" + app_name + "." + std::to_string(getpid()); // logdir/app_name.pid
        int max_file_days = GetOptionValue<int>(options, RETRIER_LOG_MAX_FILE_DAYS);
        sinks.push_back(std::make_shared<spdlog::sinks::daily_file_sink_mt>(log_name, 0, 0, false, max_file_days));
    }
    logger->sinks().insert(logger->sinks().end(), sinks.begin(), sinks.end());

    spdlog::set_default_logger(logger);
    spdlog::set_level(GetLogLevel(options));
    spdlog::flush_on(spdlog::level::info);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [pid %P] [thread %t] [%l] [%s:%#] %v");

    SPDLOG_INFO("Initialized spdlog for {}", app_name);
}

} // namespace retrier
