#include "UploaderLog.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

std::shared_ptr<spdlog::logger> GetUploaderLogger()
{
    static std::mutex mutex;
    std::lock_guard<std::mutex> lock(mutex);

    if (auto logger = spdlog::get(kUploaderLoggerName))
        return logger;

    return spdlog::stdout_color_mt(kUploaderLoggerName);
}
