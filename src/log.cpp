#include "paraclient/log.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace {

    constexpr char LOG_PATTERN[] = "[%Y-%m-%d %H:%M:%S.%F][th:%t][%l] %n %v";

    ParaClient::LogLevel& current_level() {
        static ParaClient::LogLevel level = spdlog::level::info;
        return level;
    }

    std::mutex& registry_mutex() {
        static std::mutex mutex;
        return mutex;
    }

} // namespace

namespace ParaClient {

    void set_log_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(registry_mutex());
        current_level() = level;
        spdlog::set_level(level);
    }

    Logger create_logger(const std::string& tag) {
        std::lock_guard<std::mutex> lock(registry_mutex());
        auto logger = spdlog::get(tag);
        if (logger == nullptr) {
            logger = spdlog::stdout_color_mt(tag);
            logger->set_pattern(LOG_PATTERN);
            logger->set_level(current_level());
        }
        return logger;
    }

} // namespace ParaClient
