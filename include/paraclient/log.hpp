#ifndef PARACLIENT_LOG_HPP
#define PARACLIENT_LOG_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace ParaClient {

    using LogLevel = spdlog::level::level_enum;

    using Logger = std::shared_ptr<spdlog::logger>;

    /**
     * @brief Set the logging level of every ParaClient logger.
     * @param level The new level.
     */
    void set_log_level(LogLevel level);

    /**
     * @brief Provide a logger object, creating it on first use.
     * @param tag Tagging name identifying the logger.
     * @return The shared logger registered under the tag.
     */
    Logger create_logger(const std::string& tag);

} // namespace ParaClient

#endif // PARACLIENT_LOG_HPP
