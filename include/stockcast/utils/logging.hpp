#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace stockcast::utils {

/**
 * @class Logging
 * @brief Provides a singleton interface to the spdlog logging library.
 *
 * Every component of the forecasting pipeline logs through the same named
 * logger, which can be configured once at service start-up.
 */
class Logging {
public:
	/**
	 * @brief Gets the singleton logger instance.
	 * @return A shared pointer to the spdlog logger.
	 */
	static std::shared_ptr<spdlog::logger> &getLogger();

	/**
	 * @brief Initializes the logger with a specific logging level.
	 * @param level The minimum level of messages to log.
	 */
	static void init(spdlog::level::level_enum level = spdlog::level::info);

private:
	Logging() = default;

	static void create();

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace stockcast::utils

// --- Logger Macros for convenient access ---
#define STOCKCAST_TRACE(...)    stockcast::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define STOCKCAST_DEBUG(...)    stockcast::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define STOCKCAST_INFO(...)     stockcast::utils::Logging::getLogger()->info(__VA_ARGS__)
#define STOCKCAST_WARN(...)     stockcast::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define STOCKCAST_ERROR(...)    stockcast::utils::Logging::getLogger()->error(__VA_ARGS__)
#define STOCKCAST_CRITICAL(...) stockcast::utils::Logging::getLogger()->critical(__VA_ARGS__)
