#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace stldecomp::utils {

/**
 * @class Logging
 * @brief Provides a singleton interface to the spdlog logging library.
 *
 * A single logger instance is shared by the smoothers and the decomposition
 * engine. Call init() at startup to change the level.
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

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace stldecomp::utils

// --- Logger Macros for convenient access ---
#define STLDECOMP_TRACE(...)    stldecomp::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define STLDECOMP_DEBUG(...)    stldecomp::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define STLDECOMP_INFO(...)     stldecomp::utils::Logging::getLogger()->info(__VA_ARGS__)
#define STLDECOMP_WARN(...)     stldecomp::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define STLDECOMP_ERROR(...)    stldecomp::utils::Logging::getLogger()->error(__VA_ARGS__)
#define STLDECOMP_CRITICAL(...) stldecomp::utils::Logging::getLogger()->critical(__VA_ARGS__)
