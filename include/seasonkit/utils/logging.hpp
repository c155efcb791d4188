#pragma once

#ifndef SEASONKIT_NO_LOGGING
#include <spdlog/spdlog.h>
#include <memory>

namespace seasonkit::utils {

/**
 * @class Logging
 * @brief Singleton access to the library's spdlog logger.
 *
 * Every decomposition routine logs through the same logger instance, which
 * callers may configure once at startup.
 */
class Logging {
public:
	/**
	 * @brief Gets the shared logger, creating it on first use.
	 * @return A reference to the shared pointer holding the logger.
	 */
	static std::shared_ptr<spdlog::logger> &getLogger();

	/**
	 * @brief Initializes (or reconfigures) the logger.
	 * @param level The minimum level of messages to log.
	 */
	static void init(spdlog::level::level_enum level = spdlog::level::info);

private:
	Logging() = default;

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace seasonkit::utils

#define SEASONKIT_TRACE(...)    seasonkit::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define SEASONKIT_DEBUG(...)    seasonkit::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define SEASONKIT_INFO(...)     seasonkit::utils::Logging::getLogger()->info(__VA_ARGS__)
#define SEASONKIT_WARN(...)     seasonkit::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define SEASONKIT_ERROR(...)    seasonkit::utils::Logging::getLogger()->error(__VA_ARGS__)
#define SEASONKIT_CRITICAL(...) seasonkit::utils::Logging::getLogger()->critical(__VA_ARGS__)

#else
// Logging compiled out

namespace seasonkit::utils {

class Logging {
public:
	static void init() {}
};

} // namespace seasonkit::utils

#define SEASONKIT_TRACE(...)    do {} while(0)
#define SEASONKIT_DEBUG(...)    do {} while(0)
#define SEASONKIT_INFO(...)     do {} while(0)
#define SEASONKIT_WARN(...)     do {} while(0)
#define SEASONKIT_ERROR(...)    do {} while(0)
#define SEASONKIT_CRITICAL(...) do {} while(0)

#endif // SEASONKIT_NO_LOGGING
