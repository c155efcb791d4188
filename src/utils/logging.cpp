#include "seasonkit/utils/logging.hpp"

#ifndef SEASONKIT_NO_LOGGING
#include <spdlog/sinks/stdout_color_sinks.h>

namespace seasonkit::utils {

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::init(spdlog::level::level_enum level) {
	if (!logger_) {
		logger_ = spdlog::get("seasonkit");
		if (!logger_) {
			logger_ = spdlog::stdout_color_mt("seasonkit");
		}
	}
	logger_->set_level(level);
	logger_->flush_on(spdlog::level::warn);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	if (!logger_) {
		init();
	}
	return logger_;
}

} // namespace seasonkit::utils

#endif // SEASONKIT_NO_LOGGING
