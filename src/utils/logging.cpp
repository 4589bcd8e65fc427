#include "stl-decomp/utils/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace stldecomp::utils {

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::init(spdlog::level::level_enum level) {
	if (!logger_) {
		// Reuse a logger registered under the same name by an earlier init.
		logger_ = spdlog::get("stl-decomp");
		if (!logger_) {
			logger_ = spdlog::stdout_color_mt("stl-decomp");
		}
	}
	logger_->set_level(level);
	logger_->flush_on(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	if (!logger_) {
		init();
	}
	return logger_;
}

} // namespace stldecomp::utils
