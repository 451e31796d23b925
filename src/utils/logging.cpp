#include "stockcast/utils/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace stockcast::utils {

namespace {

std::once_flag &loggerOnce() {
	static std::once_flag flag;
	return flag;
}

} // namespace

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::create() {
	logger_ = spdlog::get("stockcast");
	if (!logger_) {
		logger_ = spdlog::stdout_color_mt("stockcast");
		logger_->set_level(spdlog::level::info);
	}
}

void Logging::init(spdlog::level::level_enum level) {
	std::call_once(loggerOnce(), &Logging::create);
	logger_->set_level(level);
	logger_->flush_on(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	// logger_ is written once here and only read afterwards.
	std::call_once(loggerOnce(), &Logging::create);
	return logger_;
}

} // namespace stockcast::utils
