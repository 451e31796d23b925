#include "stockcast/utils/config.hpp"

#include <cstdlib>
#include <stdexcept>
#include <utility>

namespace stockcast::utils {

namespace {

const char *readVariable(const char *name) {
	const char *value = std::getenv(name);
	return (value != nullptr && *value != '\0') ? value : nullptr;
}

long long parseInteger(const char *name, const std::string &text) {
	std::size_t consumed = 0;
	long long value = 0;
	try {
		value = std::stoll(text, &consumed);
	} catch (const std::exception &) {
		throw std::invalid_argument(std::string(name) + " must be an integer, got '" + text + "'.");
	}
	if (consumed != text.size()) {
		throw std::invalid_argument(std::string(name) + " must be an integer, got '" + text + "'.");
	}
	return value;
}

} // namespace

void ServiceConfig::validateHorizon(int horizon) {
	if (horizon < 1 || horizon > kMaxHorizonDays) {
		throw std::invalid_argument("Forecast horizon must be between 1 and " + std::to_string(kMaxHorizonDays) +
		                            " days, got " + std::to_string(horizon) + ".");
	}
}

ServiceConfig ServiceConfig::fromEnvironment() {
	ServiceConfigBuilder builder;
	if (const char *dir = readVariable("STOCKCAST_MODEL_DIR")) {
		builder.withModelDirectory(dir);
	}
	if (const char *level = readVariable("STOCKCAST_LOG_LEVEL")) {
		builder.withLogLevel(std::string(level));
	}
	if (const char *horizon = readVariable("STOCKCAST_DEFAULT_HORIZON")) {
		const long long value = parseInteger("STOCKCAST_DEFAULT_HORIZON", horizon);
		if (value < 1 || value > kMaxHorizonDays) {
			throw std::invalid_argument("STOCKCAST_DEFAULT_HORIZON out of range: " + std::string(horizon) + ".");
		}
		builder.withDefaultHorizon(static_cast<int>(value));
	}
	if (const char *reorder = readVariable("STOCKCAST_FALLBACK_REORDER_LEVEL")) {
		builder.withFallbackReorderLevel(parseInteger("STOCKCAST_FALLBACK_REORDER_LEVEL", reorder));
	}
	return builder.build();
}

// --- Builder Implementation ---

ServiceConfigBuilder &ServiceConfigBuilder::withModelDirectory(std::filesystem::path directory) {
	config_.model_directory_ = std::move(directory);
	return *this;
}

ServiceConfigBuilder &ServiceConfigBuilder::withLogLevel(spdlog::level::level_enum level) {
	config_.log_level_ = level;
	invalid_level_.clear();
	return *this;
}

ServiceConfigBuilder &ServiceConfigBuilder::withLogLevel(const std::string &level) {
	const auto parsed = spdlog::level::from_str(level);
	// from_str maps unknown names to "off"; only accept "off" when asked for.
	if (parsed == spdlog::level::off && level != "off") {
		invalid_level_ = level;
	} else {
		config_.log_level_ = parsed;
		invalid_level_.clear();
	}
	return *this;
}

ServiceConfigBuilder &ServiceConfigBuilder::withDefaultHorizon(int horizon) {
	config_.default_horizon_ = horizon;
	return *this;
}

ServiceConfigBuilder &ServiceConfigBuilder::withFallbackReorderLevel(std::int64_t level) {
	config_.fallback_reorder_level_ = level;
	return *this;
}

ServiceConfig ServiceConfigBuilder::build() {
	if (!invalid_level_.empty()) {
		throw std::invalid_argument("Unknown log level '" + invalid_level_ + "'.");
	}
	ServiceConfig::validateHorizon(config_.default_horizon_);
	if (config_.fallback_reorder_level_ < 0) {
		throw std::invalid_argument("Fallback reorder level must be non-negative.");
	}
	if (config_.model_directory_.empty()) {
		throw std::invalid_argument("Model directory must not be empty.");
	}
	return config_;
}

} // namespace stockcast::utils
