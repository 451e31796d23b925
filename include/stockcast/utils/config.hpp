#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <filesystem>
#include <string>

namespace stockcast::utils {

class ServiceConfigBuilder;

/**
 * @class ServiceConfig
 * @brief Runtime settings of a forecasting service.
 *
 * Algorithm windows are not configurable; only the service surface is.
 */
class ServiceConfig {
public:
	friend class ServiceConfigBuilder;

	static constexpr int kMaxHorizonDays = 365;

	/**
	 * @brief Reads settings from the process environment.
	 *
	 * Recognised variables: STOCKCAST_MODEL_DIR, STOCKCAST_LOG_LEVEL,
	 * STOCKCAST_DEFAULT_HORIZON and STOCKCAST_FALLBACK_REORDER_LEVEL. Unset
	 * variables keep their defaults.
	 *
	 * @throws std::invalid_argument If a variable is set to an invalid value.
	 */
	static ServiceConfig fromEnvironment();

	const std::filesystem::path &modelDirectory() const {
		return model_directory_;
	}
	spdlog::level::level_enum logLevel() const {
		return log_level_;
	}
	int defaultHorizon() const {
		return default_horizon_;
	}
	std::int64_t fallbackReorderLevel() const {
		return fallback_reorder_level_;
	}

	/// @throws std::invalid_argument If @p horizon is outside [1, kMaxHorizonDays].
	static void validateHorizon(int horizon);

private:
	ServiceConfig() = default;

	std::filesystem::path model_directory_ = "models";
	spdlog::level::level_enum log_level_ = spdlog::level::info;
	int default_horizon_ = 7;
	std::int64_t fallback_reorder_level_ = 50;
};

/**
 * @class ServiceConfigBuilder
 * @brief A builder for fluently configuring ServiceConfig instances.
 */
class ServiceConfigBuilder {
public:
	ServiceConfigBuilder &withModelDirectory(std::filesystem::path directory);
	ServiceConfigBuilder &withLogLevel(spdlog::level::level_enum level);
	/// Accepts spdlog level names such as "debug" or "warn".
	ServiceConfigBuilder &withLogLevel(const std::string &level);
	ServiceConfigBuilder &withDefaultHorizon(int horizon);
	ServiceConfigBuilder &withFallbackReorderLevel(std::int64_t level);

	/// @throws std::invalid_argument On an invalid horizon, reorder level or log level.
	ServiceConfig build();

private:
	ServiceConfig config_;
	std::string invalid_level_;
};

} // namespace stockcast::utils
