#pragma once

#include "stockcast/features/feature_vector.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace stockcast::models {

/**
 * @class IPredictor
 * @brief An interface for trained per-entity demand regressors.
 *
 * Predictors are immutable once constructed. The registry shares them
 * between concurrent requests and replaces them wholesale on reload, so
 * predict() must be safe to call from several threads at once.
 */
class IPredictor {
public:
	virtual ~IPredictor() = default;

	/**
	 * @brief Estimates the demand for the day described by @p features.
	 * @return The unclamped model output.
	 */
	virtual double predict(const features::FeatureVector &features) const = 0;

	/**
	 * @brief Gets the artifact type of the predictor (e.g., "linear").
	 */
	virtual std::string getName() const = 0;

	/**
	 * @brief Serialises the predictor into its artifact representation.
	 */
	virtual nlohmann::json toJson() const = 0;
};

} // namespace stockcast::models
