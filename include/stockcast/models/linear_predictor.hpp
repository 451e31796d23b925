#pragma once

#include "stockcast/models/ipredictor.hpp"

#include <Eigen/Dense>

namespace stockcast::models {

/**
 * @class LinearPredictor
 * @brief Intercept plus one coefficient per canonical feature.
 */
class LinearPredictor final : public IPredictor {
public:
	/**
	 * @param intercept Constant term.
	 * @param coefficients One weight per feature in FeatureVector order.
	 * @throws std::invalid_argument If the coefficient count does not match
	 *         the feature count or any value is not finite.
	 */
	LinearPredictor(double intercept, Eigen::VectorXd coefficients);

	double predict(const features::FeatureVector &features) const override;
	std::string getName() const override {
		return "linear";
	}
	nlohmann::json toJson() const override;

	/// @throws std::invalid_argument On a malformed document.
	static LinearPredictor fromJson(const nlohmann::json &document);

	double intercept() const {
		return intercept_;
	}
	const Eigen::VectorXd &coefficients() const {
		return coefficients_;
	}

private:
	double intercept_;
	Eigen::VectorXd coefficients_;
};

} // namespace stockcast::models
