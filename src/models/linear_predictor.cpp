#include "stockcast/models/linear_predictor.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace stockcast::models {

using features::FeatureVector;

LinearPredictor::LinearPredictor(double intercept, Eigen::VectorXd coefficients)
    : intercept_(intercept), coefficients_(std::move(coefficients)) {
	if (coefficients_.size() != static_cast<Eigen::Index>(FeatureVector::kSize)) {
		throw std::invalid_argument("Linear predictor needs exactly " + std::to_string(FeatureVector::kSize) +
		                            " coefficients, got " + std::to_string(coefficients_.size()) + ".");
	}
	if (!std::isfinite(intercept_) || !coefficients_.allFinite()) {
		throw std::invalid_argument("Linear predictor parameters must be finite.");
	}
}

double LinearPredictor::predict(const FeatureVector &features) const {
	const auto values = features.toArray();
	const Eigen::Map<const Eigen::VectorXd> x(values.data(), static_cast<Eigen::Index>(values.size()));
	return intercept_ + coefficients_.dot(x);
}

nlohmann::json LinearPredictor::toJson() const {
	nlohmann::json coefficients = nlohmann::json::object();
	const auto &names = FeatureVector::names();
	for (std::size_t i = 0; i < names.size(); ++i) {
		coefficients[std::string(names[i])] = coefficients_[static_cast<Eigen::Index>(i)];
	}
	return {{"model_type", getName()}, {"intercept", intercept_}, {"coefficients", coefficients}};
}

LinearPredictor LinearPredictor::fromJson(const nlohmann::json &document) {
	if (!document.contains("intercept") || !document["intercept"].is_number()) {
		throw std::invalid_argument("Linear artifact requires a numeric 'intercept'.");
	}
	if (!document.contains("coefficients") || !document["coefficients"].is_object()) {
		throw std::invalid_argument("Linear artifact requires a 'coefficients' object.");
	}

	// Features without a coefficient contribute nothing.
	Eigen::VectorXd coefficients = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(FeatureVector::kSize));
	for (const auto &item : document["coefficients"].items()) {
		const auto index = FeatureVector::indexOf(item.key());
		if (!index) {
			throw std::invalid_argument("Unknown feature '" + item.key() + "' in linear artifact.");
		}
		if (!item.value().is_number()) {
			throw std::invalid_argument("Coefficient for '" + item.key() + "' must be numeric.");
		}
		coefficients[static_cast<Eigen::Index>(*index)] = item.value().get<double>();
	}
	return LinearPredictor(document["intercept"].get<double>(), std::move(coefficients));
}

} // namespace stockcast::models
