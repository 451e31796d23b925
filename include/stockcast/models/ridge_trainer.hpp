#pragma once

#include "stockcast/features/training_set.hpp"
#include "stockcast/models/linear_predictor.hpp"

#include <Eigen/Dense>
#include <cstddef>
#include <limits>
#include <memory>
#include <optional>

namespace stockcast::models {

/**
 * @brief Error of a fitted model on the examples it did not see.
 *
 * Errors are taken as predicted minus actual, so a positive bias means the
 * model over-forecasts demand.
 */
struct HoldoutAccuracy {
	std::size_t n = 0;
	double mae = std::numeric_limits<double>::quiet_NaN();
	double rmse = std::numeric_limits<double>::quiet_NaN();
	/// Percentage error over days with demand; empty when no held-out day had any.
	std::optional<double> mape;
	double bias = 0.0;

	/// @throws std::invalid_argument If the vectors are empty or differ in length.
	static HoldoutAccuracy measure(const Eigen::VectorXd &actual, const Eigen::VectorXd &predicted);
};

/// Outcome of a training run: split sizes and holdout accuracy.
struct TrainingReport {
	std::size_t train_samples = 0;
	std::size_t test_samples = 0;
	HoldoutAccuracy holdout;
};

/**
 * @class ITrainer
 * @brief Produces an opaque predictor from a training set.
 */
class ITrainer {
public:
	virtual ~ITrainer() = default;

	/**
	 * @brief Fits a predictor.
	 * @param data Examples in chronological order.
	 * @param report Receives split sizes and holdout metrics when non-null.
	 */
	virtual std::unique_ptr<IPredictor> train(const features::TrainingSet &data,
	                                          TrainingReport *report = nullptr) const = 0;
};

class RidgeTrainerBuilder;

/**
 * @class RidgeTrainer
 * @brief L2-regularised least squares with an unpenalised intercept.
 *
 * The newest examples are held out (chronological split, no shuffling) and
 * the returned model is the one fitted on the older portion.
 */
class RidgeTrainer final : public ITrainer {
public:
	friend class RidgeTrainerBuilder;

	/// @throws std::invalid_argument If @p data has fewer than the minimum sample count.
	std::unique_ptr<IPredictor> train(const features::TrainingSet &data,
	                                  TrainingReport *report = nullptr) const override;

	/// Fits on every example without a holdout.
	std::unique_ptr<LinearPredictor> fit(const std::vector<features::FeatureVector> &features,
	                                     const std::vector<double> &targets) const;

private:
	RidgeTrainer(double lambda, double holdout_fraction, std::size_t min_samples);

	double lambda_;
	double holdout_fraction_;
	std::size_t min_samples_;
};

/**
 * @class RidgeTrainerBuilder
 * @brief A builder for fluently configuring RidgeTrainer instances.
 */
class RidgeTrainerBuilder {
public:
	RidgeTrainerBuilder &withLambda(double lambda);
	RidgeTrainerBuilder &withHoldoutFraction(double fraction);
	RidgeTrainerBuilder &withMinSamples(std::size_t min_samples);

	/// @throws std::invalid_argument On a negative lambda or a holdout fraction outside [0, 1).
	std::unique_ptr<RidgeTrainer> build();

private:
	double lambda_ = 1.0;
	double holdout_fraction_ = 0.2;
	std::size_t min_samples_ = 30;
};

} // namespace stockcast::models
