#include "stockcast/models/ridge_trainer.hpp"
#include "stockcast/utils/logging.hpp"

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace stockcast::models {

using features::FeatureVector;

HoldoutAccuracy HoldoutAccuracy::measure(const Eigen::VectorXd &actual, const Eigen::VectorXd &predicted) {
	if (actual.size() != predicted.size() || actual.size() == 0) {
		throw std::invalid_argument("Actual and predicted demand must be non-empty and equal length.");
	}

	const Eigen::ArrayXd error = predicted.array() - actual.array();
	HoldoutAccuracy accuracy;
	accuracy.n = static_cast<std::size_t>(actual.size());
	accuracy.mae = error.abs().mean();
	accuracy.rmse = std::sqrt(error.square().mean());
	accuracy.bias = error.mean();

	// Zero-demand days have no percentage error.
	const Eigen::Array<bool, Eigen::Dynamic, 1> demand = actual.array() > 0.0;
	const Eigen::Index demand_days = demand.count();
	if (demand_days > 0) {
		const Eigen::ArrayXd relative = demand.select(error.abs() / actual.array(), 0.0);
		accuracy.mape = 100.0 * relative.sum() / static_cast<double>(demand_days);
	}
	return accuracy;
}

// --- Trainer Implementation ---

RidgeTrainer::RidgeTrainer(double lambda, double holdout_fraction, std::size_t min_samples)
    : lambda_(lambda), holdout_fraction_(holdout_fraction), min_samples_(min_samples) {
	if (lambda_ < 0.0) {
		throw std::invalid_argument("Lambda must be non-negative for ridge regression.");
	}
	if (holdout_fraction_ < 0.0 || holdout_fraction_ >= 1.0) {
		throw std::invalid_argument("Holdout fraction must be in [0, 1).");
	}
}

std::unique_ptr<LinearPredictor> RidgeTrainer::fit(const std::vector<FeatureVector> &features,
                                                   const std::vector<double> &targets) const {
	if (features.size() != targets.size() || features.empty()) {
		throw std::invalid_argument("Features and targets must be non-empty and equal length.");
	}

	const auto n = static_cast<Eigen::Index>(features.size());
	const auto p = static_cast<Eigen::Index>(FeatureVector::kSize) + 1;

	// Column 0 is the intercept.
	Eigen::MatrixXd X(n, p);
	Eigen::VectorXd y(n);
	for (Eigen::Index i = 0; i < n; ++i) {
		const auto row = features[static_cast<std::size_t>(i)].toArray();
		X(i, 0) = 1.0;
		for (Eigen::Index j = 1; j < p; ++j) {
			X(i, j) = row[static_cast<std::size_t>(j - 1)];
		}
		y(i) = targets[static_cast<std::size_t>(i)];
	}

	// beta = (X'X + lambda*I)^-1 X'y, leaving the intercept unpenalised.
	Eigen::MatrixXd penalty = Eigen::MatrixXd::Identity(p, p);
	penalty(0, 0) = 0.0;
	const Eigen::MatrixXd XtX = X.transpose() * X + lambda_ * penalty;
	const Eigen::VectorXd Xty = X.transpose() * y;

	Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(XtX);
	if (qr.rank() < p) {
		STOCKCAST_DEBUG("Ridge normal equations are rank deficient (rank {} of {}).", qr.rank(), p);
	}
	const Eigen::VectorXd beta = qr.solve(Xty);

	return std::make_unique<LinearPredictor>(beta(0), beta.tail(p - 1));
}

std::unique_ptr<IPredictor> RidgeTrainer::train(const features::TrainingSet &data, TrainingReport *report) const {
	if (data.size() < min_samples_) {
		throw std::invalid_argument("Not enough training examples: " + std::to_string(data.size()) + " < " +
		                            std::to_string(min_samples_) + ".");
	}

	auto split = static_cast<std::size_t>(static_cast<double>(data.size()) * (1.0 - holdout_fraction_));
	split = std::max<std::size_t>(1, std::min(split, data.size()));

	const std::vector<FeatureVector> train_x(data.features.begin(), data.features.begin() + split);
	const std::vector<double> train_y(data.targets.begin(), data.targets.begin() + split);
	auto model = fit(train_x, train_y);

	if (report != nullptr) {
		report->train_samples = split;
		report->test_samples = data.size() - split;
		if (report->test_samples > 0) {
			const auto count = static_cast<Eigen::Index>(report->test_samples);
			Eigen::VectorXd actual(count);
			Eigen::VectorXd predicted(count);
			for (Eigen::Index i = 0; i < count; ++i) {
				const std::size_t row = split + static_cast<std::size_t>(i);
				actual(i) = data.targets[row];
				predicted(i) = model->predict(data.features[row]);
			}
			report->holdout = HoldoutAccuracy::measure(actual, predicted);
			STOCKCAST_INFO("Ridge model trained on {} samples; holdout MAE {:.2f}, RMSE {:.2f}.", split,
			               report->holdout.mae, report->holdout.rmse);
		}
	}
	return model;
}

// --- Builder Implementation ---

RidgeTrainerBuilder &RidgeTrainerBuilder::withLambda(double lambda) {
	lambda_ = lambda;
	return *this;
}

RidgeTrainerBuilder &RidgeTrainerBuilder::withHoldoutFraction(double fraction) {
	holdout_fraction_ = fraction;
	return *this;
}

RidgeTrainerBuilder &RidgeTrainerBuilder::withMinSamples(std::size_t min_samples) {
	min_samples_ = min_samples;
	return *this;
}

std::unique_ptr<RidgeTrainer> RidgeTrainerBuilder::build() {
	STOCKCAST_DEBUG("Building ridge trainer with lambda {}.", lambda_);
	return std::unique_ptr<RidgeTrainer>(new RidgeTrainer(lambda_, holdout_fraction_, min_samples_));
}

} // namespace stockcast::models
