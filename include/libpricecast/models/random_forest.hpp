#pragma once

#include "libpricecast/core/forecast_options.hpp"
#include "libpricecast/models/i_regressor.hpp"
#include "libpricecast/models/xgboost_booster.hpp"

#include <string>

namespace libpricecast {
namespace models {

/**
 * Random forest on XGBoost
 *
 * One boosting round of n_estimators parallel trees with learning rate 1,
 * base score mean(y) and no leaf shrinkage, so each tree's leaf is the mean
 * target of its rows and the prediction is the average over trees. Trees
 * are grown on a subsample of the rows, seeded with params.seed.
 *
 * Feature importance: total split gain per feature, normalized to sum to 1.
 */
class RandomForestRegressor : public IRegressor {
public:
	explicit RandomForestRegressor(core::RandomForestParams params = core::RandomForestParams());

	std::string GetName() const override {
		return core::ModelKindName(core::ModelKind::RANDOM_FOREST);
	}

	void Fit(const Eigen::MatrixXd &X, const Eigen::VectorXd &y) override;

	Eigen::VectorXd Predict(const Eigen::MatrixXd &X) const override;

	bool IsFitted() const override {
		return booster_.IsTrained();
	}

	bool SupportsFeatureImportance() const override {
		return true;
	}

	Eigen::VectorXd FeatureImportances() const override;

	const core::RandomForestParams &params() const {
		return params_;
	}

private:
	core::RandomForestParams params_;
	XGBoostBooster booster_;
};

} // namespace models
} // namespace libpricecast
